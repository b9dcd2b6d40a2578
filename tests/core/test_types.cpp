// SPILLWAY - Core Types Tests
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include <gtest/gtest.h>
#include "spillway/core/types.h"

#include <set>
#include <stdexcept>

using namespace spillway;

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.size(), 20u);
}

TEST(AddressTest, HexRoundTrip) {
    Address addr = AddressFromLabel("alice");
    std::string hex = addr.ToHex();
    EXPECT_EQ(hex.size(), 40u);
    EXPECT_EQ(Address::FromHex(hex), addr);
}

TEST(AddressTest, FromHexRejectsBadInput) {
    EXPECT_THROW(Address::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(40, 'z')), std::invalid_argument);
}

TEST(AddressTest, LabelsAreDeterministicAndDistinct) {
    EXPECT_EQ(AddressFromLabel("vault"), AddressFromLabel("vault"));

    std::set<Address> seen;
    for (const char* label : {"admin", "vault", "alice", "bob", "carol", "dave"}) {
        Address addr = AddressFromLabel(label);
        EXPECT_FALSE(addr.IsNull());
        EXPECT_TRUE(seen.insert(addr).second) << label;
    }
}

TEST(AddressTest, ShortAddress) {
    Address addr = AddressFromLabel("alice");
    std::string text = ShortAddress(addr);
    EXPECT_EQ(text.size(), 15u);
    EXPECT_EQ(text.substr(0, 12), addr.ToHex().substr(0, 12));
}

// ============================================================================
// Arithmetic Tests
// ============================================================================

TEST(ArithmeticTest, AmountRange) {
    EXPECT_TRUE(AmountRange(0));
    EXPECT_TRUE(AmountRange(MAX_AMOUNT));
    EXPECT_FALSE(AmountRange(-1));
    EXPECT_FALSE(AmountRange(MAX_AMOUNT + 1));
}

TEST(ArithmeticTest, Uint128ToString) {
    EXPECT_EQ(Uint128ToString(0), "0");
    EXPECT_EQ(Uint128ToString(1000000000000ULL), "1000000000000");

    Uint128 big = static_cast<Uint128>(1) << 100;
    EXPECT_EQ(Uint128ToString(big), "1267650600228229401496703205376");
}

TEST(ArithmeticTest, MulDivSmall) {
    EXPECT_EQ(MulDiv(10, 20, 4), static_cast<Uint128>(50));
    EXPECT_EQ(MulDiv(7, 3, 2), static_cast<Uint128>(10));
    EXPECT_EQ(MulDiv(7, 3, 0), static_cast<Uint128>(0));
    EXPECT_EQ(MulDiv(0, 3, 5), static_cast<Uint128>(0));
}

TEST(ArithmeticTest, MulDivWideIntermediate) {
    // (2^100 * 2^100) / 2^120 = 2^80; the product needs 200 bits
    Uint128 a = static_cast<Uint128>(1) << 100;
    Uint128 d = static_cast<Uint128>(1) << 120;
    EXPECT_EQ(MulDiv(a, a, d), static_cast<Uint128>(1) << 80);

    // (x * y) / y == x for a product above 128 bits
    Uint128 x = (static_cast<Uint128>(1) << 90) + 12345;
    Uint128 y = (static_cast<Uint128>(1) << 60) + 999;
    EXPECT_EQ(MulDiv(x, y, y), x);
}

TEST(ArithmeticTest, MulDivSaturates) {
    Uint128 max = ~static_cast<Uint128>(0);
    EXPECT_EQ(MulDiv(max, max, 1), max);
}

TEST(ArithmeticTest, ToAmountSaturates) {
    EXPECT_EQ(ToAmount(42), 42);
    EXPECT_EQ(ToAmount(static_cast<Uint128>(MAX_AMOUNT) + 1), MAX_AMOUNT);
}

// ============================================================================
// Status Tests
// ============================================================================

TEST(GaugeStatusTest, ToString) {
    EXPECT_STREQ(GaugeStatusToString(GaugeStatus::OK), "OK");
    EXPECT_STREQ(GaugeStatusToString(GaugeStatus::INSUFFICIENT_STAKE), "Insufficient stake");
    EXPECT_STREQ(GaugeStatusToString(GaugeStatus::ZERO_WEIGHT_SUM), "Vote weights sum to zero");
    EXPECT_STREQ(GaugeStatusToString(GaugeStatus::UNAUTHORIZED), "Unauthorized caller");
    EXPECT_STREQ(GaugeStatusToString(GaugeStatus::TRANSFER_FAILED), "Asset transfer failed");
}
