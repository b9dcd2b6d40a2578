// SPILLWAY - Asset Ledger and Voting Power Tests
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include <gtest/gtest.h>

#include "spillway/assets/ledger.h"
#include "spillway/assets/share_wrapper.h"
#include "spillway/assets/voting_power.h"

namespace spillway {
namespace {

// ============================================================================
// Ledger Tests
// ============================================================================

class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = AddressFromLabel("alice");
        bob_ = AddressFromLabel("bob");
        ASSERT_TRUE(ledger_.Mint("LP", alice_, 1000));
    }

    InMemoryAssetLedger ledger_;
    Address alice_;
    Address bob_;
};

TEST_F(LedgerTest, MintTracksSupply) {
    EXPECT_EQ(ledger_.BalanceOf("LP", alice_), 1000);
    EXPECT_EQ(ledger_.TotalSupply("LP"), 1000);
    EXPECT_EQ(ledger_.TotalSupply("OTHER"), 0);
    EXPECT_FALSE(ledger_.Mint("LP", alice_, 0));
    EXPECT_FALSE(ledger_.Mint("LP", alice_, MAX_AMOUNT));
}

TEST_F(LedgerTest, TransferMovesBalance) {
    EXPECT_TRUE(ledger_.Transfer("LP", alice_, bob_, 300));
    EXPECT_EQ(ledger_.BalanceOf("LP", alice_), 700);
    EXPECT_EQ(ledger_.BalanceOf("LP", bob_), 300);
    EXPECT_EQ(ledger_.TotalSupply("LP"), 1000);
    EXPECT_EQ(ledger_.GetTransferCount(), 1u);
}

TEST_F(LedgerTest, ShortTransferFailsWithoutEffect) {
    EXPECT_FALSE(ledger_.Transfer("LP", alice_, bob_, 1001));
    EXPECT_FALSE(ledger_.Transfer("LP", alice_, bob_, -5));
    EXPECT_EQ(ledger_.BalanceOf("LP", alice_), 1000);
    EXPECT_EQ(ledger_.BalanceOf("LP", bob_), 0);
}

TEST_F(LedgerTest, ZeroTransferIsNoop) {
    EXPECT_TRUE(ledger_.Transfer("LP", bob_, alice_, 0));
    EXPECT_EQ(ledger_.GetTransferCount(), 0u);
}

TEST_F(LedgerTest, SelfTransferNeedsBalance) {
    EXPECT_FALSE(ledger_.Transfer("LP", bob_, bob_, 10));
    EXPECT_FALSE(ledger_.Transfer("LP", alice_, alice_, 1001));
    EXPECT_TRUE(ledger_.Transfer("LP", alice_, alice_, 1000));

    EXPECT_EQ(ledger_.BalanceOf("LP", alice_), 1000);
    EXPECT_EQ(ledger_.BalanceOf("LP", bob_), 0);
    EXPECT_EQ(ledger_.GetTransferCount(), 0u);
}

TEST_F(LedgerTest, FilterRejectsTransfer) {
    ledger_.SetTransferFilter([&](const TransferRecord& record) {
        return record.to != bob_;
    });
    EXPECT_FALSE(ledger_.Transfer("LP", alice_, bob_, 10));
    EXPECT_EQ(ledger_.BalanceOf("LP", bob_), 0);

    ledger_.SetTransferFilter(nullptr);
    EXPECT_TRUE(ledger_.Transfer("LP", alice_, bob_, 10));
}

TEST_F(LedgerTest, RollbackUndoesBatch) {
    ledger_.BeginBatch();
    EXPECT_TRUE(ledger_.InBatch());
    EXPECT_TRUE(ledger_.Transfer("LP", alice_, bob_, 100));
    EXPECT_TRUE(ledger_.Mint("REWARD", bob_, 50));
    EXPECT_TRUE(ledger_.Burn("LP", bob_, 40));
    EXPECT_EQ(ledger_.JournalSize(), 3u);
    ledger_.RollbackBatch();

    EXPECT_FALSE(ledger_.InBatch());
    EXPECT_EQ(ledger_.BalanceOf("LP", alice_), 1000);
    EXPECT_EQ(ledger_.BalanceOf("LP", bob_), 0);
    EXPECT_EQ(ledger_.BalanceOf("REWARD", bob_), 0);
    EXPECT_EQ(ledger_.TotalSupply("REWARD"), 0);
    EXPECT_EQ(ledger_.TotalSupply("LP"), 1000);
    EXPECT_EQ(ledger_.GetTransferCount(), 0u);
}

TEST_F(LedgerTest, CommitKeepsBatch) {
    ledger_.BeginBatch();
    EXPECT_TRUE(ledger_.Transfer("LP", alice_, bob_, 100));
    ledger_.CommitBatch();
    ledger_.RollbackBatch();  // Nothing journaled any more

    EXPECT_EQ(ledger_.BalanceOf("LP", bob_), 100);
    EXPECT_EQ(ledger_.JournalSize(), 0u);
}

TEST_F(LedgerTest, TransfersOutsideBatchAreNotJournaled) {
    EXPECT_TRUE(ledger_.Transfer("LP", alice_, bob_, 100));
    ledger_.RollbackBatch();
    EXPECT_EQ(ledger_.BalanceOf("LP", bob_), 100);
}

// ============================================================================
// Voting Power Tests
// ============================================================================

TEST(VotingPowerTrackerTest, TracksTotal) {
    VotingPowerTracker tracker;
    Address a = AddressFromLabel("a");
    Address b = AddressFromLabel("b");

    tracker.SetPower(a, 100);
    tracker.SetPower(b, 50);
    EXPECT_EQ(tracker.PowerOf(a), 100);
    EXPECT_EQ(tracker.TotalPower(), 150);
    EXPECT_EQ(tracker.GetHolderCount(), 2u);

    tracker.SetPower(a, 30);
    EXPECT_EQ(tracker.TotalPower(), 80);

    tracker.RemoveHolder(b);
    EXPECT_EQ(tracker.PowerOf(b), 0);
    EXPECT_EQ(tracker.TotalPower(), 30);
    EXPECT_EQ(tracker.GetHolderCount(), 1u);

    tracker.SetPower(a, -10);
    EXPECT_EQ(tracker.TotalPower(), 0);

    tracker.SetPower(b, 5);
    tracker.Clear();
    EXPECT_EQ(tracker.TotalPower(), 0);
}

TEST(VotingPowerTrackerTest, ClampsAndSaturates) {
    VotingPowerTracker tracker;
    Address a = AddressFromLabel("a");
    Address b = AddressFromLabel("b");
    Address c = AddressFromLabel("c");

    tracker.SetPower(a, MAX_AMOUNT * 2);
    EXPECT_EQ(tracker.PowerOf(a), MAX_AMOUNT);

    tracker.SetPower(b, MAX_AMOUNT);
    tracker.SetPower(c, MAX_AMOUNT);
    EXPECT_EQ(tracker.TotalPower(), MAX_AMOUNT);

    tracker.RemoveHolder(b);
    tracker.RemoveHolder(c);
    EXPECT_EQ(tracker.TotalPower(), MAX_AMOUNT);

    tracker.SetPower(a, 7);
    EXPECT_EQ(tracker.TotalPower(), 7);
}

// ============================================================================
// Share Wrapper Tests
// ============================================================================

class ShareWrapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = AddressFromLabel("alice");
        bob_ = AddressFromLabel("bob");
        vault_ = AddressFromLabel("wrapper-vault");
        ASSERT_TRUE(ledger_.Mint("STK", alice_, 1000));
        ASSERT_TRUE(ledger_.Mint("STK", bob_, 1000));
    }

    InMemoryAssetLedger ledger_;
    Address alice_;
    Address bob_;
    Address vault_;
};

TEST_F(ShareWrapperTest, FirstDepositMintsOneToOne) {
    ShareWrapper wrapper(ledger_, "STK", "xSTK", vault_);
    auto shares = wrapper.Enter(alice_, 100);
    ASSERT_TRUE(shares.has_value());
    EXPECT_EQ(*shares, 100);
    EXPECT_EQ(ledger_.BalanceOf("xSTK", alice_), 100);
    EXPECT_EQ(ledger_.BalanceOf("STK", vault_), 100);
}

TEST_F(ShareWrapperTest, RebaseChangesShareValue) {
    ShareWrapper wrapper(ledger_, "STK", "xSTK", vault_);
    ASSERT_TRUE(wrapper.Enter(alice_, 100).has_value());

    // Vault balance doubles without new shares
    ASSERT_TRUE(ledger_.Mint("STK", vault_, 100));
    EXPECT_EQ(wrapper.UnderlyingForShares(100), 200);

    auto bobShares = wrapper.Enter(bob_, 100);
    ASSERT_TRUE(bobShares.has_value());
    EXPECT_EQ(*bobShares, 50);

    auto out = wrapper.Leave(alice_, 100);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, 200);
    EXPECT_EQ(ledger_.BalanceOf("STK", alice_), 1100);
    EXPECT_EQ(ledger_.TotalSupply("xSTK"), 50);
}

TEST_F(ShareWrapperTest, RejectsBadAmounts) {
    ShareWrapper wrapper(ledger_, "STK", "xSTK", vault_);
    EXPECT_FALSE(wrapper.Enter(alice_, 0).has_value());
    EXPECT_FALSE(wrapper.Enter(alice_, 5000).has_value());
    EXPECT_FALSE(wrapper.Leave(alice_, 1).has_value());
    EXPECT_EQ(ledger_.TotalSupply("xSTK"), 0);
    EXPECT_EQ(ledger_.BalanceOf("STK", alice_), 1000);
}

} // namespace
} // namespace spillway
