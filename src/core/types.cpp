// SPILLWAY - Core Types Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/core/types.h"

namespace spillway {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    // Display in reverse byte order
    std::string result;
    result.reserve(SIZE * 2);

    static const char hexChars[] = "0123456789abcdef";

    for (int i = SIZE - 1; i >= 0; --i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }

    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    BaseHash result;

    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    for (size_t i = 0; i < SIZE; ++i) {
        size_t hexIdx = (SIZE - 1 - i) * 2;
        Byte high = hexCharToNibble(hex[hexIdx]);
        Byte low = hexCharToNibble(hex[hexIdx + 1]);
        result.data_[i] = (high << 4) | low;
    }

    return result;
}

template class BaseHash<160>;

// ============================================================================
// Address Helpers
// ============================================================================

Address AddressFromLabel(const std::string& label) {
    // FNV-1a spread over the 20 bytes; labels longer than 20 bytes still
    // produce distinct addresses.
    std::array<Byte, Address::SIZE> bytes{};
    uint64_t h = 1469598103934665603ULL;
    for (size_t i = 0; i < Address::SIZE; ++i) {
        for (char c : label) {
            h ^= static_cast<Byte>(c);
            h *= 1099511628211ULL;
        }
        h ^= i;
        h *= 1099511628211ULL;
        bytes[i] = static_cast<Byte>(h >> 56);
    }
    return Address(bytes);
}

std::string ShortAddress(const Address& addr) {
    return addr.ToHex().substr(0, 12) + "...";
}

std::string Uint128ToString(Uint128 value) {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

Uint128 MulDiv(Uint128 a, Uint128 b, Uint128 denominator) {
    if (denominator == 0) {
        return 0;
    }

    constexpr Uint128 MASK64 = (static_cast<Uint128>(1) << 64) - 1;
    constexpr Uint128 UINT128_MAX_VALUE = ~static_cast<Uint128>(0);

    // Fast path: the product fits in 128 bits
    if (a == 0 || b <= UINT128_MAX_VALUE / a) {
        return a * b / denominator;
    }

    // Schoolbook 128x128 -> 256 multiply in 64-bit limbs
    Uint128 aLo = a & MASK64, aHi = a >> 64;
    Uint128 bLo = b & MASK64, bHi = b >> 64;

    Uint128 ll = aLo * bLo;
    Uint128 lh = aLo * bHi;
    Uint128 hl = aHi * bLo;
    Uint128 hh = aHi * bHi;

    Uint128 mid = (ll >> 64) + (lh & MASK64) + (hl & MASK64);
    Uint128 lo = (ll & MASK64) | (mid << 64);
    Uint128 hi = hh + (lh >> 64) + (hl >> 64) + (mid >> 64);

    if (hi >= denominator) {
        return UINT128_MAX_VALUE;
    }

    // Restoring division of (hi:lo) by denominator, one bit at a time
    Uint128 quotient = 0;
    Uint128 remainder = hi;
    for (int i = 127; i >= 0; --i) {
        bool carry = (remainder >> 127) != 0;
        remainder = (remainder << 1) | ((lo >> i) & 1);
        if (carry || remainder >= denominator) {
            remainder -= denominator;
            quotient |= static_cast<Uint128>(1) << i;
        }
    }
    return quotient;
}

// ============================================================================
// GaugeStatus Implementation
// ============================================================================

const char* GaugeStatusToString(GaugeStatus status) {
    switch (status) {
        case GaugeStatus::OK: return "OK";

        case GaugeStatus::INSUFFICIENT_STAKE: return "Insufficient stake";
        case GaugeStatus::LENGTH_MISMATCH: return "Pool and weight lists differ in length";
        case GaugeStatus::ZERO_WEIGHT_SUM: return "Vote weights sum to zero";
        case GaugeStatus::EMPTY_VOTE: return "Empty vote";
        case GaugeStatus::POOL_EXISTS: return "Pool already registered";
        case GaugeStatus::UNKNOWN_POOL: return "Unknown pool";
        case GaugeStatus::INVALID_AMOUNT: return "Invalid amount";
        case GaugeStatus::INVALID_ASSET: return "Invalid staked asset";
        case GaugeStatus::EMISSIONS_ALREADY_STARTED: return "Emissions already started";
        case GaugeStatus::RESERVED_WEIGHT_RELEASED: return "Reserved weight already released";
        case GaugeStatus::UNAUTHORIZED: return "Unauthorized caller";

        case GaugeStatus::TRANSFER_FAILED: return "Asset transfer failed";

        default: return "Unknown status";
    }
}

} // namespace spillway
