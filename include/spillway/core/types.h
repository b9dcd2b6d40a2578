// SPILLWAY - Core Types Header
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// This file defines fundamental types used throughout SPILLWAY.

#ifndef SPILLWAY_CORE_TYPES_H
#define SPILLWAY_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace spillway {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units of an asset
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Unsigned 128-bit integer for fixed-point intermediates
using Uint128 = __uint128_t;

/// Identity of a fungible asset (ledger symbol, e.g. "LP-ETH")
using AssetId = std::string;

/// Stable index of a pool in the registry
using PoolId = uint32_t;

/// Fixed-point scale of the reward-per-share accumulator
constexpr Amount PRECISION = 1000000000000LL;  // 1e12

/// One year in seconds (default emission window)
constexpr int64_t SECONDS_PER_YEAR = 365LL * 24 * 60 * 60;

/// Basis points denominator
constexpr int64_t BPS_DENOMINATOR = 10000;

/// Upper bound on any single amount handled by the engine
constexpr Amount MAX_AMOUNT = 4000000000000000000LL;

/// Check if amount is in valid range
inline bool AmountRange(Amount value) {
    return value >= 0 && value <= MAX_AMOUNT;
}

/// Render a 128-bit unsigned value in decimal
std::string Uint128ToString(Uint128 value);

/// floor(a * b / denominator) with a 256-bit intermediate product.
/// Saturates at the maximum Uint128 when the quotient does not fit.
/// Returns 0 when denominator is 0.
Uint128 MulDiv(Uint128 a, Uint128 b, Uint128 denominator);

/// Narrow a 128-bit value to an Amount, saturating at MAX_AMOUNT
inline Amount ToAmount(Uint128 value) {
    return value > static_cast<Uint128>(MAX_AMOUNT) ? MAX_AMOUNT
                                                    : static_cast<Amount>(value);
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Comparison operators
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        // Compare in reverse order (most significant byte last in storage)
        for (int i = SIZE - 1; i >= 0; --i) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }

    /// Convert to hex string (displayed in reverse byte order)
    std::string ToHex() const;

    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 160-bit identifier (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// Account address of a participant, vault or administrator
using Address = Hash160;

/// Derive a deterministic address from a short label (test and tooling helper)
Address AddressFromLabel(const std::string& label);

/// Short printable form of an address for log lines
std::string ShortAddress(const Address& addr);

// ============================================================================
// Operation Status
// ============================================================================

/// Outcome of a controller operation
enum class GaugeStatus {
    OK = 0,

    // Invariant violations
    INSUFFICIENT_STAKE,
    LENGTH_MISMATCH,
    ZERO_WEIGHT_SUM,
    EMPTY_VOTE,
    POOL_EXISTS,
    UNKNOWN_POOL,
    INVALID_AMOUNT,
    INVALID_ASSET,
    EMISSIONS_ALREADY_STARTED,
    RESERVED_WEIGHT_RELEASED,
    UNAUTHORIZED,

    // Resource failures
    TRANSFER_FAILED,
};

/// Convert status to string
const char* GaugeStatusToString(GaugeStatus status);

} // namespace spillway

#endif // SPILLWAY_CORE_TYPES_H
