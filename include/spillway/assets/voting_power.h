// SPILLWAY - Governance Voting Power
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Read-only view of time-locked governance power. Accrual and decay of that
// power belong to the source; the controller only queries it fresh.

#ifndef SPILLWAY_ASSETS_VOTING_POWER_H
#define SPILLWAY_ASSETS_VOTING_POWER_H

#include "spillway/core/types.h"

#include <map>
#include <mutex>

namespace spillway {

// ============================================================================
// Voting Power Source Interface
// ============================================================================

class IVotingPowerSource {
public:
    virtual ~IVotingPowerSource() = default;

    /// Current governance power of an account
    virtual Amount PowerOf(const Address& holder) const = 0;

    /// Current total governance power
    virtual Amount TotalPower() const = 0;
};

// ============================================================================
// Voting Power Tracker
// ============================================================================

/**
 * Tracks voting power per holder, with a running total that saturates at
 * MAX_AMOUNT.
 */
class VotingPowerTracker : public IVotingPowerSource {
public:
    VotingPowerTracker();
    ~VotingPowerTracker() override;

    Amount PowerOf(const Address& holder) const override;
    Amount TotalPower() const override;

    /// Set voting power for a holder (zero or negative removes the holder,
    /// values above MAX_AMOUNT are clamped)
    void SetPower(const Address& holder, Amount power);

    /// Get number of holders with non-zero power
    size_t GetHolderCount() const;

    /// Remove holder (e.g., lock expired)
    void RemoveHolder(const Address& holder);

    /// Clear all voting power
    void Clear();

private:
    mutable std::mutex mutex_;
    std::map<Address, Amount> power_;
    Uint128 totalPower_{0};
};

} // namespace spillway

#endif // SPILLWAY_ASSETS_VOTING_POWER_H
