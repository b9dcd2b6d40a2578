// SPILLWAY - Position Ledger
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Per (pool, participant) stake records. A position's pending reward is
//
//     derived * rewardPerShare / PRECISION - rewardDebt
//
// and rewardDebt is re-anchored after every settlement.

#ifndef SPILLWAY_GAUGE_POSITIONS_H
#define SPILLWAY_GAUGE_POSITIONS_H

#include "spillway/core/types.h"

#include <map>
#include <utility>

namespace spillway {
namespace gauge {

/// Stake record of one participant in one pool
struct Position {
    Amount staked{0};
    Amount derived{0};      // Boost-adjusted stake, never above staked
    Uint128 rewardDebt{0};  // Entitlement already settled, in reward units

    bool IsEmpty() const { return staked == 0 && rewardDebt == 0; }
};

/// Entitlement of a position at an accumulator value
Uint128 AccruedReward(const Position& position, Uint128 rewardPerShare);

/// Unsettled reward of a position at an accumulator value (never negative)
Uint128 PendingReward(const Position& position, Uint128 rewardPerShare);

/// Set rewardDebt to the full entitlement at an accumulator value
void AnchorDebt(Position& position, Uint128 rewardPerShare);

class PositionLedger {
public:
    using Key = std::pair<PoolId, Address>;

    PositionLedger();
    ~PositionLedger();

    /// Copy of a position (zeroed if none exists)
    Position Get(PoolId pool, const Address& owner) const;

    /// Write back a position; empty positions are erased
    void Commit(PoolId pool, const Address& owner, const Position& position);

    size_t Size() const { return positions_.size(); }

private:
    std::map<Key, Position> positions_;
};

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_POSITIONS_H
