// SPILLWAY - Reward Accumulator
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Per-pool reward-per-share accumulator. Every pool streams emissionRate
// reward units per second; a refresh spreads the units emitted since the
// last refresh over the pool's staked balance:
//
//     rewardPerShare += rate * elapsed * PRECISION / stakedBalance
//
// so that a position's entitlement is derived * rewardPerShare / PRECISION
// without visiting other positions.
//
// Pool records can only be read through Snapshot(), which returns a copy
// already brought current to the requested time.

#ifndef SPILLWAY_GAUGE_ACCUMULATOR_H
#define SPILLWAY_GAUGE_ACCUMULATOR_H

#include "spillway/core/types.h"

#include <functional>
#include <optional>
#include <vector>

namespace spillway {
namespace gauge {

/// Mutable accounting state of a pool
struct PoolState {
    Timestamp lastDistributionTime{0};
    Amount emissionRate{0};
    Uint128 rewardPerShare{0};   // Scaled by PRECISION
    Amount allocatedRewards{0};  // Units emitted to this pool so far
    Amount paidRewards{0};       // Units transferred to stakers so far
};

class AccumulatorEngine {
public:
    /// Returns the total staked balance backing a pool
    using BalanceQuery = std::function<Amount(PoolId)>;

    explicit AccumulatorEngine(BalanceQuery stakedBalance);
    ~AccumulatorEngine();

    /// Track a new pool starting at the given time
    void AddPool(PoolId id, Timestamp now);

    /// Refreshed copy of a pool's state; nullopt for unknown pools
    std::optional<PoolState> Snapshot(PoolId id, Timestamp now) const;

    /// Write back a snapshot taken from this engine
    void Commit(PoolId id, const PoolState& state);

    /// Refresh every pool whose clock is behind now
    void RefreshAll(Timestamp now);

    /// Set a pool's rate without refreshing it
    void SetEmissionRate(PoolId id, Amount rate);

    /// Stop accruing at this time (0 = no end)
    void SetEmissionEnd(Timestamp end) { emissionEnd_ = end; }
    Timestamp GetEmissionEnd() const { return emissionEnd_; }

    size_t PoolCount() const { return pools_.size(); }

    /**
     * Bring a state current.
     *
     * Accrues rate * elapsed into allocatedRewards. With a zero staked
     * balance the accumulator stays put but the clock still moves, so the
     * interval's emission is dropped. Time past emissionEnd never accrues.
     */
    static void Refresh(PoolState& state, Amount stakedBalance,
                        Timestamp now, Timestamp emissionEnd);

private:
    BalanceQuery stakedBalance_;
    std::vector<PoolState> pools_;
    Timestamp emissionEnd_{0};
};

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_ACCUMULATOR_H
