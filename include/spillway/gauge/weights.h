// SPILLWAY - Weight Allocator
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Governance-power-weighted votes deciding each pool's share of the global
// emission rate. A pool's weight is its reserved bootstrap weight plus every
// allocation voted to it; the total weight is the sum over all pools.

#ifndef SPILLWAY_GAUGE_WEIGHTS_H
#define SPILLWAY_GAUGE_WEIGHTS_H

#include "spillway/core/types.h"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace spillway {
namespace gauge {

/// Votes cast by one participant
struct VoteRecord {
    std::vector<PoolId> pools;                 // In vote order
    std::map<PoolId, Amount> allocations;
    Amount usedWeight{0};
};

class WeightAllocator {
public:
    using PoolPredicate = std::function<bool(PoolId)>;

    WeightAllocator();
    ~WeightAllocator();

    /// Start tracking a pool with its reserved weight; must not exceed Headroom()
    void AddPool(PoolId id, Amount reservedWeight);

    /// Remove weight that was reserved at registration
    void RemoveReserved(PoolId id, Amount reservedWeight);

    /**
     * Check a vote without changing anything.
     *
     * Rejects length mismatch, an empty list, unknown pools, negative
     * weights and a zero weight sum.
     */
    GaugeStatus ValidateVote(const std::vector<PoolId>& pools,
                             const std::vector<Amount>& weights,
                             const PoolPredicate& isKnownPool) const;

    /**
     * Replace a participant's votes.
     *
     * Resets prior votes, then gives pool i floor(weight_i * power / sum)
     * with the flooring remainder going to the last pool with a nonzero
     * weight. Repeated pool ids are merged. The vote must already have
     * passed ValidateVote(). Power is clamped to VoteHeadroom(voter).
     */
    void Vote(const Address& voter, const std::vector<PoolId>& pools,
              const std::vector<Amount>& weights, Amount power);

    /// Undo every allocation of a participant; idempotent
    void Reset(const Address& voter);

    /// Per-pool emission rates for a total rate, or nullopt when total weight is zero
    std::optional<std::map<PoolId, Amount>> DeriveRates(Amount totalRate) const;

    Amount GetPoolWeight(PoolId id) const;
    Amount GetTotalWeight() const { return totalWeight_; }

    /// Weight that can still be added before the total reaches MAX_AMOUNT
    Amount Headroom() const { return MAX_AMOUNT - totalWeight_; }

    /// Largest power a new vote by this voter can allocate
    Amount VoteHeadroom(const Address& voter) const;

    Amount GetAllocation(const Address& voter, PoolId id) const;
    std::vector<PoolId> GetVotedPools(const Address& voter) const;
    Amount GetUsedWeight(const Address& voter) const;

private:
    std::map<PoolId, Amount> poolWeights_;
    std::map<Address, VoteRecord> votes_;
    Amount totalWeight_{0};
};

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_WEIGHTS_H
