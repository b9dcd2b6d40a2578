// SPILLWAY - Gauge Controller
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Owns the pool registry, the reward accumulator, the position ledger and
// the weight allocator, and exposes every participant and administrative
// operation.
//
// Key properties:
// - One mutex serializes every public operation
// - Every operation refreshes a pool before reading or settling against it
// - Pool and position snapshots are committed only after all asset
//   transfers of the operation have succeeded; otherwise the ledger batch
//   is rolled back and nothing changes
// - Events are delivered after commit, outside the lock

#ifndef SPILLWAY_GAUGE_CONTROLLER_H
#define SPILLWAY_GAUGE_CONTROLLER_H

#include "spillway/assets/ledger.h"
#include "spillway/assets/voting_power.h"
#include "spillway/core/types.h"
#include "spillway/gauge/accumulator.h"
#include "spillway/gauge/boost.h"
#include "spillway/gauge/events.h"
#include "spillway/gauge/params.h"
#include "spillway/gauge/positions.h"
#include "spillway/gauge/registry.h"
#include "spillway/gauge/weights.h"

#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace spillway {
namespace gauge {

/// Refreshed read-only view of a pool
struct PoolView {
    PoolInfo info;
    PoolState state;
    Amount weight{0};
    Amount totalStaked{0};
};

class GaugeController {
public:
    /**
     * @param ledger Ledger holding the reward and staked assets
     * @param power Governance power source
     * @param admin Only address allowed to run administrative operations
     * @param vault Account holding staked assets and undistributed rewards
     * @param rewardAsset Asset emitted to stakers
     * @param params Tunables
     */
    GaugeController(IAssetLedger& ledger, const IVotingPowerSource& power,
                    const Address& admin, const Address& vault,
                    AssetId rewardAsset, const ControllerParams& params = {});
    ~GaugeController();

    GaugeController(const GaugeController&) = delete;
    GaugeController& operator=(const GaugeController&) = delete;

    // === Participant Operations ===

    /// Stake amount of the pool's asset, paying out pending rewards first
    GaugeStatus Deposit(const Address& participant, PoolId pool, Amount amount);

    /// Unstake amount, paying out pending rewards first
    GaugeStatus Withdraw(const Address& participant, PoolId pool, Amount amount);

    /// Pay out pending rewards and refresh the boost
    GaugeStatus Claim(const Address& participant, PoolId pool);

    /// Claim several pools as one all-or-nothing operation
    GaugeStatus ClaimMany(const Address& participant, const std::vector<PoolId>& pools);

    /// Replace the participant's votes with a new weighting
    GaugeStatus Vote(const Address& participant, const std::vector<PoolId>& pools,
                     const std::vector<Amount>& weights);

    /// Withdraw every vote of the participant
    GaugeStatus ResetVotes(const Address& participant);

    /// Refresh every pool and convert weights into emission rates
    GaugeStatus Rebalance();

    /// Refresh every pool
    GaugeStatus RefreshAll();

    // === Administrative Operations ===

    /// Register a pool for a staked asset with a reserved bootstrap weight
    GaugeStatus RegisterPool(const Address& caller, const AssetId& stakedAsset,
                             Amount reservedWeight, bool refreshFirst,
                             PoolId* poolId = nullptr);

    /// Remove a pool's reserved bootstrap weight
    GaugeStatus ReleaseReservedWeight(const Address& caller, PoolId pool, bool refreshFirst);

    /// Pull the emission supply from the caller and start the emission window
    GaugeStatus StartEmissions(const Address& caller, Amount totalSupply);

    // === Queries ===

    std::optional<PoolView> GetPool(PoolId pool) const;
    std::optional<Position> GetPosition(PoolId pool, const Address& participant) const;

    /// Reward the participant would receive by claiming now
    Amount PendingReward(PoolId pool, const Address& participant) const;

    Amount GetPoolWeight(PoolId pool) const;
    Amount GetTotalWeight() const;
    Amount GetVoteAllocation(const Address& participant, PoolId pool) const;
    std::vector<PoolId> GetVotedPools(const Address& participant) const;
    Amount GetUsedWeight(const Address& participant) const;
    size_t PoolCount() const;
    Amount GetTotalEmissionRate() const;
    bool EmissionsStarted() const;
    Timestamp GetEmissionStart() const;
    Timestamp GetEmissionEnd() const;

    const Address& GetAdmin() const { return admin_; }
    const Address& GetVault() const { return vault_; }
    const AssetId& GetRewardAsset() const { return rewardAsset_; }
    const ControllerParams& GetParams() const { return params_; }

    /// Register the receiver of post-commit notifications
    void SetEventCallback(EventCallback callback);

private:
    /// Snapshots staged by one operation
    struct Staging {
        std::map<PoolId, PoolState> pools;
        std::map<PositionLedger::Key, Position> positions;
    };

    /// Staked balance backing a pool
    Amount StakedBalance(PoolId pool) const;

    /// Refresh, pay pending, move stake by stakeDelta and re-anchor, all on
    /// staged copies; transfers go to the open ledger batch
    GaugeStatus SettleLocked(PoolId pool, const Address& participant, Amount stakeDelta,
                             Timestamp now, Staging& staging,
                             std::vector<GaugeEvent>& events);

    /// Run SettleLocked for each pool inside one ledger batch and commit
    GaugeStatus ExecuteLocked(const Address& participant,
                              const std::vector<std::pair<PoolId, Amount>>& steps,
                              std::vector<GaugeEvent>& events);

    /// Re-derive every pool's emission rate from current weights
    void ApplyRatesLocked();

    /// Log a rejection and pass the status through
    GaugeStatus Reject(GaugeStatus status, const char* operation) const;

    void Dispatch(const std::vector<GaugeEvent>& events) const;

    IAssetLedger& ledger_;
    const IVotingPowerSource& power_;
    Address admin_;
    Address vault_;
    AssetId rewardAsset_;
    ControllerParams params_;

    PoolRegistry registry_;
    AccumulatorEngine accumulator_;
    BoostCalculator boost_;
    PositionLedger positions_;
    WeightAllocator weights_;

    Amount totalEmissionRate_{0};
    bool emissionsStarted_{false};
    Timestamp emissionStart_{0};

    EventCallback eventCallback_;

    mutable std::mutex mutex_;
};

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_CONTROLLER_H
