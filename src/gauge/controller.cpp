// SPILLWAY - Gauge Controller Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/controller.h"
#include "spillway/util/logging.h"
#include "spillway/util/time.h"

#include <algorithm>

namespace spillway {
namespace gauge {

// ============================================================================
// Construction
// ============================================================================

namespace {

ControllerParams CheckedParams(const ControllerParams& params) {
    if (params.IsValid()) {
        return params;
    }
    LOG_WARN(util::LogCategory::CONFIG) << "Invalid controller parameters; using defaults";
    ControllerParams defaults;
    defaults.logLevel = params.logLevel;
    return defaults;
}

} // namespace

GaugeController::GaugeController(IAssetLedger& ledger, const IVotingPowerSource& power,
                                 const Address& admin, const Address& vault,
                                 AssetId rewardAsset, const ControllerParams& params)
    : ledger_(ledger)
    , power_(power)
    , admin_(admin)
    , vault_(vault)
    , rewardAsset_(std::move(rewardAsset))
    , params_(CheckedParams(params))
    , accumulator_([this](PoolId id) { return StakedBalance(id); })
    , boost_(params_.boost) {
    if (params_.logLevel) {
        SPILLWAY_LOGGER.SetLevel(*params_.logLevel);
    }
    LOG_DEBUG(util::LogCategory::GAUGE) << "Gauge controller for " << rewardAsset_
                                        << " with vault " << ShortAddress(vault_);
}

GaugeController::~GaugeController() = default;

// ============================================================================
// Internals
// ============================================================================

Amount GaugeController::StakedBalance(PoolId pool) const {
    const PoolInfo* info = registry_.Get(pool);
    if (!info) {
        return 0;
    }
    return ledger_.BalanceOf(info->stakedAsset, vault_);
}

GaugeStatus GaugeController::Reject(GaugeStatus status, const char* operation) const {
    LOG_WARN(util::LogCategory::GAUGE) << operation << " rejected: "
                                       << GaugeStatusToString(status);
    return status;
}

void GaugeController::Dispatch(const std::vector<GaugeEvent>& events) const {
    EventCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = eventCallback_;
    }
    if (!callback) {
        return;
    }
    for (const auto& event : events) {
        callback(event);
    }
}

GaugeStatus GaugeController::SettleLocked(PoolId pool, const Address& participant,
                                          Amount stakeDelta, Timestamp now,
                                          Staging& staging,
                                          std::vector<GaugeEvent>& events) {
    const PoolInfo* info = registry_.Get(pool);
    if (!info) {
        return GaugeStatus::UNKNOWN_POOL;
    }

    // Refresh before anything reads the pool or the position
    auto poolIt = staging.pools.find(pool);
    if (poolIt == staging.pools.end()) {
        auto snapshot = accumulator_.Snapshot(pool, now);
        if (!snapshot) {
            return GaugeStatus::UNKNOWN_POOL;
        }
        poolIt = staging.pools.emplace(pool, *snapshot).first;
    }
    PoolState& state = poolIt->second;

    PositionLedger::Key key{pool, participant};
    auto posIt = staging.positions.find(key);
    if (posIt == staging.positions.end()) {
        posIt = staging.positions.emplace(key, positions_.Get(pool, participant)).first;
    }
    Position& position = posIt->second;

    if (stakeDelta < 0 && -stakeDelta > position.staked) {
        return GaugeStatus::INSUFFICIENT_STAKE;
    }

    // Pay pending, never more than the pool has been allocated
    Uint128 pending = gauge::PendingReward(position, state.rewardPerShare);
    Uint128 unpaid = static_cast<Uint128>(state.allocatedRewards - state.paidRewards);
    Amount payout = ToAmount(std::min(pending, unpaid));
    if (payout > 0) {
        if (!ledger_.Transfer(rewardAsset_, vault_, participant, payout)) {
            return GaugeStatus::TRANSFER_FAILED;
        }
        state.paidRewards += payout;
        events.push_back({GaugeEventType::RewardPaid, pool, participant, payout});
    }

    if (stakeDelta > 0) {
        if (!ledger_.Transfer(info->stakedAsset, participant, vault_, stakeDelta)) {
            return GaugeStatus::TRANSFER_FAILED;
        }
        position.staked += stakeDelta;
        events.push_back({GaugeEventType::Deposit, pool, participant, stakeDelta});
    } else if (stakeDelta < 0) {
        if (!ledger_.Transfer(info->stakedAsset, vault_, participant, -stakeDelta)) {
            return GaugeStatus::TRANSFER_FAILED;
        }
        position.staked += stakeDelta;
        events.push_back({GaugeEventType::Withdrawal, pool, participant, -stakeDelta});
    }

    // Fresh inputs for the boost, then re-anchor at the accumulator just paid against
    Amount poolTotal = ledger_.BalanceOf(info->stakedAsset, vault_);
    position.derived = boost_.DerivedStake(position.staked, poolTotal,
                                           power_.PowerOf(participant),
                                           power_.TotalPower());
    AnchorDebt(position, state.rewardPerShare);

    LOG_DEBUG(util::LogCategory::GAUGE) << "Settled " << ShortAddress(participant)
                                        << " in pool " << pool << ": paid " << payout
                                        << ", staked " << position.staked
                                        << ", derived " << position.derived;
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::ExecuteLocked(const Address& participant,
                                           const std::vector<std::pair<PoolId, Amount>>& steps,
                                           std::vector<GaugeEvent>& events) {
    Timestamp now = util::GetTime();
    Staging staging;

    ledger_.BeginBatch();
    for (const auto& [pool, delta] : steps) {
        GaugeStatus status = SettleLocked(pool, participant, delta, now, staging, events);
        if (status != GaugeStatus::OK) {
            ledger_.RollbackBatch();
            events.clear();
            return status;
        }
    }
    ledger_.CommitBatch();

    for (const auto& [pool, state] : staging.pools) {
        accumulator_.Commit(pool, state);
    }
    for (const auto& [key, position] : staging.positions) {
        positions_.Commit(key.first, key.second, position);
    }
    return GaugeStatus::OK;
}

void GaugeController::ApplyRatesLocked() {
    auto rates = weights_.DeriveRates(totalEmissionRate_);
    if (!rates) {
        return;
    }
    for (const auto& [pool, rate] : *rates) {
        accumulator_.SetEmissionRate(pool, rate);
    }
}

// ============================================================================
// Participant Operations
// ============================================================================

GaugeStatus GaugeController::Deposit(const Address& participant, PoolId pool, Amount amount) {
    std::vector<GaugeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (participant == vault_) {
            return Reject(GaugeStatus::UNAUTHORIZED, "Deposit");
        }
        if (!registry_.Contains(pool)) {
            return Reject(GaugeStatus::UNKNOWN_POOL, "Deposit");
        }
        if (amount <= 0 || !AmountRange(amount)) {
            return Reject(GaugeStatus::INVALID_AMOUNT, "Deposit");
        }
        GaugeStatus status = ExecuteLocked(participant, {{pool, amount}}, events);
        if (status != GaugeStatus::OK) {
            return Reject(status, "Deposit");
        }
    }
    Dispatch(events);
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::Withdraw(const Address& participant, PoolId pool, Amount amount) {
    std::vector<GaugeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (participant == vault_) {
            return Reject(GaugeStatus::UNAUTHORIZED, "Withdraw");
        }
        if (!registry_.Contains(pool)) {
            return Reject(GaugeStatus::UNKNOWN_POOL, "Withdraw");
        }
        if (amount <= 0 || !AmountRange(amount)) {
            return Reject(GaugeStatus::INVALID_AMOUNT, "Withdraw");
        }
        GaugeStatus status = ExecuteLocked(participant, {{pool, -amount}}, events);
        if (status != GaugeStatus::OK) {
            return Reject(status, "Withdraw");
        }
    }
    Dispatch(events);
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::Claim(const Address& participant, PoolId pool) {
    return ClaimMany(participant, {pool});
}

GaugeStatus GaugeController::ClaimMany(const Address& participant,
                                       const std::vector<PoolId>& pools) {
    std::vector<GaugeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (participant == vault_) {
            return Reject(GaugeStatus::UNAUTHORIZED, "Claim");
        }
        std::vector<std::pair<PoolId, Amount>> steps;
        steps.reserve(pools.size());
        for (PoolId pool : pools) {
            if (!registry_.Contains(pool)) {
                return Reject(GaugeStatus::UNKNOWN_POOL, "Claim");
            }
            steps.emplace_back(pool, 0);
        }
        GaugeStatus status = ExecuteLocked(participant, steps, events);
        if (status != GaugeStatus::OK) {
            return Reject(status, "Claim");
        }
    }
    Dispatch(events);
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::Vote(const Address& participant,
                                  const std::vector<PoolId>& pools,
                                  const std::vector<Amount>& weights) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (participant == vault_) {
        return Reject(GaugeStatus::UNAUTHORIZED, "Vote");
    }
    GaugeStatus status = weights_.ValidateVote(
        pools, weights, [this](PoolId id) { return registry_.Contains(id); });
    if (status != GaugeStatus::OK) {
        return Reject(status, "Vote");
    }

    // Total weight stays within MAX_AMOUNT
    Amount power = power_.PowerOf(participant);
    if (power > weights_.VoteHeadroom(participant)) {
        return Reject(GaugeStatus::INVALID_AMOUNT, "Vote");
    }

    weights_.Vote(participant, pools, weights, power);
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::ResetVotes(const Address& participant) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (participant == vault_) {
        return Reject(GaugeStatus::UNAUTHORIZED, "ResetVotes");
    }
    weights_.Reset(participant);
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::Rebalance() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (weights_.GetTotalWeight() <= 0) {
        LOG_DEBUG(util::LogCategory::GAUGE) << "Rebalance skipped: total weight is zero";
        return GaugeStatus::OK;
    }

    accumulator_.RefreshAll(util::GetTime());
    ApplyRatesLocked();

    LOG_DEBUG(util::LogCategory::GAUGE) << "Rebalanced " << registry_.Size()
                                        << " pools over total weight "
                                        << weights_.GetTotalWeight();
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::RefreshAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    accumulator_.RefreshAll(util::GetTime());
    return GaugeStatus::OK;
}

// ============================================================================
// Administrative Operations
// ============================================================================

GaugeStatus GaugeController::RegisterPool(const Address& caller, const AssetId& stakedAsset,
                                          Amount reservedWeight, bool refreshFirst,
                                          PoolId* poolId) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(GaugeStatus::UNAUTHORIZED, "RegisterPool");
    }
    if (stakedAsset.empty() || stakedAsset == rewardAsset_) {
        return Reject(GaugeStatus::INVALID_ASSET, "RegisterPool");
    }
    if (reservedWeight < 0 || reservedWeight > weights_.Headroom()) {
        return Reject(GaugeStatus::INVALID_AMOUNT, "RegisterPool");
    }
    if (registry_.Find(stakedAsset)) {
        return Reject(GaugeStatus::POOL_EXISTS, "RegisterPool");
    }

    Timestamp now = util::GetTime();
    if (refreshFirst) {
        accumulator_.RefreshAll(now);
    }

    auto id = registry_.Add(stakedAsset, reservedWeight, now);
    if (!id) {
        return Reject(GaugeStatus::POOL_EXISTS, "RegisterPool");
    }
    accumulator_.AddPool(*id, now);
    weights_.AddPool(*id, reservedWeight);
    ApplyRatesLocked();

    if (poolId) {
        *poolId = *id;
    }

    LOG_INFO(util::LogCategory::GAUGE) << "Registered pool " << *id << " for " << stakedAsset
                                       << " with reserved weight " << reservedWeight;
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::ReleaseReservedWeight(const Address& caller, PoolId pool,
                                                   bool refreshFirst) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(GaugeStatus::UNAUTHORIZED, "ReleaseReservedWeight");
    }
    const PoolInfo* info = registry_.Get(pool);
    if (!info) {
        return Reject(GaugeStatus::UNKNOWN_POOL, "ReleaseReservedWeight");
    }
    if (info->reservedReleased || info->reservedWeight == 0) {
        return Reject(GaugeStatus::RESERVED_WEIGHT_RELEASED, "ReleaseReservedWeight");
    }

    if (refreshFirst) {
        accumulator_.RefreshAll(util::GetTime());
    }

    auto released = registry_.ReleaseReserved(pool);
    if (!released) {
        return Reject(GaugeStatus::RESERVED_WEIGHT_RELEASED, "ReleaseReservedWeight");
    }
    weights_.RemoveReserved(pool, *released);
    ApplyRatesLocked();

    LOG_INFO(util::LogCategory::GAUGE) << "Released reserved weight " << *released
                                       << " of pool " << pool;
    return GaugeStatus::OK;
}

GaugeStatus GaugeController::StartEmissions(const Address& caller, Amount totalSupply) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (caller != admin_) {
        return Reject(GaugeStatus::UNAUTHORIZED, "StartEmissions");
    }
    if (emissionsStarted_) {
        return Reject(GaugeStatus::EMISSIONS_ALREADY_STARTED, "StartEmissions");
    }
    if (totalSupply <= 0 || !AmountRange(totalSupply)) {
        return Reject(GaugeStatus::INVALID_AMOUNT, "StartEmissions");
    }
    Amount rate = totalSupply / params_.emissionWindow;
    if (rate == 0) {
        return Reject(GaugeStatus::INVALID_AMOUNT, "StartEmissions");
    }

    ledger_.BeginBatch();
    if (!ledger_.Transfer(rewardAsset_, caller, vault_, totalSupply)) {
        ledger_.RollbackBatch();
        return Reject(GaugeStatus::TRANSFER_FAILED, "StartEmissions");
    }
    ledger_.CommitBatch();

    Timestamp now = util::GetTime();
    accumulator_.RefreshAll(now);

    emissionStart_ = now;
    emissionsStarted_ = true;
    totalEmissionRate_ = rate;
    accumulator_.SetEmissionEnd(now + params_.emissionWindow);
    ApplyRatesLocked();

    LOG_INFO(util::LogCategory::GAUGE) << "Emissions started: " << totalSupply << " "
                                       << rewardAsset_ << " over "
                                       << util::FormatDuration(util::Seconds{params_.emissionWindow})
                                       << " at " << rate << "/s";
    return GaugeStatus::OK;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<PoolView> GaugeController::GetPool(PoolId pool) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const PoolInfo* info = registry_.Get(pool);
    if (!info) {
        return std::nullopt;
    }
    auto snapshot = accumulator_.Snapshot(pool, util::GetTime());
    if (!snapshot) {
        return std::nullopt;
    }

    PoolView view;
    view.info = *info;
    view.state = *snapshot;
    view.weight = weights_.GetPoolWeight(pool);
    view.totalStaked = StakedBalance(pool);
    return view;
}

std::optional<Position> GaugeController::GetPosition(PoolId pool,
                                                     const Address& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!registry_.Contains(pool)) {
        return std::nullopt;
    }
    return positions_.Get(pool, participant);
}

Amount GaugeController::PendingReward(PoolId pool, const Address& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto snapshot = accumulator_.Snapshot(pool, util::GetTime());
    if (!snapshot) {
        return 0;
    }
    Position position = positions_.Get(pool, participant);
    Uint128 pending = gauge::PendingReward(position, snapshot->rewardPerShare);
    Uint128 unpaid = static_cast<Uint128>(snapshot->allocatedRewards - snapshot->paidRewards);
    return ToAmount(std::min(pending, unpaid));
}

Amount GaugeController::GetPoolWeight(PoolId pool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weights_.GetPoolWeight(pool);
}

Amount GaugeController::GetTotalWeight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weights_.GetTotalWeight();
}

Amount GaugeController::GetVoteAllocation(const Address& participant, PoolId pool) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weights_.GetAllocation(participant, pool);
}

std::vector<PoolId> GaugeController::GetVotedPools(const Address& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weights_.GetVotedPools(participant);
}

Amount GaugeController::GetUsedWeight(const Address& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return weights_.GetUsedWeight(participant);
}

size_t GaugeController::PoolCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.Size();
}

Amount GaugeController::GetTotalEmissionRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalEmissionRate_;
}

bool GaugeController::EmissionsStarted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emissionsStarted_;
}

Timestamp GaugeController::GetEmissionStart() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return emissionStart_;
}

Timestamp GaugeController::GetEmissionEnd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accumulator_.GetEmissionEnd();
}

void GaugeController::SetEventCallback(EventCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    eventCallback_ = std::move(callback);
}

} // namespace gauge
} // namespace spillway
