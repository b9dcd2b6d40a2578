// SPILLWAY - Reward Accumulator Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/accumulator.h"
#include "spillway/util/logging.h"

#include <algorithm>

namespace spillway {
namespace gauge {

AccumulatorEngine::AccumulatorEngine(BalanceQuery stakedBalance)
    : stakedBalance_(std::move(stakedBalance)) {}

AccumulatorEngine::~AccumulatorEngine() = default;

void AccumulatorEngine::Refresh(PoolState& state, Amount stakedBalance,
                                Timestamp now, Timestamp emissionEnd) {
    Timestamp effectiveNow = now;
    if (emissionEnd > 0) {
        effectiveNow = std::min(now, emissionEnd);
    }
    if (effectiveNow <= state.lastDistributionTime) {
        return;
    }

    Uint128 elapsed = static_cast<Uint128>(effectiveNow - state.lastDistributionTime);
    Uint128 delta = static_cast<Uint128>(std::max<Amount>(state.emissionRate, 0)) * elapsed;

    state.allocatedRewards = ToAmount(static_cast<Uint128>(state.allocatedRewards) + delta);
    if (stakedBalance > 0 && delta > 0) {
        state.rewardPerShare += MulDiv(delta, static_cast<Uint128>(PRECISION),
                                       static_cast<Uint128>(stakedBalance));
    }
    state.lastDistributionTime = effectiveNow;
}

void AccumulatorEngine::AddPool(PoolId id, Timestamp now) {
    if (id >= pools_.size()) {
        pools_.resize(id + 1);
    }
    PoolState state;
    state.lastDistributionTime = now;
    pools_[id] = state;
}

std::optional<PoolState> AccumulatorEngine::Snapshot(PoolId id, Timestamp now) const {
    if (id >= pools_.size()) {
        return std::nullopt;
    }
    PoolState state = pools_[id];
    Refresh(state, stakedBalance_(id), now, emissionEnd_);
    return state;
}

void AccumulatorEngine::Commit(PoolId id, const PoolState& state) {
    if (id >= pools_.size()) {
        return;
    }
    pools_[id] = state;
}

void AccumulatorEngine::RefreshAll(Timestamp now) {
    for (PoolId id = 0; id < pools_.size(); ++id) {
        if (now <= pools_[id].lastDistributionTime) {
            continue;
        }
        Refresh(pools_[id], stakedBalance_(id), now, emissionEnd_);
    }
    LOG_TRACE(util::LogCategory::GAUGE) << "Refreshed " << pools_.size() << " pools at " << now;
}

void AccumulatorEngine::SetEmissionRate(PoolId id, Amount rate) {
    if (id >= pools_.size()) {
        return;
    }
    pools_[id].emissionRate = rate;
}

} // namespace gauge
} // namespace spillway
