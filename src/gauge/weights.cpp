// SPILLWAY - Weight Allocator Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/weights.h"
#include "spillway/util/logging.h"

#include <algorithm>
#include <utility>

namespace spillway {
namespace gauge {

WeightAllocator::WeightAllocator() = default;
WeightAllocator::~WeightAllocator() = default;

void WeightAllocator::AddPool(PoolId id, Amount reservedWeight) {
    poolWeights_[id] += reservedWeight;
    totalWeight_ += reservedWeight;
}

void WeightAllocator::RemoveReserved(PoolId id, Amount reservedWeight) {
    poolWeights_[id] -= reservedWeight;
    totalWeight_ -= reservedWeight;
}

GaugeStatus WeightAllocator::ValidateVote(const std::vector<PoolId>& pools,
                                          const std::vector<Amount>& weights,
                                          const PoolPredicate& isKnownPool) const {
    if (pools.size() != weights.size()) {
        return GaugeStatus::LENGTH_MISMATCH;
    }
    if (pools.empty()) {
        return GaugeStatus::EMPTY_VOTE;
    }

    Uint128 sum = 0;
    for (size_t i = 0; i < pools.size(); ++i) {
        if (!isKnownPool(pools[i])) {
            return GaugeStatus::UNKNOWN_POOL;
        }
        if (weights[i] < 0) {
            return GaugeStatus::INVALID_AMOUNT;
        }
        sum += static_cast<Uint128>(weights[i]);
    }
    if (sum == 0) {
        return GaugeStatus::ZERO_WEIGHT_SUM;
    }
    return GaugeStatus::OK;
}

void WeightAllocator::Vote(const Address& voter, const std::vector<PoolId>& pools,
                           const std::vector<Amount>& weights, Amount power) {
    Amount headroom = VoteHeadroom(voter);
    Reset(voter);

    // Merge repeated ids, keeping first-appearance order
    std::vector<std::pair<PoolId, Uint128>> merged;
    Uint128 sum = 0;
    for (size_t i = 0; i < pools.size(); ++i) {
        sum += static_cast<Uint128>(weights[i]);
        bool found = false;
        for (auto& entry : merged) {
            if (entry.first == pools[i]) {
                entry.second += static_cast<Uint128>(weights[i]);
                found = true;
                break;
            }
        }
        if (!found) {
            merged.emplace_back(pools[i], static_cast<Uint128>(weights[i]));
        }
    }

    Uint128 budget = static_cast<Uint128>(std::clamp<Amount>(power, 0, headroom));

    VoteRecord record;
    Amount allocated = 0;
    size_t lastNonZero = merged.size();
    for (size_t i = 0; i < merged.size(); ++i) {
        Amount share = static_cast<Amount>(MulDiv(merged[i].second, budget, sum));
        record.pools.push_back(merged[i].first);
        record.allocations[merged[i].first] = share;
        allocated += share;
        if (merged[i].second > 0) {
            lastNonZero = i;
        }
    }

    Amount dust = static_cast<Amount>(budget) - allocated;
    if (dust > 0 && lastNonZero < merged.size()) {
        record.allocations[merged[lastNonZero].first] += dust;
        allocated += dust;
    }
    record.usedWeight = allocated;

    for (const auto& [pool, amount] : record.allocations) {
        poolWeights_[pool] += amount;
        totalWeight_ += amount;
    }

    LOG_DEBUG(util::LogCategory::VOTES) << ShortAddress(voter) << " allocated " << allocated
                                        << " weight across " << record.pools.size()
                                        << " pools";

    votes_[voter] = std::move(record);
}

void WeightAllocator::Reset(const Address& voter) {
    auto it = votes_.find(voter);
    if (it == votes_.end()) {
        return;
    }

    for (const auto& [pool, amount] : it->second.allocations) {
        if (amount == 0) {
            continue;
        }
        poolWeights_[pool] -= amount;
        totalWeight_ -= amount;
    }

    LOG_DEBUG(util::LogCategory::VOTES) << ShortAddress(voter) << " reset "
                                        << it->second.usedWeight << " weight";
    votes_.erase(it);
}

std::optional<std::map<PoolId, Amount>> WeightAllocator::DeriveRates(Amount totalRate) const {
    if (totalWeight_ <= 0) {
        return std::nullopt;
    }

    std::map<PoolId, Amount> rates;
    for (const auto& [pool, weight] : poolWeights_) {
        rates[pool] = static_cast<Amount>(MulDiv(static_cast<Uint128>(totalRate),
                                                 static_cast<Uint128>(weight),
                                                 static_cast<Uint128>(totalWeight_)));
    }
    return rates;
}

Amount WeightAllocator::GetPoolWeight(PoolId id) const {
    auto it = poolWeights_.find(id);
    return it != poolWeights_.end() ? it->second : 0;
}

Amount WeightAllocator::VoteHeadroom(const Address& voter) const {
    return MAX_AMOUNT - (totalWeight_ - GetUsedWeight(voter));
}

Amount WeightAllocator::GetAllocation(const Address& voter, PoolId id) const {
    auto it = votes_.find(voter);
    if (it == votes_.end()) {
        return 0;
    }
    auto alloc = it->second.allocations.find(id);
    return alloc != it->second.allocations.end() ? alloc->second : 0;
}

std::vector<PoolId> WeightAllocator::GetVotedPools(const Address& voter) const {
    auto it = votes_.find(voter);
    if (it == votes_.end()) {
        return {};
    }
    return it->second.pools;
}

Amount WeightAllocator::GetUsedWeight(const Address& voter) const {
    auto it = votes_.find(voter);
    return it != votes_.end() ? it->second.usedWeight : 0;
}

} // namespace gauge
} // namespace spillway
