// SPILLWAY - Pool Registry Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/registry.h"

namespace spillway {
namespace gauge {

PoolRegistry::PoolRegistry() = default;
PoolRegistry::~PoolRegistry() = default;

std::optional<PoolId> PoolRegistry::Add(const AssetId& stakedAsset, Amount reservedWeight,
                                        Timestamp now) {
    if (byAsset_.count(stakedAsset) > 0) {
        return std::nullopt;
    }

    PoolInfo info;
    info.id = static_cast<PoolId>(pools_.size());
    info.stakedAsset = stakedAsset;
    info.reservedWeight = reservedWeight;
    info.reservedReleased = false;
    info.registeredAt = now;

    pools_.push_back(info);
    byAsset_[stakedAsset] = info.id;
    return info.id;
}

const PoolInfo* PoolRegistry::Get(PoolId id) const {
    if (!Contains(id)) {
        return nullptr;
    }
    return &pools_[id];
}

std::optional<PoolId> PoolRegistry::Find(const AssetId& stakedAsset) const {
    auto it = byAsset_.find(stakedAsset);
    if (it == byAsset_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Amount> PoolRegistry::ReleaseReserved(PoolId id) {
    if (!Contains(id)) {
        return std::nullopt;
    }
    PoolInfo& info = pools_[id];
    if (info.reservedReleased || info.reservedWeight == 0) {
        return std::nullopt;
    }
    info.reservedReleased = true;
    return info.reservedWeight;
}

} // namespace gauge
} // namespace spillway
