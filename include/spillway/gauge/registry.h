// SPILLWAY - Pool Registry
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Append-only catalogue of reward pools. Pool ids are dense indices that
// never change once assigned.

#ifndef SPILLWAY_GAUGE_REGISTRY_H
#define SPILLWAY_GAUGE_REGISTRY_H

#include "spillway/core/types.h"

#include <map>
#include <optional>
#include <vector>

namespace spillway {
namespace gauge {

/// Static description of a pool
struct PoolInfo {
    PoolId id{0};
    AssetId stakedAsset;
    Amount reservedWeight{0};
    bool reservedReleased{false};
    Timestamp registeredAt{0};
};

class PoolRegistry {
public:
    PoolRegistry();
    ~PoolRegistry();

    /// Append a pool; nullopt if a pool for the asset already exists
    std::optional<PoolId> Add(const AssetId& stakedAsset, Amount reservedWeight,
                              Timestamp now);

    /// Look up a pool by id
    const PoolInfo* Get(PoolId id) const;

    /// Look up a pool by staked asset
    std::optional<PoolId> Find(const AssetId& stakedAsset) const;

    /// Check whether an id names a registered pool
    bool Contains(PoolId id) const { return id < pools_.size(); }

    /// Flag the reserved weight as released; returns the amount released
    std::optional<Amount> ReleaseReserved(PoolId id);

    size_t Size() const { return pools_.size(); }

private:
    std::vector<PoolInfo> pools_;
    std::map<AssetId, PoolId> byAsset_;
};

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_REGISTRY_H
