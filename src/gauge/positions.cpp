// SPILLWAY - Position Ledger Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/positions.h"

namespace spillway {
namespace gauge {

Uint128 AccruedReward(const Position& position, Uint128 rewardPerShare) {
    if (position.derived <= 0) {
        return 0;
    }
    return MulDiv(static_cast<Uint128>(position.derived), rewardPerShare,
                  static_cast<Uint128>(PRECISION));
}

Uint128 PendingReward(const Position& position, Uint128 rewardPerShare) {
    Uint128 accrued = AccruedReward(position, rewardPerShare);
    return accrued > position.rewardDebt ? accrued - position.rewardDebt : 0;
}

void AnchorDebt(Position& position, Uint128 rewardPerShare) {
    position.rewardDebt = AccruedReward(position, rewardPerShare);
}

PositionLedger::PositionLedger() = default;
PositionLedger::~PositionLedger() = default;

Position PositionLedger::Get(PoolId pool, const Address& owner) const {
    auto it = positions_.find({pool, owner});
    return it != positions_.end() ? it->second : Position{};
}

void PositionLedger::Commit(PoolId pool, const Address& owner, const Position& position) {
    if (position.IsEmpty()) {
        positions_.erase({pool, owner});
        return;
    }
    positions_[{pool, owner}] = position;
}

} // namespace gauge
} // namespace spillway
