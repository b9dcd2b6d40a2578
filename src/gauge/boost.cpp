// SPILLWAY - Boost Calculator Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/boost.h"

#include <algorithm>

namespace spillway {
namespace gauge {

Amount BoostCalculator::DerivedStake(Amount staked, Amount poolTotalStaked,
                                     Amount power, Amount totalPower) const {
    if (staked <= 0) {
        return 0;
    }

    const Uint128 bps = static_cast<Uint128>(BPS_DENOMINATOR);

    Uint128 base = static_cast<Uint128>(staked) *
                   static_cast<Uint128>(params_.baseBps) / bps;

    Uint128 boosted = 0;
    if (totalPower > 0 && power > 0 && poolTotalStaked > 0) {
        Uint128 poolShare = MulDiv(static_cast<Uint128>(poolTotalStaked),
                                   static_cast<Uint128>(power),
                                   static_cast<Uint128>(totalPower));
        boosted = MulDiv(poolShare, static_cast<Uint128>(params_.poolBps), bps);
    }

    Uint128 derived = std::min(base + boosted, static_cast<Uint128>(staked));
    return static_cast<Amount>(derived);
}

} // namespace gauge
} // namespace spillway
