// SPILLWAY - Boost Calculator
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#ifndef SPILLWAY_GAUGE_BOOST_H
#define SPILLWAY_GAUGE_BOOST_H

#include "spillway/core/types.h"
#include "spillway/gauge/params.h"

namespace spillway {
namespace gauge {

/**
 * Computes the derived (boosted) stake of a position:
 *
 *   base      = staked * baseBps / 10000
 *   poolShare = poolTotalStaked * power / totalPower
 *   boosted   = poolShare * poolBps / 10000
 *   derived   = min(base + boosted, staked)
 *
 * A zero total power yields no boost.
 */
class BoostCalculator {
public:
    BoostCalculator() = default;
    explicit BoostCalculator(const BoostParams& params) : params_(params) {}

    Amount DerivedStake(Amount staked, Amount poolTotalStaked,
                        Amount power, Amount totalPower) const;

    const BoostParams& GetParams() const { return params_; }

private:
    BoostParams params_;
};

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_BOOST_H
