// SPILLWAY - Gauge Controller Parameters
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#ifndef SPILLWAY_GAUGE_PARAMS_H
#define SPILLWAY_GAUGE_PARAMS_H

#include "spillway/core/types.h"
#include "spillway/util/config.h"
#include "spillway/util/logging.h"

#include <optional>

namespace spillway {
namespace gauge {

// ============================================================================
// Gauge Constants
// ============================================================================

/// Share of the raw stake that always counts (basis points) - 40%
constexpr int64_t DEFAULT_BASE_BOOST_BPS = 4000;

/// Share of the governance-weighted pool stake (basis points) - 60%
constexpr int64_t DEFAULT_POOL_BOOST_BPS = 6000;

/// Default emission window - one year
constexpr int64_t DEFAULT_EMISSION_WINDOW = SECONDS_PER_YEAR;

// ============================================================================
// Parameters
// ============================================================================

/// Boost split of the derived-stake formula
struct BoostParams {
    int64_t baseBps{DEFAULT_BASE_BOOST_BPS};
    int64_t poolBps{DEFAULT_POOL_BOOST_BPS};

    /// Both within 0..10000 and summing to at most 10000
    bool IsValid() const;
};

/// Tunables of a GaugeController
struct ControllerParams {
    /// Seconds over which StartEmissions spreads the supply
    int64_t emissionWindow{DEFAULT_EMISSION_WINDOW};

    BoostParams boost;

    /// Logger threshold to apply on construction, if configured
    std::optional<util::LogLevel> logLevel;

    bool IsValid() const;

    /**
     * Read the [gauge] section. Missing keys keep their defaults; invalid
     * values are logged and ignored.
     */
    static ControllerParams FromConfig(const util::ConfigManager& config);
};

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_PARAMS_H
