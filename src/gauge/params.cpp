// SPILLWAY - Gauge Controller Parameters Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/params.h"

#include <algorithm>
#include <cctype>

namespace spillway {
namespace gauge {

bool BoostParams::IsValid() const {
    return baseBps >= 0 && baseBps <= BPS_DENOMINATOR &&
           poolBps >= 0 && poolBps <= BPS_DENOMINATOR &&
           baseBps + poolBps <= BPS_DENOMINATOR;
}

bool ControllerParams::IsValid() const {
    return emissionWindow > 0 && boost.IsValid();
}

namespace {

bool IsKnownLogLevel(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "trace" || lower == "debug" || lower == "info" ||
           lower == "warn" || lower == "warning" || lower == "error" ||
           lower == "fatal" || lower == "off";
}

} // namespace

ControllerParams ControllerParams::FromConfig(const util::ConfigManager& config) {
    using util::ConfigKeys::GAUGE_SECTION;
    namespace keys = util::ConfigKeys;

    ControllerParams params;

    if (config.HasKey(keys::EMISSION_WINDOW, GAUGE_SECTION)) {
        auto window = config.TryGetInt(keys::EMISSION_WINDOW, GAUGE_SECTION);
        if (window && *window > 0) {
            params.emissionWindow = *window;
        } else {
            LOG_WARN(util::LogCategory::CONFIG)
                << "Ignoring invalid " << keys::EMISSION_WINDOW << "='"
                << config.GetString(keys::EMISSION_WINDOW, "", GAUGE_SECTION) << "'";
        }
    }

    BoostParams boost = params.boost;
    bool boostKeyBad = false;
    if (config.HasKey(keys::BASE_BOOST_BPS, GAUGE_SECTION)) {
        auto bps = config.TryGetInt(keys::BASE_BOOST_BPS, GAUGE_SECTION);
        if (bps) {
            boost.baseBps = *bps;
        } else {
            boostKeyBad = true;
        }
    }
    if (config.HasKey(keys::POOL_BOOST_BPS, GAUGE_SECTION)) {
        auto bps = config.TryGetInt(keys::POOL_BOOST_BPS, GAUGE_SECTION);
        if (bps) {
            boost.poolBps = *bps;
        } else {
            boostKeyBad = true;
        }
    }
    if (!boostKeyBad && boost.IsValid()) {
        params.boost = boost;
    } else {
        LOG_WARN(util::LogCategory::CONFIG)
            << "Ignoring invalid boost split (" << keys::BASE_BOOST_BPS << ", "
            << keys::POOL_BOOST_BPS << "); keeping " << params.boost.baseBps
            << "/" << params.boost.poolBps;
    }

    if (auto level = config.TryGetString(keys::LOG_LEVEL, GAUGE_SECTION)) {
        if (IsKnownLogLevel(*level)) {
            params.logLevel = util::LogLevelFromString(*level);
        } else {
            LOG_WARN(util::LogCategory::CONFIG) << "Ignoring unknown " << keys::LOG_LEVEL
                                                << "='" << *level << "'";
        }
    }

    return params;
}

} // namespace gauge
} // namespace spillway
