// SPILLWAY - Gauge Events
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#ifndef SPILLWAY_GAUGE_EVENTS_H
#define SPILLWAY_GAUGE_EVENTS_H

#include "spillway/core/types.h"

#include <functional>

namespace spillway {
namespace gauge {

enum class GaugeEventType {
    Deposit,
    Withdrawal,
    RewardPaid
};

const char* GaugeEventTypeToString(GaugeEventType type);

/// Notification emitted after an operation commits
struct GaugeEvent {
    GaugeEventType type{GaugeEventType::Deposit};
    PoolId pool{0};
    Address participant;
    Amount amount{0};
};

using EventCallback = std::function<void(const GaugeEvent&)>;

} // namespace gauge
} // namespace spillway

#endif // SPILLWAY_GAUGE_EVENTS_H
