// SPILLWAY - Gauge Events Implementation
// Copyright (c) 2024 SPILLWAY Developers
// MIT License

#include "spillway/gauge/events.h"

namespace spillway {
namespace gauge {

const char* GaugeEventTypeToString(GaugeEventType type) {
    switch (type) {
        case GaugeEventType::Deposit: return "Deposit";
        case GaugeEventType::Withdrawal: return "Withdrawal";
        case GaugeEventType::RewardPaid: return "RewardPaid";
        default: return "Unknown";
    }
}

} // namespace gauge
} // namespace spillway
