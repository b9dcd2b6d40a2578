// SPILLWAY - Time Utilities
// Copyright (c) 2024 SPILLWAY Developers
// MIT License
//
// Provides the clock the engine reads "now" from:
// - Unix timestamps
// - Mock time for deterministic tests
// - Duration formatting for log lines

#ifndef SPILLWAY_UTIL_TIME_H
#define SPILLWAY_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace spillway {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Get current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

// ============================================================================
// Duration Formatting
// ============================================================================

/// Format duration as human-readable string (e.g., "365d", "1h 23m 45s")
std::string FormatDuration(Seconds duration);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time mode, freezing the clock at the current time
void EnableMockTime();

/// Disable mock time mode
void DisableMockTime();

/// Check if mock time is enabled
bool IsMockTimeEnabled();

/// Set mock time
void SetMockTime(int64_t timestamp);

/// Advance mock time by duration
void AdvanceMockTime(Seconds duration);

/// Get mock time
int64_t GetMockTime();

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

} // namespace util
} // namespace spillway

#endif // SPILLWAY_UTIL_TIME_H
