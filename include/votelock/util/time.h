// VOTELOCK - Time
// Copyright (c) 2024 VOTELOCK Developers
// MIT License
//
// Wall-clock access for the default escrow clock, with a process-wide mock
// that tests switch on to pin or advance "now".

#ifndef VOTELOCK_UTIL_TIME_H
#define VOTELOCK_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace votelock {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = SystemClock::time_point;

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;

// ============================================================================
// Clock
// ============================================================================

/// Unix seconds. Returns the mock value while mock time is on.
int64_t GetTime();

SystemTimePoint FromUnixTime(int64_t unixSeconds);
int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting
// ============================================================================

/// UTC, "2024-01-15T10:30:00Z"
std::string FormatISO8601(SystemTimePoint tp);
std::string FormatTimestamp(int64_t unixSeconds);

/// Largest units first with zero parts skipped, e.g. "4w 2d" or "1m 30s".
/// Negative spans get a leading '-'.
std::string FormatDuration(Seconds span);

// ============================================================================
// Mock time
// ============================================================================

/// Turning the mock on for the first time seeds it with the real clock.
void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

void SetMockTime(int64_t unixSeconds);
void AdvanceMockTime(Seconds delta);
int64_t GetMockTime();

} // namespace util
} // namespace votelock

#endif // VOTELOCK_UTIL_TIME_H
