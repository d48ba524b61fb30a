// VESCROW - Time Utilities
// Copyright (c) 2024 VESCROW Developers
// MIT License
//
// Provides time-related utilities:
// - Unix timestamps
// - ISO 8601 formatting and parsing
// - Mock time for testing

#ifndef VESCROW_UTIL_TIME_H
#define VESCROW_UTIL_TIME_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace vescrow {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 7 * SECONDS_PER_DAY;
constexpr int64_t SECONDS_PER_YEAR = 365 * SECONDS_PER_DAY;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

SystemTimePoint FromUnixTime(int64_t timestamp);

int64_t ToUnixTime(SystemTimePoint tp);

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// Format a Unix timestamp as ISO 8601 (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(int64_t timestamp);

/// Parse "YYYY-MM-DDTHH:MM:SS[Z]" or "YYYY-MM-DD" as UTC
std::optional<int64_t> ParseISO8601(const std::string& str);

/// Human-readable duration (e.g., "3d 4h 5m 6s")
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(int64_t seconds);

} // namespace util
} // namespace vescrow

#endif // VESCROW_UTIL_TIME_H
