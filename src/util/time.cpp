// VESCROW - Time Utilities Implementation
// Copyright (c) 2024 VESCROW Developers
// MIT License

#include "vescrow/util/time.h"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace vescrow {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
    std::mutex g_mockTimeMutex;
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

SystemTimePoint FromUnixTime(int64_t timestamp) {
    return SystemTimePoint{Seconds{timestamp}};
}

int64_t ToUnixTime(SystemTimePoint tp) {
    return std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count();
}

// ============================================================================
// Formatting and Parsing
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<int64_t> ParseISO8601(const std::string& str) {
    std::tm tm_buf = {};
    std::istringstream iss(str);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");

    if (iss.fail()) {
        // Date only
        tm_buf = {};
        iss.clear();
        iss.str(str);
        iss >> std::get_time(&tm_buf, "%Y-%m-%d");
        if (iss.fail()) {
            return std::nullopt;
        }
    }

    char c;
    if (iss >> c && c != 'Z') {
        return std::nullopt;
    }

    std::time_t time = timegm(&tm_buf);
    if (time == -1) {
        return std::nullopt;
    }
    return static_cast<int64_t>(time);
}

std::string FormatDuration(int64_t seconds) {
    if (seconds < 0) {
        return "-" + FormatDuration(-seconds);
    }
    if (seconds == 0) {
        return "0s";
    }

    int64_t days = seconds / SECONDS_PER_DAY;
    seconds %= SECONDS_PER_DAY;
    int64_t hours = seconds / SECONDS_PER_HOUR;
    seconds %= SECONDS_PER_HOUR;
    int64_t minutes = seconds / SECONDS_PER_MINUTE;
    seconds %= SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    if (g_mockTime.load() == 0) {
        g_mockTime.store(GetTime());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    std::lock_guard<std::mutex> lock(g_mockTimeMutex);
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

} // namespace util
} // namespace vescrow
