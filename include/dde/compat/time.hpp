/**
 * @file time.hpp
 * @brief Cross-platform time helpers and timestamp text encoding
 *
 * Timestamps are persisted as UTC text "YYYY-MM-DD HH:MM:SS". A default
 * constructed time_point stands for "not set" and encodes as empty text.
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace dde::compat {

/**
 * @brief Cross-platform thread-safe UTC time conversion
 *
 * @param time Pointer to the time_t value to convert
 * @param result Pointer to the tm structure to store the result
 * @return Pointer to the tm structure (result) on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Convert a broken-down UTC time to time_t
 */
inline std::time_t timegm_safe(std::tm* tm) {
#if defined(_WIN32) || defined(_WIN64)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

/// Format a time_point as UTC text; empty for an unset time_point
[[nodiscard]] inline std::string to_timestamp_string(
    std::chrono::system_clock::time_point tp) {
    if (tp == std::chrono::system_clock::time_point{}) {
        return "";
    }
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_safe(&time, &tm) == nullptr) {
        return "";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

/// Parse UTC text produced by to_timestamp_string; unset on failure
[[nodiscard]] inline std::chrono::system_clock::time_point
from_timestamp_string(const std::string& str) {
    if (str.empty()) {
        return {};
    }
    std::tm tm{};
    if (std::sscanf(str.c_str(), "%d-%d-%d %d:%d:%d",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(timegm_safe(&tm));
}

}  // namespace dde::compat
