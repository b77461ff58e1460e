/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * Formatting helpers for error timestamps and elapsed durations.
 */

#pragma once

#include <string>
#include <chrono>

namespace caload {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 string (UTC)
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-02-02T12:34:56Z" or "2026-02-02T12:34:56.789Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

/**
 * @brief Get current time as time_point
 *
 * @return Current system time
 */
inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/**
 * @brief Duration as fractional seconds
 */
inline double toSeconds(std::chrono::steady_clock::duration d) {
    return std::chrono::duration_cast<std::chrono::duration<double>>(d).count();
}

} // namespace utils
} // namespace caload
