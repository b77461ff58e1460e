/**
 * @file time_utils.cpp
 * @brief Time formatting utilities implementation
 */

#include "caload/utils/time_utils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace caload {
namespace utils {

std::string formatIso8601(const std::chrono::system_clock::time_point& tp, bool includeMilliseconds) {
    std::time_t time_t_value = std::chrono::system_clock::to_time_t(tp);

    struct tm tm_time;
    if (!gmtime_r(&time_t_value, &tm_time)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tm_time.tm_year + 1900) << '-'
        << std::setw(2) << (tm_time.tm_mon + 1) << '-'
        << std::setw(2) << tm_time.tm_mday << 'T'
        << std::setw(2) << tm_time.tm_hour << ':'
        << std::setw(2) << tm_time.tm_min << ':'
        << std::setw(2) << tm_time.tm_sec;

    if (includeMilliseconds) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;
        if (ms.count() < 0) {
            ms += std::chrono::milliseconds(1000);
        }
        oss << '.' << std::setw(3) << ms.count();
    }

    oss << 'Z';
    return oss.str();
}

} // namespace utils
} // namespace caload
