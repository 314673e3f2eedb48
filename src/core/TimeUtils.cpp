/**
 * @file TimeUtils.cpp
 * @brief Wall-clock helpers for persisted timestamps.
 */

#include "lanmonitor/TimeUtils.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace LanMonitor {

std::string formatIso8601(TimePoint tp) {
    const auto t = Clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string nowIso8601() {
    return formatIso8601(Clock::now());
}

}  // namespace LanMonitor
