/**
 * @file TimeUtils.h
 * @brief Wall-clock helpers for persisted timestamps.
 */

#pragma once

#include <chrono>
#include <string>

namespace LanMonitor {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Format a time point as UTC ISO-8601 with millisecond precision.
 *
 * Example: 2026-03-14T09:26:53.589Z
 */
std::string formatIso8601(TimePoint tp);

/// formatIso8601(Clock::now())
std::string nowIso8601();

}  // namespace LanMonitor
