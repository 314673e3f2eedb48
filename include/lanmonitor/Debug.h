/**
 * @file Debug.h
 * @brief Console logging macros with a runtime severity threshold
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace LanMonitor {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Probe workers, the discovery techniques and the scan loop all log
// concurrently; every console write goes through this mutex.
inline std::mutex g_logMutex;

// Per-host probe chatter is Debug; the daemon raises verbosity with --verbose.
inline std::atomic<int> g_logThreshold{static_cast<int>(LogLevel::Info)};

inline void setLogLevel(LogLevel level) {
    g_logThreshold.store(static_cast<int>(level), std::memory_order_relaxed);
}

inline LogLevel logLevel() {
    return static_cast<LogLevel>(g_logThreshold.load(std::memory_order_relaxed));
}

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= g_logThreshold.load(std::memory_order_relaxed);
}

inline const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "?";
}

/**
 * @brief Wall-clock time of day for console lines
 * @return "[HH:MM:SS.mmm]"
 */
inline std::string getTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream oss;
    oss << '[' << std::put_time(&local, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << ']';
    return oss.str();
}

} // namespace LanMonitor

// The stream expression is only evaluated when the level passes the threshold.
#define LANMON_LOG_AT(level, msg) \
    do { \
        if (LanMonitor::logEnabled(level)) { \
            std::ostringstream lanmonLine_; \
            lanmonLine_ << msg; \
            std::lock_guard<std::mutex> lanmonLock_(LanMonitor::g_logMutex); \
            std::cerr << LanMonitor::getTimestamp() << " [" \
                      << LanMonitor::logLevelTag(level) << "] " \
                      << lanmonLine_.str() << std::endl; \
        } \
    } while (0)

#define LOG_DEBUG(msg)   LANMON_LOG_AT(LanMonitor::LogLevel::Debug, msg)
#define LOG_INFO(msg)    LANMON_LOG_AT(LanMonitor::LogLevel::Info, msg)
#define LOG_WARNING(msg) LANMON_LOG_AT(LanMonitor::LogLevel::Warning, msg)
#define LOG_ERROR(msg)   LANMON_LOG_AT(LanMonitor::LogLevel::Error, msg)
