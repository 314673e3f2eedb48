/**
 * @file ThreadSafeLog.cpp
 * @brief Scan trace file implementation
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/ThreadSafeLog.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace LanMonitor {

std::mutex ThreadSafeLog::s_mutex;
std::ofstream ThreadSafeLog::s_file;

bool ThreadSafeLog::open(const std::filesystem::path& logPath, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        s_file.close();
    }

    std::error_code ec;
    const auto parent = logPath.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            errorMsg = "Cannot create trace directory " + parent.string() + ": " + ec.message();
            return false;
        }
    }

    s_file.clear();
    s_file.open(logPath, std::ios::out | std::ios::app);
    if (!s_file.is_open()) {
        errorMsg = "Cannot open trace file " + logPath.string();
        return false;
    }
    return true;
}

void ThreadSafeLog::close() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_file.is_open()) {
        s_file.flush();
        s_file.close();
    }
}

bool ThreadSafeLog::isOpen() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_file.is_open();
}

std::string ThreadSafeLog::formatLine(std::chrono::system_clock::time_point when,
                                      const std::string& message) {
    const std::time_t secs = std::chrono::system_clock::to_time_t(when);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis
        << " - " << message << '\n';
    return oss.str();
}

void ThreadSafeLog::log(const std::string& message) {
    const std::string line = formatLine(std::chrono::system_clock::now(), message);

    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_file.is_open()) {
        return;
    }
    s_file << line;
    s_file.flush();
}

void ThreadSafeLog::log(const char* message) {
    log(std::string(message ? message : ""));
}

} // namespace LanMonitor
