/**
 * @file ThreadSafeLog.h
 * @brief Scan trace file shared by every worker thread
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace LanMonitor {

/**
 * @brief Append-only trace of scan cycles, opened once by the daemon.
 *
 * Discovery techniques, probe workers and the reconciliation loop write to
 * the same file; lines are serialized by one static mutex. Until open()
 * succeeds, and after close(), log() is a no-op.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Open (or create) the trace file in append mode
     * @return false with errorMsg set if the file cannot be opened
     *
     * Reopening closes the previous file first.
     */
    static bool open(const std::filesystem::path& logPath, std::string& errorMsg);

    /// Flush and close the trace file.
    static void close();

    static bool isOpen();

    static void log(const std::string& message);
    static void log(const char* message);

    /**
     * @brief Render one trace line: "YYYY-MM-DD HH:MM:SS.mmm - message\n"
     */
    static std::string formatLine(std::chrono::system_clock::time_point when,
                                  const std::string& message);

private:
    static std::mutex s_mutex;
    static std::ofstream s_file;
};

} // namespace LanMonitor
