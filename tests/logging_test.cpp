/**
 * @file logging_test.cpp
 * @brief Console threshold and scan trace file behavior
 */

#include <gtest/gtest.h>

#include "lanmonitor/Debug.h"
#include "lanmonitor/ThreadSafeLog.h"

#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace LanMonitor;

namespace {

class LogLevelGuard {
public:
    LogLevelGuard() : m_saved(logLevel()) {}
    ~LogLevelGuard() { setLogLevel(m_saved); }

private:
    LogLevel m_saved;
};

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST(LoggingTest, ThresholdFiltersLowerLevels) {
    LogLevelGuard guard;

    setLogLevel(LogLevel::Info);
    EXPECT_FALSE(logEnabled(LogLevel::Debug));
    EXPECT_TRUE(logEnabled(LogLevel::Info));
    EXPECT_TRUE(logEnabled(LogLevel::Error));

    setLogLevel(LogLevel::Debug);
    EXPECT_TRUE(logEnabled(LogLevel::Debug));

    setLogLevel(LogLevel::Error);
    EXPECT_FALSE(logEnabled(LogLevel::Warning));
}

TEST(LoggingTest, SuppressedMessageIsNotEvaluated) {
    LogLevelGuard guard;
    setLogLevel(LogLevel::Warning);

    int evaluated = 0;
    auto touch = [&evaluated]() { return ++evaluated; };
    LOG_DEBUG("value " << touch());
    LOG_INFO("value " << touch());
    EXPECT_EQ(evaluated, 0);
}

TEST(LoggingTest, TraceLineFormat) {
    const auto when = std::chrono::system_clock::from_time_t(0) + std::chrono::milliseconds(42);
    const std::string line = ThreadSafeLog::formatLine(when, "scan started");

    // Local time zone decides the date, not the layout.
    ASSERT_EQ(line.size(), std::string("YYYY-MM-DD HH:MM:SS.mmm - scan started\n").size());
    EXPECT_EQ(line.substr(19, 4), ".042");
    EXPECT_EQ(line.substr(23), " - scan started\n");
}

TEST(LoggingTest, TraceFileCollectsLinesFromAllThreads) {
    const auto dir = std::filesystem::temp_directory_path() / "lanmonitor_trace_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    const auto path = dir / "nested" / "trace.log";

    ThreadSafeLog::log("before open");

    std::string err;
    ASSERT_TRUE(ThreadSafeLog::open(path, err)) << err;
    EXPECT_TRUE(ThreadSafeLog::isOpen());

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([t]() {
            for (int i = 0; i < 25; ++i) {
                ThreadSafeLog::log("worker " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    ThreadSafeLog::close();
    EXPECT_FALSE(ThreadSafeLog::isOpen());
    ThreadSafeLog::log("after close");

    const auto lines = readLines(path);
    ASSERT_EQ(lines.size(), 100u);
    for (const auto& line : lines) {
        EXPECT_NE(line.find(" - worker "), std::string::npos) << line;
    }
}

TEST(LoggingTest, OpenFailureReportsPath) {
    const auto blocker = std::filesystem::temp_directory_path() / "lanmonitor_trace_blocker";
    std::error_code ec;
    std::filesystem::remove_all(blocker, ec);
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    std::string err;
    EXPECT_FALSE(ThreadSafeLog::open(blocker / "trace.log", err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(ThreadSafeLog::isOpen());
}
