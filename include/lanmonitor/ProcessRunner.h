/**
 * @file ProcessRunner.h
 * @brief Run an external utility and capture its standard output.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace LanMonitor {

struct ProcessResult {
    bool launched = false;   ///< false when the executable could not be started
    bool timedOut = false;   ///< child was killed at the deadline
    int exitCode = -1;       ///< exit status, -1 if killed by a signal
    std::string output;      ///< captured stdout (stderr is discarded)
    std::string errorMsg;    ///< launch failure description

    bool succeeded() const { return launched && !timedOut && exitCode == 0; }
};

class ProcessRunner {
public:
    /**
     * @brief Run argv[0] (searched on PATH) with the given arguments.
     * @param argv Program followed by its arguments
     * @param timeout Kill the child with SIGKILL after this long
     * @param maxOutputBytes Stop collecting stdout beyond this size
     *
     * Never throws; a missing executable yields launched=false.
     */
    static ProcessResult run(const std::vector<std::string>& argv,
                             std::chrono::milliseconds timeout,
                             size_t maxOutputBytes = 4 * 1024 * 1024);
};

}  // namespace LanMonitor
