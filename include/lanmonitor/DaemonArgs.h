/**
 * @file DaemonArgs.h
 * @brief lanmonitord command-line parsing.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace LanMonitor {

struct DaemonArgs {
    bool showHelp = false;
    bool once = false;
    bool noDeep = false;
    bool verbose = false;

    std::string configPath;
    std::optional<std::string> subnet;

    static DaemonArgs parseOrThrow(int argc, const char* const* argv);
};

}  // namespace LanMonitor
