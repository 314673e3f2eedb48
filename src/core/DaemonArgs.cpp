/**
 * @file DaemonArgs.cpp
 * @brief lanmonitord command-line parsing.
 */

#include "lanmonitor/DaemonArgs.h"

#include <string>

namespace LanMonitor {

DaemonArgs DaemonArgs::parseOrThrow(int argc, const char* const* argv) {
    DaemonArgs out;

    auto requireValue = [argc, argv](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc || !argv[i + 1]) {
            throw std::runtime_error("Missing value for " + flag);
        }
        ++i;
        return std::string(argv[i]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--once") {
            out.once = true;
            continue;
        }

        if (a == "--no-deep") {
            out.noDeep = true;
            continue;
        }

        if (a == "--verbose" || a == "-v") {
            out.verbose = true;
            continue;
        }

        if (a == "--config") {
            out.configPath = requireValue(i, a);
            continue;
        }

        if (a == "--subnet") {
            const std::string value = requireValue(i, a);
            if (value.empty()) {
                throw std::runtime_error("--subnet requires a CIDR");
            }
            out.subnet = value;
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    return out;
}

}  // namespace LanMonitor
