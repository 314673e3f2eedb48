/**
 * @file lanmonitord.cpp
 * @brief LAN presence monitor daemon
 *
 * Runs the reconciliation engine against the JSON device store and writes
 * every engine event to stdout as one JSON object per line.
 */

#include "lanmonitor/DaemonArgs.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/EventBus.h"
#include "lanmonitor/HostEnricher.h"
#include "lanmonitor/JsonDeviceStore.h"
#include "lanmonitor/PresenceEngine.h"
#include "lanmonitor/ScannerSettings.h"
#include "lanmonitor/SubnetDiscovery.h"
#include "lanmonitor/SystemDiscoveryBackend.h"
#include "lanmonitor/SystemHostProbes.h"
#include "lanmonitor/ThreadSafeLog.h"
#include "lanmonitor/VendorLookup.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

void printHelp() {
    std::cout
        << "lanmonitord\n"
        << "\n"
        << "Usage:\n"
        << "  lanmonitord [--config <file>] [--subnet <cidr>] [--once] [--no-deep] [--verbose]\n"
        << "\n"
        << "Options:\n"
        << "  --config <file>  JSON settings file (LANMON_* environment variables override it)\n"
        << "  --subnet <cidr>  Scan this subnet instead of the configured or detected one\n"
        << "  --once           Run a single scan cycle and exit\n"
        << "  --no-deep        Skip host enrichment (discovery only)\n"
        << "  -v, --verbose    Log per-host probe detail\n"
        << "  --help           Show this help\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    LanMonitor::DaemonArgs args;
    try {
        args = LanMonitor::DaemonArgs::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        printHelp();
        return 2;
    }

    if (args.showHelp) {
        printHelp();
        return 0;
    }

    LanMonitor::ScannerSettings settings;
    std::string errorMsg;
    if (!LanMonitor::ScannerSettings::load(args.configPath, settings, errorMsg)) {
        std::cerr << "Error: " << errorMsg << "\n";
        return 1;
    }
    if (args.noDeep) {
        settings.deepScan = false;
    }

    if (args.verbose) {
        LanMonitor::setLogLevel(LanMonitor::LogLevel::Debug);
    }

    if (!settings.logPath.empty()) {
        if (!LanMonitor::ThreadSafeLog::open(settings.logPath, errorMsg)) {
            LOG_WARNING("[Main] Scan trace disabled: " << errorMsg);
        }
    }
    LanMonitor::ThreadSafeLog::log("lanmonitord starting");

    auto vendors = std::make_shared<LanMonitor::VendorLookup>();
    if (!settings.ouiDatabasePath.empty()) {
        if (!vendors->loadFromFile(settings.ouiDatabasePath, errorMsg)) {
            LOG_WARNING("[Main] Vendor table not loaded, using built-in prefixes: " << errorMsg);
        }
    }

    auto store = std::make_shared<LanMonitor::JsonDeviceStore>(settings.storePath);
    if (!store->load(errorMsg)) {
        std::cerr << "Error: cannot open device store " << settings.storePath << ": " << errorMsg << "\n";
        return 1;
    }

    auto bus = std::make_shared<LanMonitor::EventBus>();
    bus->subscribe(std::make_shared<LanMonitor::JsonLinesSubscriber>(std::cout));

    auto discovery = std::make_shared<LanMonitor::SubnetDiscovery>(
        std::make_shared<LanMonitor::SystemDiscoveryBackend>(settings.interfaceName),
        vendors,
        settings.discoveryOptions());
    auto serviceCache = std::make_shared<LanMonitor::ServiceCache>();
    auto enricher = std::make_shared<LanMonitor::HostEnricher>(
        std::make_shared<LanMonitor::SystemHostProbes>(settings.interfaceName),
        serviceCache,
        vendors,
        settings.enrichmentOptions());

    // The periodic loop scans the default subnet, so --subnet pins it.
    LanMonitor::PresenceOptions options = settings.presenceOptions();
    if (args.subnet && !args.once) {
        options.defaultSubnet = *args.subnet;
    }
    LanMonitor::PresenceEngine engine(discovery, enricher, store, bus, options);

    if (args.once) {
        try {
            engine.performScan(args.subnet, settings.deepScan);
        } catch (const std::exception& e) {
            std::cerr << "Scan failed: " << e.what() << "\n";
            LanMonitor::ThreadSafeLog::close();
            return 1;
        }
        LanMonitor::ThreadSafeLog::close();
        return 0;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (!engine.start()) {
        std::cerr << "Error: cannot start the scan loop\n";
        return 1;
    }

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("[Main] Shutting down");
    engine.stop();
    LanMonitor::ThreadSafeLog::log("lanmonitord stopped");
    LanMonitor::ThreadSafeLog::close();
    return 0;
}
