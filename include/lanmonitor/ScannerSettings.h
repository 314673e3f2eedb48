/**
 * @file ScannerSettings.h
 * @brief Runtime settings: JSON file, then LANMON_* environment overrides
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "HostEnricher.h"
#include "PresenceEngine.h"
#include "SubnetDiscovery.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace LanMonitor {

/**
 * @brief Scanner settings with compile-time defaults from config.h.
 *
 * Load order:
 * 1. Defaults
 * 2. JSON file (optional). Unknown keys are ignored; keys with the wrong type
 *    are ignored with a warning.
 * 3. Environment: LANMON_SCAN_INTERVAL_S, LANMON_SCAN_TIMEOUT_S,
 *    LANMON_SCAN_RETRIES, LANMON_OFFLINE_GRACE_SCANS, LANMON_DEFAULT_SUBNET,
 *    LANMON_INTERFACE, LANMON_PROBE_TIMEOUT_MS, LANMON_HOST_CONCURRENCY,
 *    LANMON_OUI_DATABASE_PATH, LANMON_STORE_PATH, LANMON_LOG_PATH,
 *    LANMON_DEEP_SCAN
 * 4. clamp()
 */
struct ScannerSettings {
    /// Environment accessor; the default reads the process environment.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    uint32_t scanIntervalS = SCAN_INTERVAL_S;
    uint32_t scanTimeoutS = ARP_TIMEOUT_S;       ///< ARP sweep timeout per attempt
    uint32_t scanRetries = ARP_RETRIES;          ///< ARP sweep attempts
    uint32_t offlineGraceScans = OFFLINE_GRACE_SCANS;
    std::string defaultSubnet;                   ///< empty = auto-detect
    std::string interfaceName;
    uint32_t probeTimeoutMs = PROBE_TIMEOUT_MS;
    uint32_t hostConcurrency = static_cast<uint32_t>(HOST_CONCURRENCY);
    std::string ouiDatabasePath;                 ///< empty = built-in vendor table only
    std::string storePath = "lanmonitor-devices.json";
    std::string logPath;                         ///< empty = no trace file
    bool deepScan = true;

    nlohmann::json toJson() const;

    /// Apply the keys present in j on top of the current values.
    void mergeJson(const nlohmann::json& j);

    /**
     * @brief Apply LANMON_* overrides.
     *
     * Values that do not parse are ignored with a warning.
     */
    void applyEnvironment(const EnvLookup& env = {});

    /// Bring every value into its accepted range.
    void clamp();

    /**
     * @brief Defaults, then path (when non-empty), then environment, then clamp().
     * @return false if the file exists but cannot be read or parsed
     */
    static bool load(const std::filesystem::path& path,
                     ScannerSettings& out,
                     std::string& errorMsg,
                     const EnvLookup& env = {});

    DiscoveryOptions discoveryOptions() const;
    EnrichmentOptions enrichmentOptions() const;
    PresenceOptions presenceOptions() const;
};

}  // namespace LanMonitor
