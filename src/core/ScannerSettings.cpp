/**
 * @file ScannerSettings.cpp
 * @brief Runtime settings: JSON file, then LANMON_* environment overrides
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/ScannerSettings.h"
#include "lanmonitor/AtomicFile.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/ErrorCodes.h"
#include "lanmonitor/StringUtils.h"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace LanMonitor {

namespace {

constexpr uint32_t MIN_SCAN_INTERVAL_S = 10;
constexpr uint32_t MAX_SCAN_INTERVAL_S = 24 * 3600;
constexpr uint32_t MAX_SCAN_TIMEOUT_S = 60;
constexpr uint32_t MAX_SCAN_RETRIES = 10;
constexpr uint32_t MAX_GRACE_SCANS = 100;
constexpr uint32_t MIN_PROBE_TIMEOUT_MS = 100;
constexpr uint32_t MAX_PROBE_TIMEOUT_MS = 30000;
constexpr uint32_t MAX_HOST_CONCURRENCY = 64;

std::optional<std::string> readProcessEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<uint32_t> parseUnsigned(const std::string& text) {
    const std::string s = StringUtils::trim(text);
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        const unsigned long long v = std::stoull(s);
        if (v > std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        return static_cast<uint32_t>(v);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<bool> parseBool(const std::string& text) {
    const std::string s = StringUtils::toLower(StringUtils::trim(text));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        return false;
    }
    return std::nullopt;
}

void readUnsigned(const nlohmann::json& j, const char* key, uint32_t& target) {
    if (!j.contains(key)) {
        return;
    }
    const auto& v = j[key];
    if (v.is_number_unsigned()) {
        target = static_cast<uint32_t>(std::min<uint64_t>(v.get<uint64_t>(), std::numeric_limits<uint32_t>::max()));
    } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        target = static_cast<uint32_t>(std::min<int64_t>(v.get<int64_t>(), std::numeric_limits<uint32_t>::max()));
    } else {
        LOG_WARNING("[Settings] Ignoring \"" << key << "\": expected a non-negative integer");
    }
}

void readString(const nlohmann::json& j, const char* key, std::string& target) {
    if (!j.contains(key)) {
        return;
    }
    if (j[key].is_string()) {
        target = j[key].get<std::string>();
    } else if (!j[key].is_null()) {
        LOG_WARNING("[Settings] Ignoring \"" << key << "\": expected a string");
    }
}

void readBool(const nlohmann::json& j, const char* key, bool& target) {
    if (!j.contains(key)) {
        return;
    }
    if (j[key].is_boolean()) {
        target = j[key].get<bool>();
    } else {
        LOG_WARNING("[Settings] Ignoring \"" << key << "\": expected true or false");
    }
}

void envUnsigned(const ScannerSettings::EnvLookup& env, const char* name, uint32_t& target) {
    const auto raw = env(name);
    if (!raw) {
        return;
    }
    if (const auto v = parseUnsigned(*raw)) {
        target = *v;
    } else {
        LOG_WARNING("[Settings] Ignoring " << name << "=" << *raw << ": not a non-negative integer");
    }
}

void envString(const ScannerSettings::EnvLookup& env, const char* name, std::string& target) {
    if (const auto raw = env(name)) {
        target = StringUtils::trim(*raw);
    }
}

void envBool(const ScannerSettings::EnvLookup& env, const char* name, bool& target) {
    const auto raw = env(name);
    if (!raw) {
        return;
    }
    if (const auto v = parseBool(*raw)) {
        target = *v;
    } else {
        LOG_WARNING("[Settings] Ignoring " << name << "=" << *raw << ": not a boolean");
    }
}

}  // namespace

//=============================================================================
// JSON
//=============================================================================

nlohmann::json ScannerSettings::toJson() const {
    nlohmann::json j;
    j["scan_interval_s"] = scanIntervalS;
    j["scan_timeout_s"] = scanTimeoutS;
    j["scan_retries"] = scanRetries;
    j["offline_grace_scans"] = offlineGraceScans;
    j["default_subnet"] = defaultSubnet;
    j["interface"] = interfaceName;
    j["probe_timeout_ms"] = probeTimeoutMs;
    j["host_concurrency"] = hostConcurrency;
    j["oui_database_path"] = ouiDatabasePath;
    j["store_path"] = storePath;
    j["log_path"] = logPath;
    j["deep_scan"] = deepScan;
    return j;
}

void ScannerSettings::mergeJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        LOG_WARNING("[Settings] Settings document is not an object; using defaults");
        return;
    }

    readUnsigned(j, "scan_interval_s", scanIntervalS);
    readUnsigned(j, "scan_timeout_s", scanTimeoutS);
    readUnsigned(j, "scan_retries", scanRetries);
    readUnsigned(j, "offline_grace_scans", offlineGraceScans);
    readString(j, "default_subnet", defaultSubnet);
    readString(j, "interface", interfaceName);
    readUnsigned(j, "probe_timeout_ms", probeTimeoutMs);
    readUnsigned(j, "host_concurrency", hostConcurrency);
    readString(j, "oui_database_path", ouiDatabasePath);
    readString(j, "store_path", storePath);
    readString(j, "log_path", logPath);
    readBool(j, "deep_scan", deepScan);
}

//=============================================================================
// Environment
//=============================================================================

void ScannerSettings::applyEnvironment(const EnvLookup& env) {
    const EnvLookup lookup = env ? env : EnvLookup(readProcessEnv);

    envUnsigned(lookup, "LANMON_SCAN_INTERVAL_S", scanIntervalS);
    envUnsigned(lookup, "LANMON_SCAN_TIMEOUT_S", scanTimeoutS);
    envUnsigned(lookup, "LANMON_SCAN_RETRIES", scanRetries);
    envUnsigned(lookup, "LANMON_OFFLINE_GRACE_SCANS", offlineGraceScans);
    envString(lookup, "LANMON_DEFAULT_SUBNET", defaultSubnet);
    envString(lookup, "LANMON_INTERFACE", interfaceName);
    envUnsigned(lookup, "LANMON_PROBE_TIMEOUT_MS", probeTimeoutMs);
    envUnsigned(lookup, "LANMON_HOST_CONCURRENCY", hostConcurrency);
    envString(lookup, "LANMON_OUI_DATABASE_PATH", ouiDatabasePath);
    envString(lookup, "LANMON_STORE_PATH", storePath);
    envString(lookup, "LANMON_LOG_PATH", logPath);
    envBool(lookup, "LANMON_DEEP_SCAN", deepScan);
}

//=============================================================================
// Validation
//=============================================================================

void ScannerSettings::clamp() {
    scanIntervalS = std::clamp(scanIntervalS, MIN_SCAN_INTERVAL_S, MAX_SCAN_INTERVAL_S);
    scanTimeoutS = std::clamp(scanTimeoutS, 1u, MAX_SCAN_TIMEOUT_S);
    scanRetries = std::clamp(scanRetries, 1u, MAX_SCAN_RETRIES);
    offlineGraceScans = std::clamp(offlineGraceScans, 1u, MAX_GRACE_SCANS);
    probeTimeoutMs = std::clamp(probeTimeoutMs, MIN_PROBE_TIMEOUT_MS, MAX_PROBE_TIMEOUT_MS);
    hostConcurrency = std::clamp(hostConcurrency, 1u, MAX_HOST_CONCURRENCY);
    if (storePath.empty()) {
        storePath = ScannerSettings().storePath;
    }
}

bool ScannerSettings::load(const std::filesystem::path& path,
                           ScannerSettings& out,
                           std::string& errorMsg,
                           const EnvLookup& env) {
    ScannerSettings settings;

    if (!path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            std::string content;
            std::string readError;
            if (!readWholeFile(path, content, readError)) {
                errorMsg = std::string(ErrorCodes::CONFIG_PARSE_FAILED) + ": " + readError;
                return false;
            }
            try {
                settings.mergeJson(nlohmann::json::parse(content));
            } catch (const nlohmann::json::exception& e) {
                errorMsg = std::string(ErrorCodes::CONFIG_PARSE_FAILED) + ": Invalid settings file " +
                           path.string() + ": " + e.what();
                return false;
            }
        } else {
            LOG_INFO("[Settings] " << path.string() << " not found; using defaults");
        }
    }

    settings.applyEnvironment(env);
    settings.clamp();
    out = settings;
    return true;
}

//=============================================================================
// Component options
//=============================================================================

DiscoveryOptions ScannerSettings::discoveryOptions() const {
    DiscoveryOptions o;
    o.arpRetries = scanRetries;
    o.arpTimeout = std::chrono::seconds(scanTimeoutS);
    return o;
}

EnrichmentOptions ScannerSettings::enrichmentOptions() const {
    EnrichmentOptions o;
    o.hostConcurrency = hostConcurrency;
    o.probeTimeout = std::chrono::milliseconds(probeTimeoutMs);
    return o;
}

PresenceOptions ScannerSettings::presenceOptions() const {
    PresenceOptions o;
    o.scanInterval = std::chrono::seconds(scanIntervalS);
    o.offlineGraceScans = offlineGraceScans;
    o.defaultSubnet = defaultSubnet;
    o.interfaceName = interfaceName;
    o.deepScan = deepScan;
    return o;
}

}  // namespace LanMonitor
