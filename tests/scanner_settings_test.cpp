/**
 * @file scanner_settings_test.cpp
 * @brief Tests for settings loading, environment overrides and clamping.
 */

#include "lanmonitor/ScannerSettings.h"

#include <gtest/gtest.h>

#include <fstream>
#include <map>

using namespace LanMonitor;

namespace {

ScannerSettings::EnvLookup fakeEnv(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

std::filesystem::path writeTempSettings(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return path;
}

}  // namespace

TEST(ScannerSettingsTest, DefaultsMatchCompileTimeConstants) {
    ScannerSettings s;
    std::string err;
    ASSERT_TRUE(ScannerSettings::load({}, s, err, fakeEnv({})));

    EXPECT_EQ(s.scanIntervalS, SCAN_INTERVAL_S);
    EXPECT_EQ(s.scanTimeoutS, ARP_TIMEOUT_S);
    EXPECT_EQ(s.scanRetries, ARP_RETRIES);
    EXPECT_EQ(s.offlineGraceScans, OFFLINE_GRACE_SCANS);
    EXPECT_EQ(s.probeTimeoutMs, PROBE_TIMEOUT_MS);
    EXPECT_EQ(s.hostConcurrency, HOST_CONCURRENCY);
    EXPECT_TRUE(s.defaultSubnet.empty());
    EXPECT_TRUE(s.deepScan);
}

TEST(ScannerSettingsTest, JsonKeysOverrideDefaultsAndWrongTypesAreIgnored) {
    ScannerSettings s;
    s.mergeJson(nlohmann::json::parse(R"({
        "scan_interval_s": 300,
        "default_subnet": "10.1.0.0/16",
        "interface": "eth1",
        "host_concurrency": "eight",
        "deep_scan": false,
        "unknown_key": 1
    })"));

    EXPECT_EQ(s.scanIntervalS, 300u);
    EXPECT_EQ(s.defaultSubnet, "10.1.0.0/16");
    EXPECT_EQ(s.interfaceName, "eth1");
    EXPECT_EQ(s.hostConcurrency, HOST_CONCURRENCY);
    EXPECT_FALSE(s.deepScan);
}

TEST(ScannerSettingsTest, EnvironmentOverridesFile) {
    const auto path = writeTempSettings("lanmonitor_settings_env_test.json",
                                        R"({"scan_interval_s": 300, "offline_grace_scans": 5})");

    ScannerSettings s;
    std::string err;
    ASSERT_TRUE(ScannerSettings::load(path, s, err, fakeEnv({
        {"LANMON_SCAN_INTERVAL_S", "60"},
        {"LANMON_DEEP_SCAN", "off"},
        {"LANMON_HOST_CONCURRENCY", "-3"},
    }))) << err;

    EXPECT_EQ(s.scanIntervalS, 60u);
    EXPECT_EQ(s.offlineGraceScans, 5u);
    EXPECT_FALSE(s.deepScan);
    EXPECT_EQ(s.hostConcurrency, HOST_CONCURRENCY);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(ScannerSettingsTest, ClampBringsValuesIntoRange) {
    ScannerSettings s;
    s.scanIntervalS = 1;
    s.offlineGraceScans = 0;
    s.hostConcurrency = 0;
    s.probeTimeoutMs = 5;
    s.storePath.clear();
    s.clamp();

    EXPECT_EQ(s.scanIntervalS, 10u);
    EXPECT_EQ(s.offlineGraceScans, 1u);
    EXPECT_EQ(s.hostConcurrency, 1u);
    EXPECT_EQ(s.probeTimeoutMs, 100u);
    EXPECT_FALSE(s.storePath.empty());
}

TEST(ScannerSettingsTest, MalformedFileFailsWithConfigCode) {
    const auto path = writeTempSettings("lanmonitor_settings_bad_test.json", "{ not json");

    ScannerSettings s;
    std::string err;
    EXPECT_FALSE(ScannerSettings::load(path, s, err, fakeEnv({})));
    EXPECT_NE(err.find("LANMON-CFG-3000"), std::string::npos);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST(ScannerSettingsTest, MissingFileUsesDefaults) {
    ScannerSettings s;
    std::string err;
    EXPECT_TRUE(ScannerSettings::load(std::filesystem::temp_directory_path() / "lanmonitor_absent.json",
                                      s, err, fakeEnv({})));
    EXPECT_EQ(s.scanIntervalS, SCAN_INTERVAL_S);
}

TEST(ScannerSettingsTest, ComponentOptionsCarrySettings) {
    ScannerSettings s;
    s.scanIntervalS = 60;
    s.scanRetries = 4;
    s.probeTimeoutMs = 500;
    s.defaultSubnet = "172.16.0.0/24";

    EXPECT_EQ(s.discoveryOptions().arpRetries, 4u);
    EXPECT_EQ(s.enrichmentOptions().probeTimeout, std::chrono::milliseconds(500));
    EXPECT_EQ(s.presenceOptions().scanInterval, std::chrono::seconds(60));
    EXPECT_EQ(s.presenceOptions().defaultSubnet, "172.16.0.0/24");
}
