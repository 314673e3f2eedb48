/**
 * @file Device.h
 * @brief Persistent device registry records: devices, history events, scan sessions
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace LanMonitor {

//=============================================================================
// Device
//=============================================================================

/**
 * @struct Device
 * @brief One known device, keyed by MAC address
 *
 * macAddress never changes once the device is stored. missedScans counts
 * consecutive cycles the device was not seen while still marked online.
 * Timestamps are ISO-8601 UTC strings.
 */
struct Device {
    int64_t id = 0;                             ///< 0 until stored
    std::string macAddress;
    std::string ipAddress;
    std::optional<std::string> hostname;
    std::optional<std::string> vendor;
    std::optional<std::string> manufacturer;
    std::optional<std::string> deviceType;
    std::optional<std::string> model;
    std::optional<std::string> friendlyName;
    std::optional<std::string> customName;
    std::optional<std::string> notes;
    std::optional<std::string> services;        ///< JSON array text
    std::optional<std::string> openPorts;       ///< JSON array text
    std::optional<std::string> networkInterface;

    bool isOnline = false;
    bool isFavorite = false;
    bool isKnown = false;
    int missedScans = 0;

    std::string firstSeen;
    std::string lastSeen;
    std::string createdAt;
    std::string updatedAt;

    /// hostname, else custom name (used in notification payloads)
    std::optional<std::string> hostnameOrCustomName() const;

    /// Name for log lines: hostname, else MAC.
    std::string label() const;

    nlohmann::json toJson() const;
    static Device fromJson(const nlohmann::json& j);
};

//=============================================================================
// ScanEvent
//=============================================================================

namespace ScanEventType {
inline constexpr const char* CONNECTED = "connected";
inline constexpr const char* DISCONNECTED = "disconnected";
inline constexpr const char* IP_CHANGED = "ip_changed";
}  // namespace ScanEventType

/**
 * @struct ScanEvent
 * @brief Immutable presence history entry
 */
struct ScanEvent {
    int64_t id = 0;
    int64_t deviceId = 0;
    std::string eventType;
    std::string ipAddress;
    std::optional<std::string> oldIpAddress;
    std::string timestamp;
    std::optional<double> responseTime;         ///< milliseconds
    std::string scanMethod;

    nlohmann::json toJson() const;
    static ScanEvent fromJson(const nlohmann::json& j);
};

//=============================================================================
// ScanSession
//=============================================================================

namespace SessionStatus {
inline constexpr const char* RUNNING = "running";
inline constexpr const char* COMPLETED = "completed";
inline constexpr const char* FAILED = "failed";
}  // namespace SessionStatus

struct SessionCounts {
    int devicesFound = 0;
    int devicesOnline = 0;
    int devicesNew = 0;
};

/**
 * @struct ScanSession
 * @brief One reconciliation cycle
 */
struct ScanSession {
    int64_t id = 0;
    std::string startedAt;
    std::optional<std::string> completedAt;
    std::string status = SessionStatus::RUNNING;
    SessionCounts counts;
    std::string subnet;
    std::string scanMethod;
    std::optional<std::string> errorMessage;

    nlohmann::json toJson() const;
    static ScanSession fromJson(const nlohmann::json& j);
};

//=============================================================================
// ScanResult
//=============================================================================

/**
 * @struct ScanResult
 * @brief Summary returned by an on-demand scan
 */
struct ScanResult {
    int64_t sessionId = 0;
    std::string status;
    SessionCounts counts;
    std::string subnet;

    nlohmann::json toJson() const;
};

}  // namespace LanMonitor
