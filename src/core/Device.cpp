/**
 * @file Device.cpp
 * @brief JSON mapping of the device registry records
 */

#include "lanmonitor/Device.h"

namespace LanMonitor {

namespace {

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::optional<std::string> optionalString(const nlohmann::json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return std::nullopt;
}

std::string stringOr(const nlohmann::json& obj, const char* key, const std::string& fallback = {}) {
    return optionalString(obj, key).value_or(fallback);
}

bool boolOr(const nlohmann::json& obj, const char* key, bool fallback) {
    if (obj.contains(key) && obj[key].is_boolean()) {
        return obj[key].get<bool>();
    }
    return fallback;
}

template <typename Int>
Int intOr(const nlohmann::json& obj, const char* key, Int fallback) {
    if (obj.contains(key) && obj[key].is_number_integer()) {
        return obj[key].get<Int>();
    }
    return fallback;
}

}  // namespace

//=============================================================================
// Device
//=============================================================================

std::optional<std::string> Device::hostnameOrCustomName() const {
    if (hostname && !hostname->empty()) {
        return hostname;
    }
    if (customName && !customName->empty()) {
        return customName;
    }
    return std::nullopt;
}

std::string Device::label() const {
    return hostname && !hostname->empty() ? *hostname : macAddress;
}

nlohmann::json Device::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["mac_address"] = macAddress;
    j["ip_address"] = ipAddress;
    j["hostname"] = optionalToJson(hostname);
    j["vendor"] = optionalToJson(vendor);
    j["manufacturer"] = optionalToJson(manufacturer);
    j["device_type"] = optionalToJson(deviceType);
    j["model"] = optionalToJson(model);
    j["friendly_name"] = optionalToJson(friendlyName);
    j["custom_name"] = optionalToJson(customName);
    j["notes"] = optionalToJson(notes);
    j["services"] = optionalToJson(services);
    j["open_ports"] = optionalToJson(openPorts);
    j["network_interface"] = optionalToJson(networkInterface);
    j["is_online"] = isOnline;
    j["is_favorite"] = isFavorite;
    j["is_known"] = isKnown;
    j["missed_scans"] = missedScans;
    j["first_seen"] = firstSeen;
    j["last_seen"] = lastSeen;
    j["created_at"] = createdAt;
    j["updated_at"] = updatedAt;
    return j;
}

Device Device::fromJson(const nlohmann::json& j) {
    Device d;
    if (!j.is_object()) {
        return d;
    }
    d.id = intOr<int64_t>(j, "id", 0);
    d.macAddress = stringOr(j, "mac_address");
    d.ipAddress = stringOr(j, "ip_address");
    d.hostname = optionalString(j, "hostname");
    d.vendor = optionalString(j, "vendor");
    d.manufacturer = optionalString(j, "manufacturer");
    d.deviceType = optionalString(j, "device_type");
    d.model = optionalString(j, "model");
    d.friendlyName = optionalString(j, "friendly_name");
    d.customName = optionalString(j, "custom_name");
    d.notes = optionalString(j, "notes");
    d.services = optionalString(j, "services");
    d.openPorts = optionalString(j, "open_ports");
    d.networkInterface = optionalString(j, "network_interface");
    d.isOnline = boolOr(j, "is_online", false);
    d.isFavorite = boolOr(j, "is_favorite", false);
    d.isKnown = boolOr(j, "is_known", false);
    d.missedScans = intOr<int>(j, "missed_scans", 0);
    d.firstSeen = stringOr(j, "first_seen");
    d.lastSeen = stringOr(j, "last_seen");
    d.createdAt = stringOr(j, "created_at");
    d.updatedAt = stringOr(j, "updated_at");
    return d;
}

//=============================================================================
// ScanEvent
//=============================================================================

nlohmann::json ScanEvent::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["device_id"] = deviceId;
    j["event_type"] = eventType;
    j["ip_address"] = ipAddress;
    j["old_ip_address"] = optionalToJson(oldIpAddress);
    j["timestamp"] = timestamp;
    j["response_time"] = responseTime ? nlohmann::json(*responseTime) : nlohmann::json(nullptr);
    j["scan_method"] = scanMethod;
    return j;
}

ScanEvent ScanEvent::fromJson(const nlohmann::json& j) {
    ScanEvent e;
    if (!j.is_object()) {
        return e;
    }
    e.id = intOr<int64_t>(j, "id", 0);
    e.deviceId = intOr<int64_t>(j, "device_id", 0);
    e.eventType = stringOr(j, "event_type");
    e.ipAddress = stringOr(j, "ip_address");
    e.oldIpAddress = optionalString(j, "old_ip_address");
    e.timestamp = stringOr(j, "timestamp");
    if (j.contains("response_time") && j["response_time"].is_number()) {
        e.responseTime = j["response_time"].get<double>();
    }
    e.scanMethod = stringOr(j, "scan_method");
    return e;
}

//=============================================================================
// ScanSession / ScanResult
//=============================================================================

nlohmann::json ScanSession::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["started_at"] = startedAt;
    j["completed_at"] = optionalToJson(completedAt);
    j["status"] = status;
    j["devices_found"] = counts.devicesFound;
    j["devices_online"] = counts.devicesOnline;
    j["devices_new"] = counts.devicesNew;
    j["subnet"] = subnet;
    j["scan_method"] = scanMethod;
    j["error_message"] = optionalToJson(errorMessage);
    return j;
}

ScanSession ScanSession::fromJson(const nlohmann::json& j) {
    ScanSession s;
    if (!j.is_object()) {
        return s;
    }
    s.id = intOr<int64_t>(j, "id", 0);
    s.startedAt = stringOr(j, "started_at");
    s.completedAt = optionalString(j, "completed_at");
    s.status = stringOr(j, "status", SessionStatus::RUNNING);
    s.counts.devicesFound = intOr<int>(j, "devices_found", 0);
    s.counts.devicesOnline = intOr<int>(j, "devices_online", 0);
    s.counts.devicesNew = intOr<int>(j, "devices_new", 0);
    s.subnet = stringOr(j, "subnet");
    s.scanMethod = stringOr(j, "scan_method");
    s.errorMessage = optionalString(j, "error_message");
    return s;
}

nlohmann::json ScanResult::toJson() const {
    nlohmann::json j;
    j["session_id"] = sessionId;
    j["status"] = status;
    j["devices_found"] = counts.devicesFound;
    j["devices_online"] = counts.devicesOnline;
    j["devices_new"] = counts.devicesNew;
    j["subnet"] = subnet;
    return j;
}

}  // namespace LanMonitor
