/**
 * @file MemoryDeviceStore.cpp
 * @brief In-memory DeviceStore with snapshot transactions
 */

#include "lanmonitor/MemoryDeviceStore.h"
#include "lanmonitor/ErrorCodes.h"
#include "lanmonitor/NetUtils.h"
#include "lanmonitor/TimeUtils.h"

#include <algorithm>

namespace LanMonitor {

//=============================================================================
// StoreData
//=============================================================================

nlohmann::json StoreData::toJson() const {
    nlohmann::json j;
    j["next_device_id"] = nextDeviceId;
    j["next_event_id"] = nextEventId;
    j["next_session_id"] = nextSessionId;

    nlohmann::json jDevices = nlohmann::json::array();
    for (const auto& pair : devices) {
        jDevices.push_back(pair.second.toJson());
    }
    j["devices"] = std::move(jDevices);

    nlohmann::json jEvents = nlohmann::json::array();
    for (const auto& e : events) {
        jEvents.push_back(e.toJson());
    }
    j["events"] = std::move(jEvents);

    nlohmann::json jSessions = nlohmann::json::array();
    for (const auto& s : sessions) {
        jSessions.push_back(s.toJson());
    }
    j["sessions"] = std::move(jSessions);
    return j;
}

StoreData StoreData::fromJson(const nlohmann::json& j) {
    StoreData data;
    if (!j.is_object()) {
        return data;
    }

    if (j.contains("devices") && j["devices"].is_array()) {
        for (const auto& item : j["devices"]) {
            Device d = Device::fromJson(item);
            if (d.id <= 0 || d.macAddress.empty()) {
                continue;
            }
            data.nextDeviceId = std::max(data.nextDeviceId, d.id + 1);
            data.devices[d.id] = std::move(d);
        }
    }
    if (j.contains("events") && j["events"].is_array()) {
        for (const auto& item : j["events"]) {
            ScanEvent e = ScanEvent::fromJson(item);
            data.nextEventId = std::max(data.nextEventId, e.id + 1);
            data.events.push_back(std::move(e));
        }
    }
    if (j.contains("sessions") && j["sessions"].is_array()) {
        for (const auto& item : j["sessions"]) {
            ScanSession s = ScanSession::fromJson(item);
            data.nextSessionId = std::max(data.nextSessionId, s.id + 1);
            data.sessions.push_back(std::move(s));
        }
    }

    // Stored counters never move backwards past existing ids.
    if (j.contains("next_device_id") && j["next_device_id"].is_number_integer()) {
        data.nextDeviceId = std::max(data.nextDeviceId, j["next_device_id"].get<int64_t>());
    }
    if (j.contains("next_event_id") && j["next_event_id"].is_number_integer()) {
        data.nextEventId = std::max(data.nextEventId, j["next_event_id"].get<int64_t>());
    }
    if (j.contains("next_session_id") && j["next_session_id"].is_number_integer()) {
        data.nextSessionId = std::max(data.nextSessionId, j["next_session_id"].get<int64_t>());
    }
    return data;
}

//=============================================================================
// Mutation plumbing
//=============================================================================

void MemoryDeviceStore::mutate(const std::function<void()>& fn) {
    if (m_transactionSnapshot) {
        fn();
        return;
    }

    StoreData before = m_data;
    fn();
    try {
        persist(m_data);
    } catch (const std::exception&) {
        m_data = std::move(before);
        throw;
    }
}

void MemoryDeviceStore::persist(const StoreData& data) {
    (void)data;
}

void MemoryDeviceStore::replaceData(StoreData data) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_data = std::move(data);
    m_transactionSnapshot.reset();
}

StoreData MemoryDeviceStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data;
}

//=============================================================================
// Devices
//=============================================================================

std::vector<Device> MemoryDeviceStore::listAllDevices() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Device> out;
    out.reserve(m_data.devices.size());
    for (const auto& pair : m_data.devices) {
        out.push_back(pair.second);
    }
    return out;
}

std::optional<Device> MemoryDeviceStore::findByMac(const std::string& mac) {
    const std::string wanted = NetUtils::normalizeMac(mac);
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& pair : m_data.devices) {
        if (pair.second.macAddress == wanted) {
            return pair.second;
        }
    }
    return std::nullopt;
}

Device MemoryDeviceStore::upsert(const Device& device) {
    Device stored = device;
    stored.macAddress = NetUtils::normalizeMac(device.macAddress);
    if (stored.macAddress.empty()) {
        throw StoreError(ErrorCodes::STORE_WRITE_FAILED, "Device has no valid MAC address: " + device.macAddress);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& pair : m_data.devices) {
        if (pair.second.macAddress == stored.macAddress && pair.first != stored.id) {
            throw StoreError(ErrorCodes::STORE_WRITE_FAILED, "Duplicate MAC address: " + stored.macAddress);
        }
    }

    if (stored.id != 0) {
        const auto it = m_data.devices.find(stored.id);
        if (it == m_data.devices.end()) {
            throw StoreError(ErrorCodes::STORE_WRITE_FAILED, "Unknown device id " + std::to_string(stored.id));
        }
        if (it->second.macAddress != stored.macAddress) {
            throw StoreError(ErrorCodes::STORE_WRITE_FAILED,
                             "MAC address of device " + std::to_string(stored.id) + " cannot change");
        }
    }

    mutate([this, &stored]() {
        const std::string now = nowIso8601();
        if (stored.id == 0) {
            stored.id = m_data.nextDeviceId++;
            if (stored.createdAt.empty()) {
                stored.createdAt = now;
            }
            if (stored.firstSeen.empty()) {
                stored.firstSeen = now;
            }
            if (stored.lastSeen.empty()) {
                stored.lastSeen = now;
            }
        }
        if (stored.updatedAt.empty()) {
            stored.updatedAt = now;
        }
        m_data.devices[stored.id] = stored;
    });
    return stored;
}

//=============================================================================
// Events and sessions
//=============================================================================

ScanEvent MemoryDeviceStore::appendEvent(const ScanEvent& event) {
    ScanEvent stored = event;
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_data.devices.find(stored.deviceId) == m_data.devices.end()) {
        throw StoreError(ErrorCodes::STORE_WRITE_FAILED,
                         "Event references unknown device " + std::to_string(stored.deviceId));
    }
    mutate([this, &stored]() {
        stored.id = m_data.nextEventId++;
        if (stored.timestamp.empty()) {
            stored.timestamp = nowIso8601();
        }
        m_data.events.push_back(stored);
    });
    return stored;
}

ScanSession MemoryDeviceStore::openSession(const std::string& subnet, const std::string& scanMethod) {
    ScanSession session;
    session.subnet = subnet;
    session.scanMethod = scanMethod;
    session.status = SessionStatus::RUNNING;
    session.startedAt = nowIso8601();

    std::lock_guard<std::mutex> lock(m_mutex);
    mutate([this, &session]() {
        session.id = m_data.nextSessionId++;
        m_data.sessions.push_back(session);
    });
    return session;
}

void MemoryDeviceStore::completeSession(int64_t sessionId,
                                        const std::string& status,
                                        const SessionCounts& counts,
                                        const std::optional<std::string>& errorMessage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = std::find_if(m_data.sessions.begin(), m_data.sessions.end(),
                                 [sessionId](const ScanSession& s) { return s.id == sessionId; });
    if (it == m_data.sessions.end()) {
        throw StoreError(ErrorCodes::STORE_UNKNOWN_SESSION, "Unknown scan session " + std::to_string(sessionId));
    }

    const size_t index = static_cast<size_t>(it - m_data.sessions.begin());
    mutate([this, index, &status, &counts, &errorMessage]() {
        ScanSession& s = m_data.sessions[index];
        s.status = status;
        s.counts = counts;
        s.errorMessage = errorMessage;
        s.completedAt = nowIso8601();
    });
}

//=============================================================================
// Transactions
//=============================================================================

void MemoryDeviceStore::beginTransaction() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_transactionSnapshot) {
        throw StoreError(ErrorCodes::STORE_NO_TRANSACTION, "A transaction is already open");
    }
    m_transactionSnapshot = m_data;
}

void MemoryDeviceStore::commit() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_transactionSnapshot) {
        throw StoreError(ErrorCodes::STORE_NO_TRANSACTION, "commit() without an open transaction");
    }
    try {
        persist(m_data);
    } catch (const std::exception&) {
        m_data = std::move(*m_transactionSnapshot);
        m_transactionSnapshot.reset();
        throw;
    }
    m_transactionSnapshot.reset();
}

void MemoryDeviceStore::rollback() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_transactionSnapshot) {
        return;
    }
    m_data = std::move(*m_transactionSnapshot);
    m_transactionSnapshot.reset();
}

//=============================================================================
// Read side
//=============================================================================

std::vector<ScanEvent> MemoryDeviceStore::listEvents() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.events;
}

std::vector<ScanEvent> MemoryDeviceStore::listEventsForDevice(int64_t deviceId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ScanEvent> out;
    for (const auto& e : m_data.events) {
        if (e.deviceId == deviceId) {
            out.push_back(e);
        }
    }
    return out;
}

std::vector<ScanSession> MemoryDeviceStore::listSessions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_data.sessions;
}

std::optional<ScanSession> MemoryDeviceStore::findSession(int64_t sessionId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& s : m_data.sessions) {
        if (s.id == sessionId) {
            return s;
        }
    }
    return std::nullopt;
}

bool MemoryDeviceStore::inTransaction() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transactionSnapshot.has_value();
}

}  // namespace LanMonitor
