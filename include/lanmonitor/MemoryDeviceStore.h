/**
 * @file MemoryDeviceStore.h
 * @brief In-memory DeviceStore with snapshot transactions
 */

#pragma once

#include "DeviceStore.h"

#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace LanMonitor {

/**
 * @brief Everything a store holds, in a form that can be copied and persisted.
 */
struct StoreData {
    std::map<int64_t, Device> devices;
    std::vector<ScanEvent> events;
    std::vector<ScanSession> sessions;
    int64_t nextDeviceId = 1;
    int64_t nextEventId = 1;
    int64_t nextSessionId = 1;

    nlohmann::json toJson() const;
    static StoreData fromJson(const nlohmann::json& j);
};

/**
 * @class MemoryDeviceStore
 * @brief DeviceStore kept entirely in memory
 *
 * beginTransaction() takes a snapshot and rollback() restores it. Subclasses
 * make the store durable by overriding persist(), which is called with the
 * complete data after every commit and every mutation made outside a
 * transaction; if it throws, the mutation is undone.
 *
 * Thread Safety: all methods are thread-safe. Only one transaction can be
 * open at a time.
 */
class MemoryDeviceStore : public DeviceStore {
public:
    MemoryDeviceStore() = default;
    ~MemoryDeviceStore() override = default;

    // Prevent copying
    MemoryDeviceStore(const MemoryDeviceStore&) = delete;
    MemoryDeviceStore& operator=(const MemoryDeviceStore&) = delete;

    std::vector<Device> listAllDevices() override;
    std::optional<Device> findByMac(const std::string& mac) override;
    Device upsert(const Device& device) override;
    ScanEvent appendEvent(const ScanEvent& event) override;
    ScanSession openSession(const std::string& subnet, const std::string& scanMethod) override;
    void completeSession(int64_t sessionId,
                         const std::string& status,
                         const SessionCounts& counts,
                         const std::optional<std::string>& errorMessage) override;

    void beginTransaction() override;
    void commit() override;
    void rollback() override;

    //=========================================================================
    // Read side
    //=========================================================================

    std::vector<ScanEvent> listEvents() const;
    std::vector<ScanEvent> listEventsForDevice(int64_t deviceId) const;
    std::vector<ScanSession> listSessions() const;
    std::optional<ScanSession> findSession(int64_t sessionId) const;
    bool inTransaction() const;

protected:
    /// Make data durable. Default: nothing to do.
    virtual void persist(const StoreData& data);

    /// Replace all data (used when loading); not transactional.
    void replaceData(StoreData data);

    StoreData snapshot() const;

private:
    /// Run a mutation with m_mutex held; outside a transaction it is persisted or undone.
    void mutate(const std::function<void()>& fn);

    mutable std::mutex m_mutex;
    StoreData m_data;
    std::optional<StoreData> m_transactionSnapshot;
};

}  // namespace LanMonitor
