/**
 * @file DeviceStore.h
 * @brief Device registry interface consumed by the presence engine
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "Device.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace LanMonitor {

/**
 * @brief Registry failure; code is one of ErrorCodes::STORE_*.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(const char* code, const std::string& message)
        : std::runtime_error(message)
        , m_code(code)
    {
    }

    const char* code() const { return m_code; }

private:
    const char* m_code;
};

/**
 * @brief Known-device registry, event history and scan session log.
 *
 * Mutations made between beginTransaction() and commit() become durable
 * together; rollback() discards them. Outside a transaction every mutation
 * is durable on return. All methods throw StoreError on failure.
 */
class DeviceStore {
public:
    virtual ~DeviceStore() = default;

    virtual std::vector<Device> listAllDevices() = 0;

    virtual std::optional<Device> findByMac(const std::string& mac) = 0;

    /**
     * @brief Insert (id == 0) or replace (id != 0) a device.
     * @return The stored device with its id assigned
     * @throws StoreError on a duplicate MAC, an unknown id or a MAC change
     */
    virtual Device upsert(const Device& device) = 0;

    /// Append a history event; its id is assigned.
    virtual ScanEvent appendEvent(const ScanEvent& event) = 0;

    /// Create a session in state "running", started now.
    virtual ScanSession openSession(const std::string& subnet, const std::string& scanMethod) = 0;

    /// Set the terminal status, counts and completion time of a session.
    virtual void completeSession(int64_t sessionId,
                                 const std::string& status,
                                 const SessionCounts& counts,
                                 const std::optional<std::string>& errorMessage) = 0;

    virtual void beginTransaction() = 0;
    virtual void commit() = 0;

    /// Discard uncommitted mutations; no-op outside a transaction.
    virtual void rollback() = 0;
};

}  // namespace LanMonitor
