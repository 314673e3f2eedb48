/**
 * @file ServiceCache.h
 * @brief Per-address cache of service records for one enrichment batch
 */

#pragma once

#include "MdnsResolver.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace LanMonitor {

using ServiceRecordMap = std::map<std::string, std::vector<ServiceRecord>>;

/**
 * @class ServiceCache
 * @brief Read-mostly record cache shared by the per-host probes
 *
 * The orchestrator opens the cache with the result of the batch browse before
 * fanning out, probes only read it, and the orchestrator closes it when the
 * batch ends. A closed cache answers every lookup with std::nullopt.
 *
 * Thread Safety: all methods are thread-safe.
 */
class ServiceCache {
public:
    ServiceCache() = default;

    // Prevent copying
    ServiceCache(const ServiceCache&) = delete;
    ServiceCache& operator=(const ServiceCache&) = delete;

    /// Replace the contents and mark the cache open.
    void open(ServiceRecordMap entries) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries = std::move(entries);
        m_open = true;
    }

    /// Drop the contents.
    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
        m_open = false;
    }

    bool isOpen() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_open;
    }

    std::optional<std::vector<ServiceRecord>> lookup(const std::string& ip) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_open) {
            return std::nullopt;
        }
        const auto it = m_entries.find(ip);
        if (it == m_entries.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries.size();
    }

private:
    mutable std::mutex m_mutex;
    ServiceRecordMap m_entries;
    bool m_open = false;
};

}  // namespace LanMonitor
