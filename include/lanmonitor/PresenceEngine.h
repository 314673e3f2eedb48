/**
 * @file PresenceEngine.h
 * @brief Periodic discovery, enrichment and presence reconciliation against the device registry
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "Device.h"
#include "DeviceStore.h"
#include "EventBus.h"
#include "HostEnricher.h"
#include "MergePolicy.h"
#include "SubnetDiscovery.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace LanMonitor {

struct PresenceOptions {
    std::chrono::seconds scanInterval{SCAN_INTERVAL_S};
    uint32_t offlineGraceScans = OFFLINE_GRACE_SCANS;
    std::string defaultSubnet;        ///< empty = auto-detect
    std::string interfaceName;
    bool deepScan = true;             ///< used by the periodic loop

    /// Enrichment time box: max(DEEP_SCAN_MIN_TIMEOUT_S, interval / 2).
    std::chrono::milliseconds deepScanTimeout() const;
};

/**
 * @class PresenceEngine
 * @brief Drives one reconciliation cycle at a time
 *
 * Per cycle:
 * 1. A scan session is opened and scan_started is published.
 * 2. The subnet is discovered; on a deep scan the found hosts are enriched
 *    within deepScanTimeout().
 * 3. Inside one store transaction, known devices that were not seen have
 *    their missed-scan counter advanced (online devices only). Reaching the
 *    grace threshold triggers a synchronous verification; a failed
 *    verification marks the device offline with a "disconnected" event.
 * 4. Seen devices are merged with MergePolicy, reset to online, and get
 *    "connected" / "ip_changed" events as appropriate; unseen MACs become
 *    new, unknown devices.
 * 5. The session is completed and the transaction committed, then the
 *    queued device notifications and scan_completed are published.
 *
 * Any exception in steps 2 to 5 rolls the transaction back, marks the
 * session failed, publishes scan_failed and is rethrown to the caller.
 */
class PresenceEngine {
public:
    /**
     * @param enricher May be null; deep scans then skip enrichment
     */
    PresenceEngine(std::shared_ptr<SubnetDiscovery> discovery,
                   std::shared_ptr<HostEnricher> enricher,
                   std::shared_ptr<DeviceStore> store,
                   std::shared_ptr<EventBus> bus,
                   PresenceOptions options = {});

    ~PresenceEngine();

    // Prevent copying
    PresenceEngine(const PresenceEngine&) = delete;
    PresenceEngine& operator=(const PresenceEngine&) = delete;

    /**
     * @brief Run one cycle now, waiting for any cycle already in progress.
     * @param subnet CIDR to scan; std::nullopt resolves the default subnet
     * @throws std::exception when the cycle failed (after it was recorded)
     */
    ScanResult performScan(const std::optional<std::string>& subnet = std::nullopt, bool deepScan = true);

    /**
     * @brief Start the periodic loop on a background thread.
     * @return false if already running or the thread cannot be started
     */
    bool start();

    /// Stop the loop and wait for the in-flight cycle to finish.
    void stop();

    bool isRunning() const { return m_running.load(); }

    /// Configured subnet, else the detected one, else FALLBACK_SUBNET.
    std::string resolveSubnet(const std::optional<std::string>& requested) const;

    const PresenceOptions& options() const { return m_options; }

    /**
     * @brief Pick the values a cycle will merge for one discovered host.
     *
     * hostname: enrichment primary hostname, else discovery hostname.
     * vendor: enrichment manufacturer, else enrichment vendor, else discovery vendor.
     * friendly name: mDNS friendly name, else first enrichment hostname.
     * services: first MAX_STORED_SERVICES mDNS service strings as a JSON array.
     */
    static DeviceObservation selectBestFields(const DiscoveredHost& host, const HostEnrichment* enrichment);

private:
    struct PendingEvent {
        std::string type;
        nlohmann::json payload;
    };

    ScanResult runCycle(const std::string& subnet, bool deepScan, const ScanSession& session);

    std::vector<HostEnrichment> enrichHosts(const std::vector<DiscoveredHost>& hosts);

    void scanLoop();

    std::shared_ptr<SubnetDiscovery> m_discovery;
    std::shared_ptr<HostEnricher> m_enricher;
    std::shared_ptr<DeviceStore> m_store;
    std::shared_ptr<EventBus> m_bus;
    PresenceOptions m_options;

    std::mutex m_scanMutex;            ///< one cycle at a time

    std::atomic<bool> m_running;
    std::atomic<bool> m_stopRequested;
    std::mutex m_stopCvMutex;
    std::condition_variable m_stopCv;
    std::thread m_loopThread;
};

}  // namespace LanMonitor
