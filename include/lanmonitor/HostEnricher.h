/**
 * @file HostEnricher.h
 * @brief Bounded-concurrency, time-boxed multi-protocol enrichment of known hosts
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "HostEnrichment.h"
#include "ServiceCache.h"
#include "VendorLookup.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace LanMonitor {

struct EnrichmentOptions {
    size_t hostConcurrency = HOST_CONCURRENCY;
    std::chrono::milliseconds probeTimeout{PROBE_TIMEOUT_MS};
    uint32_t hostTimeoutMultiplier = HOST_TIMEOUT_MULTIPLIER;

    std::chrono::milliseconds hostTimeout() const { return probeTimeout * hostTimeoutMultiplier; }
};

/**
 * @class ProbeSlots
 * @brief Counting gate on hosts whose probes are still running
 *
 * A slot is taken before a host's probes start and given back only when the
 * last of them has returned, even if the host's deadline passed long before.
 */
class ProbeSlots {
public:
    explicit ProbeSlots(size_t count);

    // Prevent copying
    ProbeSlots(const ProbeSlots&) = delete;
    ProbeSlots& operator=(const ProbeSlots&) = delete;

    /// @return false if no slot freed up within wait
    bool acquireFor(std::chrono::milliseconds wait);
    void release();

    size_t available() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_free;
};

/**
 * @class HostEnricher
 * @brief Enriches a caller-supplied set of hosts; never discovers new ones
 *
 * One enrichment batch:
 * 1. The external DNS-SD browse runs once for all targets. When it yields
 *    nothing, the embedded fallback browse runs instead and its records are
 *    placed in the shared ServiceCache for the duration of the batch.
 * 2. Up to hostConcurrency workers take hosts from a queue. Each host runs
 *    its DNS, port, SSDP, NetBIOS and HTTP probes (and the mDNS probe when the
 *    external browse had nothing for it) concurrently, time-boxed by
 *    hostTimeout(). Probes that miss the deadline contribute nothing, but
 *    the host keeps its ProbeSlots slot until they return, so abandoned
 *    probes count against hostConcurrency in this and later batches.
 * 3. Probe results are merged in a fixed order and the device class is
 *    derived when mDNS did not already provide one.
 *
 * Worker and probe threads co-own their state, so a batch or host deadline
 * never leaves a thread pointing at freed memory.
 */
class HostEnricher {
public:
    HostEnricher(std::shared_ptr<HostProbes> probes,
                 std::shared_ptr<ServiceCache> cache,
                 std::shared_ptr<const VendorLookup> vendors,
                 EnrichmentOptions options = {});

    // Prevent copying
    HostEnricher(const HostEnricher&) = delete;
    HostEnricher& operator=(const HostEnricher&) = delete;

    /**
     * @brief Enrich targets.
     * @param batchTimeout Hosts not finished by then are left out
     * @return One record per finished host, in target order
     */
    std::vector<HostEnrichment> enrich(const std::vector<EnrichmentTarget>& targets,
                                       std::optional<std::chrono::milliseconds> batchTimeout = std::nullopt);

    const EnrichmentOptions& options() const { return m_options; }

    /// Hosts that may start probing right now.
    size_t freeProbeSlots() const { return m_slots->available(); }

    //=========================================================================
    // Merge steps (exposed for tests)
    //=========================================================================

    /// Seed a record with the aggregated DNS-SD data for its address.
    static void applyMdnsInfo(const HostMdnsInfo& mdns, HostEnrichment& info);

    /// Fold probe output into a record: DNS, mDNS, SSDP, NetBIOS, then HTTP.
    static void mergeProbeResults(const HostProbeResults& results, HostEnrichment& info);

    /// mDNS probe result derived from cached service records.
    static MdnsProbeResult fromServiceRecords(const std::vector<ServiceRecord>& records);

private:
    std::shared_ptr<HostProbes> m_probes;
    std::shared_ptr<ServiceCache> m_cache;
    std::shared_ptr<const VendorLookup> m_vendors;
    EnrichmentOptions m_options;
    std::shared_ptr<ProbeSlots> m_slots;
};

}  // namespace LanMonitor
