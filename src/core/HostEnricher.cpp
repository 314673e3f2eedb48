/**
 * @file HostEnricher.cpp
 * @brief Bounded-concurrency, time-boxed multi-protocol enrichment of known hosts
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/HostEnricher.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/PortProbe.h"
#include "lanmonitor/StringUtils.h"
#include "lanmonitor/ThreadSafeLog.h"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace LanMonitor {

namespace {
    #define LogEnrichment(msg) LanMonitor::ThreadSafeLog::log(msg)

constexpr auto SLOT_POLL_INTERVAL = std::chrono::milliseconds(50);

template <typename T>
void appendUnique(std::vector<T>& values, const T& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

void fillIfEmpty(std::optional<std::string>& field, const std::optional<std::string>& value) {
    if ((!field || field->empty()) && value && !value->empty()) {
        field = value;
    }
}

//=============================================================================
// Per-host probe fan-out
//=============================================================================

/// Owns one ProbeSlots slot; gives it back on destruction.
class SlotLease {
public:
    explicit SlotLease(std::shared_ptr<ProbeSlots> slots) : m_slots(std::move(slots)) {}
    SlotLease(SlotLease&& other) noexcept : m_slots(std::move(other.m_slots)) {}
    ~SlotLease() {
        if (m_slots) {
            m_slots->release();
        }
    }

    SlotLease(const SlotLease&) = delete;
    SlotLease& operator=(const SlotLease&) = delete;
    SlotLease& operator=(SlotLease&&) = delete;

private:
    std::shared_ptr<ProbeSlots> m_slots;
};

// Shared by the host and each of its probe threads. It dies with the last
// of them, which is when the host's slot is returned.
struct ProbeState {
    explicit ProbeState(SlotLease slot) : lease(std::move(slot)) {}

    std::mutex mutex;
    std::condition_variable cv;
    size_t remaining = 0;
    HostProbeResults results;
    SlotLease lease;
};

/**
 * @brief Run probe() on a detached thread and hand its value to store().
 *
 * A probe that throws stores nothing. store() runs under the state mutex.
 */
template <typename Probe, typename Store>
void launchProbe(const std::shared_ptr<ProbeState>& state, Probe probe, Store store) {
    try {
        std::thread([state, probe, store]() {
            bool ok = false;
            decltype(probe()) value{};
            try {
                value = probe();
                ok = true;
            } catch (const std::exception&) {
                // Transient probe failure: no information
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (ok) {
                    store(state->results, std::move(value));
                }
                --state->remaining;
            }
            state->cv.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        LOG_WARNING("[HostEnricher] Cannot start probe: " << e.what());
        std::lock_guard<std::mutex> lock(state->mutex);
        --state->remaining;
    }
}

struct HostContext {
    EnrichmentTarget target;
    std::optional<HostMdnsInfo> mdns;
};

struct Shared {
    std::shared_ptr<ProbeSlots> slots;
    std::shared_ptr<HostProbes> probes;
    std::shared_ptr<ServiceCache> cache;
    std::shared_ptr<const VendorLookup> vendors;
    EnrichmentOptions options;
};

HostEnrichment enrichOne(const HostContext& ctx, const Shared& shared, SlotLease slot) {
    auto state = std::make_shared<ProbeState>(std::move(slot));

    HostEnrichment info;
    info.ip = ctx.target.ip;
    info.mac = ctx.target.mac;
    info.vendor = ctx.target.vendor;
    if ((!info.vendor || info.vendor->empty()) && info.mac && shared.vendors) {
        info.vendor = shared.vendors->lookup(*info.mac);
    }

    if (ctx.mdns) {
        HostEnricher::applyMdnsInfo(*ctx.mdns, info);
    }

    const std::string ip = info.ip;
    const auto timeout = shared.options.probeTimeout;
    const auto probes = shared.probes;

    state->remaining = ctx.mdns ? 5 : 6;

    launchProbe(state,
                [probes, ip]() { return probes->resolveNames(ip); },
                [](HostProbeResults& r, std::vector<std::string> v) { r.dnsNames = std::move(v); });
    launchProbe(state,
                [probes, ip, timeout]() { return probes->scanPorts(ip, timeout); },
                [](HostProbeResults& r, std::vector<int> v) { r.openPorts = std::move(v); });
    launchProbe(state,
                [probes, ip, timeout]() { return probes->probeSsdp(ip, timeout); },
                [](HostProbeResults& r, std::optional<SsdpResult> v) { r.ssdp = std::move(v); });
    launchProbe(state,
                [probes, ip, timeout]() { return probes->probeNetbios(ip, timeout); },
                [](HostProbeResults& r, std::optional<std::string> v) { r.netbiosName = std::move(v); });
    launchProbe(state,
                [probes, ip, timeout]() { return probes->probeHttp(ip, timeout); },
                [](HostProbeResults& r, std::optional<HttpFingerprint> v) { r.http = std::move(v); });

    if (!ctx.mdns) {
        const auto cache = shared.cache;
        launchProbe(state,
                    [probes, cache, ip, timeout]() {
                        std::optional<std::vector<ServiceRecord>> cached;
                        if (cache) {
                            cached = cache->lookup(ip);
                        }
                        if (cached) {
                            return HostEnricher::fromServiceRecords(*cached);
                        }
                        MdnsProbeResult result;
                        result.hostnames = probes->mdnsReverseQuery(ip, timeout);
                        return result;
                    },
                    [](HostProbeResults& r, MdnsProbeResult v) { r.mdns = std::move(v); });
    }

    HostProbeResults results;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        const bool done = state->cv.wait_for(lock, shared.options.hostTimeout(),
                                             [&state] { return state->remaining == 0; });
        if (!done) {
            LOG_DEBUG("[HostEnricher] " << ip << ": " << state->remaining
                      << " probe(s) abandoned at the host deadline");
        }
        results = state->results;
    }

    HostEnricher::mergeProbeResults(results, info);
    if (!info.deviceClass || info.deviceClass->empty()) {
        info.deviceClass = DeviceClassifier::classify(info.signals());
    }
    return info;
}

//=============================================================================
// Batch worker pool
//=============================================================================

struct BatchState {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<HostContext> hosts;
    std::vector<std::optional<HostEnrichment>> results;
    size_t next = 0;
    size_t finished = 0;
    size_t activeWorkers = 0;
    bool cancelled = false;
};

void workerLoop(const std::shared_ptr<BatchState>& batch, const Shared& shared) {
    for (;;) {
        while (!shared.slots->acquireFor(SLOT_POLL_INTERVAL)) {
            std::lock_guard<std::mutex> lock(batch->mutex);
            if (batch->cancelled) {
                --batch->activeWorkers;
                batch->cv.notify_all();
                return;
            }
        }
        SlotLease slot(shared.slots);

        size_t index = 0;
        {
            std::lock_guard<std::mutex> lock(batch->mutex);
            if (batch->cancelled || batch->next >= batch->hosts.size()) {
                --batch->activeWorkers;
                break;
            }
            index = batch->next++;
        }

        std::optional<HostEnrichment> result;
        try {
            result = enrichOne(batch->hosts[index], shared, std::move(slot));
        } catch (const std::exception& e) {
            LOG_WARNING("[HostEnricher] Enrichment of " << batch->hosts[index].target.ip
                        << " failed: " << e.what());
        }

        {
            std::lock_guard<std::mutex> lock(batch->mutex);
            batch->results[index] = std::move(result);
            ++batch->finished;
        }
        batch->cv.notify_all();
    }
    batch->cv.notify_all();
}

}  // namespace

//=============================================================================
// ProbeSlots
//=============================================================================

ProbeSlots::ProbeSlots(size_t count)
    : m_free(count)
{
}

bool ProbeSlots::acquireFor(std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, wait, [this] { return m_free > 0; })) {
        return false;
    }
    --m_free;
    return true;
}

void ProbeSlots::release() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_free;
    }
    m_cv.notify_one();
}

size_t ProbeSlots::available() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_free;
}

//=============================================================================
// HostEnrichment
//=============================================================================

void HostEnrichment::addHostname(const std::string& name) {
    if (!name.empty()) {
        appendUnique(hostnames, name);
    }
}

std::optional<std::string> HostEnrichment::primaryHostname() const {
    for (const auto& name : hostnames) {
        if (!StringUtils::endsWith(name, ".local")) {
            return name;
        }
    }
    if (!hostnames.empty()) {
        return hostnames.front();
    }
    return netbiosName;
}

ClassificationSignals HostEnrichment::signals() const {
    ClassificationSignals s;
    s.services = services;
    s.mdnsServices = mdnsServices;
    s.openPorts = openPorts;
    s.vendor = vendor.value_or("");
    s.model = model.value_or("");
    s.manufacturer = manufacturer.value_or("");

    auto type = upnpInfo.find("device_type");
    if (type == upnpInfo.end()) {
        type = ssdpInfo.find("device_type");
        if (type != ssdpInfo.end()) {
            s.upnpDeviceType = type->second;
        }
    } else {
        s.upnpDeviceType = type->second;
    }

    const auto server = httpInfo.find("server");
    if (server != httpInfo.end()) {
        s.httpServer = server->second;
    }
    const auto title = httpInfo.find("title");
    if (title != httpInfo.end()) {
        s.httpTitle = title->second;
    }
    return s;
}

//=============================================================================
// HostEnricher
//=============================================================================

HostEnricher::HostEnricher(std::shared_ptr<HostProbes> probes,
                           std::shared_ptr<ServiceCache> cache,
                           std::shared_ptr<const VendorLookup> vendors,
                           EnrichmentOptions options)
    : m_probes(std::move(probes))
    , m_cache(std::move(cache))
    , m_vendors(std::move(vendors))
    , m_options(options)
{
    if (!m_probes) {
        throw std::invalid_argument("HostEnricher requires probes");
    }
    if (!m_cache) {
        m_cache = std::make_shared<ServiceCache>();
    }
    if (m_options.hostConcurrency == 0) {
        m_options.hostConcurrency = 1;
    }
    m_slots = std::make_shared<ProbeSlots>(m_options.hostConcurrency);
}

std::vector<HostEnrichment> HostEnricher::enrich(const std::vector<EnrichmentTarget>& targets,
                                                 std::optional<std::chrono::milliseconds> batchTimeout) {
    if (targets.empty()) {
        return {};
    }

    std::set<std::string> targetIps;
    for (const auto& t : targets) {
        targetIps.insert(t.ip);
    }
    LOG_INFO("[HostEnricher] Enriching " << targetIps.size() << " host(s)");

    // Batch-wide DNS-SD browse; only addresses we were given are kept.
    MdnsHostMap mdns;
    try {
        for (auto& entry : m_probes->browseMdns(targetIps)) {
            if (targetIps.count(entry.first) > 0) {
                mdns.insert(std::move(entry));
            }
        }
    } catch (const std::exception& e) {
        LOG_WARNING("[HostEnricher] mDNS browse failed: " << e.what());
        LogEnrichment(std::string("mDNS browse failed: ") + e.what());
    }

    bool cacheOpened = false;
    if (mdns.empty()) {
        try {
            ServiceRecordMap records;
            for (auto& entry : m_probes->browseFallback(targetIps)) {
                if (targetIps.count(entry.first) > 0) {
                    records.insert(std::move(entry));
                }
            }
            LOG_DEBUG("[HostEnricher] Fallback browse cached " << records.size() << " host(s)");
            m_cache->open(std::move(records));
            cacheOpened = true;
        } catch (const std::exception& e) {
            LOG_WARNING("[HostEnricher] Fallback mDNS browse failed: " << e.what());
            LogEnrichment(std::string("Fallback mDNS browse failed: ") + e.what());
        }
    } else {
        LOG_INFO("[HostEnricher] mDNS data for " << mdns.size() << " host(s)");
    }

    const Shared shared{m_slots, m_probes, m_cache, m_vendors, m_options};

    auto batch = std::make_shared<BatchState>();
    batch->hosts.reserve(targets.size());
    for (const auto& t : targets) {
        HostContext ctx{t, std::nullopt};
        const auto it = mdns.find(t.ip);
        if (it != mdns.end()) {
            ctx.mdns = it->second;
        }
        batch->hosts.push_back(std::move(ctx));
    }
    batch->results.resize(batch->hosts.size());

    const size_t workers = std::min(m_options.hostConcurrency, batch->hosts.size());
    for (size_t i = 0; i < workers; ++i) {
        {
            std::lock_guard<std::mutex> lock(batch->mutex);
            ++batch->activeWorkers;
        }
        try {
            std::thread([batch, shared]() { workerLoop(batch, shared); }).detach();
        } catch (const std::system_error& e) {
            LOG_WARNING("[HostEnricher] Cannot start worker: " << e.what());
            std::lock_guard<std::mutex> lock(batch->mutex);
            --batch->activeWorkers;
        }
    }

    std::vector<HostEnrichment> out;
    {
        std::unique_lock<std::mutex> lock(batch->mutex);
        auto allDone = [&batch] {
            return batch->finished == batch->hosts.size() || batch->activeWorkers == 0;
        };
        if (batchTimeout) {
            batch->cv.wait_for(lock, *batchTimeout, allDone);
        } else {
            batch->cv.wait(lock, allDone);
        }
        batch->cancelled = true;

        if (batch->finished < batch->hosts.size()) {
            LOG_WARNING("[HostEnricher] Batch time box reached: " << batch->finished << " of "
                        << batch->hosts.size() << " host(s) finished");
            LogEnrichment("Enrichment batch timed out with " + std::to_string(batch->finished) +
                          " of " + std::to_string(batch->hosts.size()) + " hosts finished");
        }

        for (const auto& result : batch->results) {
            if (result) {
                out.push_back(*result);
            }
        }
    }

    if (cacheOpened) {
        m_cache->close();
    }
    return out;
}

//=============================================================================
// Merge steps
//=============================================================================

void HostEnricher::applyMdnsInfo(const HostMdnsInfo& mdns, HostEnrichment& info) {
    for (const auto& name : mdns.hostnames) {
        info.addHostname(name);
    }

    const std::optional<std::string> friendly = mdns.friendlyName();
    if (friendly && !friendly->empty()) {
        info.friendlyName = friendly;
        if (std::find(info.hostnames.begin(), info.hostnames.end(), *friendly) == info.hostnames.end()) {
            info.hostnames.insert(info.hostnames.begin(), *friendly);
        }
    }

    fillIfEmpty(info.model, mdns.model);
    fillIfEmpty(info.manufacturer, mdns.manufacturer);
    fillIfEmpty(info.deviceClass, mdns.deviceClass);

    for (const auto& service : mdns.serviceStrings()) {
        appendUnique(info.mdnsServices, service);
    }
}

MdnsProbeResult HostEnricher::fromServiceRecords(const std::vector<ServiceRecord>& records) {
    MdnsProbeResult result;
    for (const auto& record : records) {
        appendUnique(result.services, record.describe());

        const auto txt = [&record](const char* key) -> std::optional<std::string> {
            const auto it = record.txt.find(key);
            if (it == record.txt.end() || it->second.empty()) {
                return std::nullopt;
            }
            return it->second;
        };
        if (auto v = txt("model")) {
            result.model = v;
        }
        if (auto v = txt("manufacturer")) {
            result.manufacturer = v;
        }
        if (auto v = txt("md")) {
            result.model = v;
        }
        if (!result.model) {
            result.model = txt("am");
        }

        std::string host = record.hostname;
        while (!host.empty() && host.back() == '.') {
            host.pop_back();
        }
        if (!host.empty()) {
            appendUnique(result.hostnames, host);
        }
    }
    return result;
}

void HostEnricher::mergeProbeResults(const HostProbeResults& results, HostEnrichment& info) {
    // DNS
    for (const auto& name : results.dnsNames) {
        info.addHostname(name);
    }

    // mDNS (only present when no aggregated DNS-SD data existed)
    if (results.mdns) {
        for (const auto& service : results.mdns->services) {
            appendUnique(info.mdnsServices, service);
        }
        fillIfEmpty(info.model, results.mdns->model);
        fillIfEmpty(info.manufacturer, results.mdns->manufacturer);
        for (const auto& name : results.mdns->hostnames) {
            info.addHostname(name);
        }
    }

    // Ports
    for (int port : results.openPorts) {
        appendUnique(info.openPorts, port);
        const std::string service = PortProbe::serviceName(static_cast<uint16_t>(port));
        if (!service.empty()) {
            appendUnique(info.services, service);
        }
    }

    // SSDP / UPnP
    if (results.ssdp) {
        for (const auto& header : results.ssdp->headers) {
            info.ssdpInfo[header.first] = header.second;
        }
        if (results.ssdp->description) {
            const UpnpDescription& desc = *results.ssdp->description;
            if (desc.friendlyName) {
                info.addHostname(*desc.friendlyName);
            }
            fillIfEmpty(info.manufacturer, desc.manufacturer);
            fillIfEmpty(info.model, desc.modelName);
            if (desc.modelDescription) {
                info.upnpInfo["model_description"] = *desc.modelDescription;
            }
            if (desc.deviceType) {
                info.upnpInfo["device_type"] = *desc.deviceType;
                info.ssdpInfo["device_type"] = *desc.deviceType;
            }
        }
    }

    // NetBIOS
    if (results.netbiosName && !results.netbiosName->empty()) {
        info.netbiosName = results.netbiosName;
        info.addHostname(*results.netbiosName);
    }

    // HTTP
    if (results.http) {
        info.httpInfo["url"] = results.http->url;
        if (!results.http->server.empty()) {
            info.httpInfo["server"] = results.http->server;
        }
        if (results.http->title) {
            info.httpInfo["title"] = *results.http->title;
        }
    }
}

}  // namespace LanMonitor
