/**
 * @file PresenceEngine.cpp
 * @brief Periodic discovery, enrichment and presence reconciliation against the device registry
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/PresenceEngine.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/ErrorCodes.h"
#include "lanmonitor/NetUtils.h"
#include "lanmonitor/ThreadSafeLog.h"
#include "lanmonitor/TimeUtils.h"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <system_error>

namespace LanMonitor {

namespace {
    #define LogPresence(msg) LanMonitor::ThreadSafeLog::log(msg)

constexpr const char* METHOD_DEEP = "arp+enhanced";
constexpr const char* METHOD_BASIC = "arp";

nlohmann::json optionalToJson(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

/// Error text stored in a failed session: "<code>: <message>".
std::string describeFailure(const std::exception& e) {
    const char* code = ErrorCodes::SCAN_INTERNAL_ERROR;
    if (const auto* storeError = dynamic_cast<const StoreError*>(&e)) {
        code = storeError->code();
    } else if (dynamic_cast<const std::invalid_argument*>(&e) != nullptr) {
        code = ErrorCodes::SCAN_INVALID_SUBNET;
    }
    return std::string(code) + ": " + e.what();
}

ScanEvent makeEvent(const Device& device, const char* type, const std::string& scanMethod) {
    ScanEvent event;
    event.deviceId = device.id;
    event.eventType = type;
    event.ipAddress = device.ipAddress;
    event.timestamp = nowIso8601();
    event.scanMethod = scanMethod;
    return event;
}

}  // namespace

//=============================================================================
// PresenceOptions
//=============================================================================

std::chrono::milliseconds PresenceOptions::deepScanTimeout() const {
    const auto half = std::chrono::duration_cast<std::chrono::milliseconds>(scanInterval) / 2;
    return std::max(std::chrono::milliseconds(DEEP_SCAN_MIN_TIMEOUT_S * 1000), half);
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

PresenceEngine::PresenceEngine(std::shared_ptr<SubnetDiscovery> discovery,
                               std::shared_ptr<HostEnricher> enricher,
                               std::shared_ptr<DeviceStore> store,
                               std::shared_ptr<EventBus> bus,
                               PresenceOptions options)
    : m_discovery(std::move(discovery))
    , m_enricher(std::move(enricher))
    , m_store(std::move(store))
    , m_bus(std::move(bus))
    , m_options(std::move(options))
    , m_running(false)
    , m_stopRequested(false)
{
    if (!m_discovery || !m_store) {
        throw std::invalid_argument("PresenceEngine requires discovery and a device store");
    }
    if (!m_bus) {
        m_bus = std::make_shared<EventBus>();
    }
    if (m_options.offlineGraceScans == 0) {
        m_options.offlineGraceScans = 1;
    }
}

PresenceEngine::~PresenceEngine() {
    stop();
}

//=============================================================================
// Periodic loop
//=============================================================================

bool PresenceEngine::start() {
    if (m_running.load()) {
        return false;
    }

    m_running = true;
    m_stopRequested = false;

    try {
        m_loopThread = std::thread(&PresenceEngine::scanLoop, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("[PresenceEngine] Cannot start scan loop: " << e.what());
        m_running = false;
        return false;
    }

    LOG_INFO("[PresenceEngine] Scan loop started (interval " << m_options.scanInterval.count() << "s)");
    return true;
}

void PresenceEngine::stop() {
    if (!m_running.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_stopCvMutex);
        m_stopRequested = true;
    }
    m_stopCv.notify_all();

    if (m_loopThread.joinable()) {
        m_loopThread.join();
    }
    m_running = false;
    LOG_INFO("[PresenceEngine] Scan loop stopped");
}

void PresenceEngine::scanLoop() {
    while (!m_stopRequested.load()) {
        try {
            performScan(std::nullopt, m_options.deepScan);
        } catch (const std::exception& e) {
            // Already recorded on the session; the next cycle runs normally.
            LOG_ERROR("[PresenceEngine] Scan cycle failed: " << e.what());
        }

        // The interval starts after the cycle completes.
        std::unique_lock<std::mutex> waitLock(m_stopCvMutex);
        m_stopCv.wait_for(waitLock, m_options.scanInterval,
                          [this]() { return m_stopRequested.load(); });
    }
}

//=============================================================================
// Scan cycle
//=============================================================================

std::string PresenceEngine::resolveSubnet(const std::optional<std::string>& requested) const {
    return NetUtils::resolveScanSubnet(requested, m_options.defaultSubnet, m_options.interfaceName);
}

ScanResult PresenceEngine::performScan(const std::optional<std::string>& subnet, bool deepScan) {
    std::lock_guard<std::mutex> scanLock(m_scanMutex);

    const std::string target = resolveSubnet(subnet);
    const ScanSession session = m_store->openSession(target, deepScan ? METHOD_DEEP : METHOD_BASIC);

    LOG_INFO("[PresenceEngine] Scan " << session.id << " started: " << target
             << (deepScan ? " (deep)" : ""));
    LogPresence("Scan session " + std::to_string(session.id) + " started for " + target);
    m_bus->publish(EventType::SCAN_STARTED, {{"session_id", session.id}, {"subnet", target}});

    try {
        return runCycle(target, deepScan, session);
    } catch (const std::exception& e) {
        const std::string error = describeFailure(e);
        LOG_ERROR("[PresenceEngine] Scan " << session.id << " failed: " << error);
        LogPresence("Scan session " + std::to_string(session.id) + " failed: " + error);

        try {
            m_store->rollback();
        } catch (const std::exception& rollbackError) {
            LOG_ERROR("[PresenceEngine] Rollback failed: " << rollbackError.what());
        }
        try {
            m_store->completeSession(session.id, SessionStatus::FAILED, SessionCounts{}, error);
        } catch (const std::exception& sessionError) {
            LOG_ERROR("[PresenceEngine] Cannot record failed session: " << sessionError.what());
        }

        m_bus->publish(EventType::SCAN_FAILED, {{"session_id", session.id}, {"error", error}});
        throw;
    }
}

ScanResult PresenceEngine::runCycle(const std::string& subnet, bool deepScan, const ScanSession& session) {
    m_store->beginTransaction();

    const std::vector<DiscoveredHost> discovered = m_discovery->discover(subnet);
    LOG_INFO("[PresenceEngine] Discovery found " << discovered.size() << " host(s)");

    std::map<std::string, HostEnrichment> enrichmentByIp;
    if (deepScan && !discovered.empty() && m_enricher) {
        for (auto& e : enrichHosts(discovered)) {
            const std::string ip = e.ip;
            enrichmentByIp.emplace(ip, std::move(e));
        }
    }

    std::vector<Device> known;
    try {
        known = m_store->listAllDevices();
    } catch (const StoreError& e) {
        throw StoreError(ErrorCodes::SCAN_REGISTRY_LOAD, std::string("Cannot load device registry: ") + e.what());
    }

    std::map<std::string, Device> existing;
    for (auto& d : known) {
        existing.emplace(d.macAddress, std::move(d));
    }

    std::set<std::string> currentMacs;
    for (const auto& h : discovered) {
        currentMacs.insert(h.mac);
    }

    SessionCounts counts;
    counts.devicesFound = static_cast<int>(discovered.size());
    std::vector<PendingEvent> pending;
    const std::string now = nowIso8601();

    //-------------------------------------------------------------------------
    // Known devices not seen this cycle
    //-------------------------------------------------------------------------
    for (auto& pair : existing) {
        Device& device = pair.second;
        if (currentMacs.count(device.macAddress) > 0 || !device.isOnline) {
            continue;
        }

        device.missedScans += 1;
        device.updatedAt = now;

        if (static_cast<uint32_t>(device.missedScans) < m_options.offlineGraceScans) {
            LOG_INFO("[PresenceEngine] " << device.ipAddress << ": " << device.label() << " not seen ("
                     << device.missedScans << "/" << m_options.offlineGraceScans << ")");
            m_store->upsert(device);
            continue;
        }

        LogPresence("Verifying " + device.ipAddress + " (" + device.label() + ") after " +
                    std::to_string(device.missedScans) + " missed scans");
        if (m_discovery->verifyHostOnline(device.ipAddress, device.macAddress)) {
            device.missedScans = 0;
            LOG_INFO("[PresenceEngine] " << device.ipAddress << ": " << device.label() << " verified online");
            m_store->upsert(device);
            continue;
        }

        device.isOnline = false;
        device.missedScans = 0;
        LOG_INFO("[PresenceEngine] " << device.ipAddress << ": " << device.label() << " offline");
        LogPresence("Device " + device.macAddress + " (" + device.ipAddress + ") went offline");
        m_store->upsert(device);
        m_store->appendEvent(makeEvent(device, ScanEventType::DISCONNECTED, METHOD_BASIC));
        pending.push_back({EventType::DEVICE_DISCONNECTED,
                           {{"device_id", device.id},
                            {"mac_address", device.macAddress},
                            {"hostname", optionalToJson(device.hostnameOrCustomName())}}});
    }

    //-------------------------------------------------------------------------
    // Devices seen this cycle
    //-------------------------------------------------------------------------
    for (const auto& host : discovered) {
        counts.devicesOnline += 1;

        const auto enriched = enrichmentByIp.find(host.ip);
        const DeviceObservation observation =
            selectBestFields(host, enriched == enrichmentByIp.end() ? nullptr : &enriched->second);

        const auto found = existing.find(host.mac);
        if (found != existing.end()) {
            Device& device = found->second;
            const std::string oldIp = device.ipAddress;
            const bool wasOnline = device.isOnline;

            device.ipAddress = host.ip;
            device.isOnline = true;
            device.missedScans = 0;
            device.lastSeen = now;
            device.updatedAt = now;
            MergePolicy::apply(device, observation);
            if (!m_options.interfaceName.empty() && !device.networkInterface) {
                device.networkInterface = m_options.interfaceName;
            }
            m_store->upsert(device);

            if (!wasOnline) {
                ScanEvent event = makeEvent(device, ScanEventType::CONNECTED, host.method);
                event.responseTime = host.responseTimeMs;
                m_store->appendEvent(event);
                pending.push_back({EventType::DEVICE_CONNECTED,
                                   {{"device_id", device.id},
                                    {"mac_address", device.macAddress},
                                    {"ip_address", device.ipAddress},
                                    {"hostname", optionalToJson(device.hostnameOrCustomName())}}});
            }

            if (!oldIp.empty() && oldIp != host.ip) {
                ScanEvent event = makeEvent(device, ScanEventType::IP_CHANGED, host.method);
                event.oldIpAddress = oldIp;
                m_store->appendEvent(event);
                pending.push_back({EventType::DEVICE_IP_CHANGED,
                                   {{"device_id", device.id},
                                    {"mac_address", device.macAddress},
                                    {"old_ip", oldIp},
                                    {"new_ip", host.ip}}});
                LogPresence("Device " + device.macAddress + " moved from " + oldIp + " to " + host.ip);
            }
            continue;
        }

        counts.devicesNew += 1;
        Device device = MergePolicy::createDevice(observation);
        device.firstSeen = now;
        device.lastSeen = now;
        device.createdAt = now;
        device.updatedAt = now;
        if (!m_options.interfaceName.empty()) {
            device.networkInterface = m_options.interfaceName;
        }
        device = m_store->upsert(device);

        ScanEvent event = makeEvent(device, ScanEventType::CONNECTED, host.method);
        event.responseTime = host.responseTimeMs;
        m_store->appendEvent(event);
        pending.push_back({EventType::DEVICE_NEW,
                           {{"device_id", device.id},
                            {"mac_address", device.macAddress},
                            {"ip_address", device.ipAddress},
                            {"hostname", optionalToJson(device.hostname)},
                            {"vendor", optionalToJson(device.vendor)}}});
        LogPresence("New device " + device.macAddress + " at " + device.ipAddress);
    }

    m_store->completeSession(session.id, SessionStatus::COMPLETED, counts, std::nullopt);
    try {
        m_store->commit();
    } catch (const StoreError& e) {
        throw StoreError(ErrorCodes::SCAN_PERSIST, std::string("Cannot commit scan results: ") + e.what());
    }

    // Notifications go out only once the changes they describe are durable.
    for (const auto& p : pending) {
        m_bus->publish(p.type, p.payload);
    }

    ScanResult result;
    result.sessionId = session.id;
    result.status = SessionStatus::COMPLETED;
    result.counts = counts;
    result.subnet = subnet;

    LOG_INFO("[PresenceEngine] Scan " << session.id << " completed: " << counts.devicesFound << " found, "
             << counts.devicesOnline << " online, " << counts.devicesNew << " new");
    LogPresence("Scan session " + std::to_string(session.id) + " completed");
    m_bus->publish(EventType::SCAN_COMPLETED, result.toJson());
    return result;
}

std::vector<HostEnrichment> PresenceEngine::enrichHosts(const std::vector<DiscoveredHost>& hosts) {
    std::vector<EnrichmentTarget> targets;
    targets.reserve(hosts.size());
    for (const auto& h : hosts) {
        targets.push_back(EnrichmentTarget{h.ip, h.mac, h.vendor});
    }

    try {
        return m_enricher->enrich(targets, m_options.deepScanTimeout());
    } catch (const std::exception& e) {
        LOG_WARNING("[PresenceEngine] Enrichment failed, continuing with discovery data: " << e.what());
        LogPresence(std::string("Enrichment failed: ") + e.what());
    }
    return {};
}

//=============================================================================
// Field selection
//=============================================================================

DeviceObservation PresenceEngine::selectBestFields(const DiscoveredHost& host, const HostEnrichment* enrichment) {
    DeviceObservation obs;
    obs.macAddress = host.mac;
    obs.ipAddress = host.ip;
    obs.hostname = host.hostname;
    obs.vendor = host.vendor;
    obs.responseTimeMs = host.responseTimeMs;
    obs.scanMethod = host.method;

    if (!enrichment) {
        return obs;
    }

    if (auto primary = enrichment->primaryHostname()) {
        obs.hostname = primary;
    }

    if (enrichment->manufacturer && !enrichment->manufacturer->empty()) {
        obs.vendor = enrichment->manufacturer;
    } else if (enrichment->vendor && !enrichment->vendor->empty()) {
        obs.vendor = enrichment->vendor;
    }

    obs.manufacturer = enrichment->manufacturer;
    obs.model = enrichment->model;
    obs.deviceType = enrichment->deviceClass;

    if (enrichment->friendlyName && !enrichment->friendlyName->empty()) {
        obs.friendlyName = enrichment->friendlyName;
    } else if (!enrichment->hostnames.empty()) {
        obs.friendlyName = enrichment->hostnames.front();
    }

    if (!enrichment->openPorts.empty()) {
        obs.openPorts = nlohmann::json(enrichment->openPorts).dump();
    }
    if (!enrichment->mdnsServices.empty()) {
        const size_t count = std::min(enrichment->mdnsServices.size(), MAX_STORED_SERVICES);
        const std::vector<std::string> kept(enrichment->mdnsServices.begin(),
                                            enrichment->mdnsServices.begin() + static_cast<std::ptrdiff_t>(count));
        obs.services = nlohmann::json(kept).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    return obs;
}

}  // namespace LanMonitor
