/**
 * @file HostEnrichment.h
 * @brief Per-host enrichment records and the probe interface they are built from
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "DeviceClassifier.h"
#include "HttpProbe.h"
#include "MdnsResolver.h"
#include "ServiceCache.h"
#include "SsdpProbe.h"

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace LanMonitor {

//=============================================================================
// EnrichmentTarget Structure
//=============================================================================

/**
 * @struct EnrichmentTarget
 * @brief A host already known to be present, handed to the enricher
 */
struct EnrichmentTarget {
    std::string ip;
    std::optional<std::string> mac;
    std::optional<std::string> vendor;    ///< from discovery, if any
};

//=============================================================================
// HostEnrichment Structure
//=============================================================================

/**
 * @struct HostEnrichment
 * @brief Everything learned about one address during one enrichment batch
 *
 * hostnames is ordered by preference: the mDNS friendly name (when known)
 * comes first, then names in the order the probes reported them.
 */
struct HostEnrichment {
    std::string ip;
    std::optional<std::string> mac;
    std::vector<std::string> hostnames;
    std::optional<std::string> vendor;
    std::optional<std::string> manufacturer;
    std::optional<std::string> model;
    std::optional<std::string> deviceClass;
    std::optional<std::string> netbiosName;
    std::optional<std::string> friendlyName;     ///< mDNS friendly name only
    std::vector<std::string> services;           ///< coarse names of open ports
    std::vector<int> openPorts;
    std::vector<std::string> mdnsServices;       ///< "<name> (<type>)"
    std::map<std::string, std::string> ssdpInfo;
    std::map<std::string, std::string> httpInfo;
    std::map<std::string, std::string> upnpInfo;

    /// Append a hostname unless empty or already present.
    void addHostname(const std::string& name);

    /// First non-".local" hostname, else the first hostname, else the NetBIOS name.
    std::optional<std::string> primaryHostname() const;

    ClassificationSignals signals() const;
};

//=============================================================================
// Probe results
//=============================================================================

/**
 * @struct MdnsProbeResult
 * @brief What the per-host mDNS probe found in the batch cache or by unicast query
 */
struct MdnsProbeResult {
    std::vector<std::string> services;
    std::vector<std::string> hostnames;
    std::optional<std::string> model;
    std::optional<std::string> manufacturer;
};

/**
 * @struct HostProbeResults
 * @brief Raw output of the per-host probes; unset means "no information"
 */
struct HostProbeResults {
    std::vector<std::string> dnsNames;
    std::vector<int> openPorts;
    std::optional<SsdpResult> ssdp;
    std::optional<std::string> netbiosName;
    std::optional<HttpFingerprint> http;
    std::optional<MdnsProbeResult> mdns;
};

//=============================================================================
// HostProbes Interface
//=============================================================================

/**
 * @brief Network access used by HostEnricher.
 *
 * Every per-host method is bounded by its timeout argument and may throw
 * std::exception; the enricher treats a throw as "no information".
 * Implementations must be safe to call from several threads.
 */
class HostProbes {
public:
    virtual ~HostProbes() = default;

    /// Reverse DNS name plus the canonical name it resolves to, when different.
    virtual std::vector<std::string> resolveNames(const std::string& ip) = 0;

    virtual std::vector<int> scanPorts(const std::string& ip, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<SsdpResult> probeSsdp(const std::string& ip, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<std::string> probeNetbios(const std::string& ip, std::chrono::milliseconds timeout) = 0;

    virtual std::optional<HttpFingerprint> probeHttp(const std::string& ip, std::chrono::milliseconds timeout) = 0;

    /// External DNS-SD browse restricted to targets.
    virtual MdnsHostMap browseMdns(const std::set<std::string>& targets) = 0;

    /// Embedded multicast browse restricted to targets.
    virtual ServiceRecordMap browseFallback(const std::set<std::string>& targets) = 0;

    /// Unicast reverse-PTR query to ip:5353; ".local" names found.
    virtual std::vector<std::string> mdnsReverseQuery(const std::string& ip,
                                                      std::chrono::milliseconds timeout) = 0;
};

}  // namespace LanMonitor
