/**
 * @file MdnsFallbackBrowser.h
 * @brief Embedded multicast DNS-SD browse used when the external browser yields nothing
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "DnsMessage.h"
#include "ServiceCache.h"

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace LanMonitor {

/**
 * @class MdnsFallbackBrowser
 * @brief One-shot PTR browse for a fixed list of service types
 *
 * A single query asking for every type in serviceTypes() is multicast, replies
 * are collected for the listen window, then PTR, SRV, TXT and A records are
 * joined into ServiceRecords keyed by address. Only target addresses are kept.
 *
 * All methods block for at most their timeout and never throw.
 */
class MdnsFallbackBrowser {
public:
    /// @param interfaceName Send and listen on this interface (empty = system default)
    explicit MdnsFallbackBrowser(std::string interfaceName = {});

    /// Service types queried by browse(), fully qualified ("_http._tcp.local.").
    static const std::vector<std::string>& serviceTypes();

    ServiceRecordMap browse(const std::set<std::string>& targets,
                            std::chrono::milliseconds listenWindow =
                                std::chrono::milliseconds(MDNS_FALLBACK_LISTEN_MS));

    /**
     * @brief Ask one host directly for the PTR name of its own address.
     * @return ".local" names found in the reply
     */
    static std::vector<std::string> reverseQuery(const std::string& ip,
                                                 std::chrono::milliseconds timeout);

    //=========================================================================
    // Joining (exposed for tests)
    //=========================================================================

    /**
     * @brief Join records from any number of replies into per-address services.
     *
     * Instances are taken from PTR targets and SRV owners; an instance without
     * an SRV record or without an A record for the SRV host is dropped.
     */
    static ServiceRecordMap joinRecords(const std::vector<DnsRecord>& records,
                                        const std::set<std::string>& targets);

    /// Host names ending in ".local" carried by a reply (PTR targets, SRV hosts, A owners).
    static std::vector<std::string> localNamesFrom(const DnsMessage& message);

private:
    std::string m_interfaceName;
};

}  // namespace LanMonitor
