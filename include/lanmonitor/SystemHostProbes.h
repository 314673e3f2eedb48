/**
 * @file SystemHostProbes.h
 * @brief Socket and subprocess implementation of HostProbes
 */

#pragma once

#include "HostEnrichment.h"
#include "MdnsFallbackBrowser.h"
#include "MdnsResolver.h"

#include <string>

namespace LanMonitor {

class SystemHostProbes final : public HostProbes {
public:
    /// @param interfaceName Restrict mDNS traffic to this interface when non-empty
    explicit SystemHostProbes(std::string interfaceName = {});

    std::vector<std::string> resolveNames(const std::string& ip) override;
    std::vector<int> scanPorts(const std::string& ip, std::chrono::milliseconds timeout) override;
    std::optional<SsdpResult> probeSsdp(const std::string& ip, std::chrono::milliseconds timeout) override;
    std::optional<std::string> probeNetbios(const std::string& ip, std::chrono::milliseconds timeout) override;
    std::optional<HttpFingerprint> probeHttp(const std::string& ip, std::chrono::milliseconds timeout) override;
    MdnsHostMap browseMdns(const std::set<std::string>& targets) override;
    ServiceRecordMap browseFallback(const std::set<std::string>& targets) override;
    std::vector<std::string> mdnsReverseQuery(const std::string& ip,
                                              std::chrono::milliseconds timeout) override;

private:
    MdnsResolver m_resolver;
    MdnsFallbackBrowser m_fallback;
};

}  // namespace LanMonitor
