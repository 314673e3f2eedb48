/**
 * @file SystemHostProbes.cpp
 * @brief Socket and subprocess implementation of HostProbes
 */

#include "lanmonitor/SystemHostProbes.h"
#include "lanmonitor/NetUtils.h"
#include "lanmonitor/NetbiosProbe.h"
#include "lanmonitor/PortProbe.h"

#include <algorithm>

namespace LanMonitor {

SystemHostProbes::SystemHostProbes(std::string interfaceName)
    : m_resolver(interfaceName)
    , m_fallback(interfaceName)
{
}

std::vector<std::string> SystemHostProbes::resolveNames(const std::string& ip) {
    std::vector<std::string> names;
    const std::optional<std::string> reverse = NetUtils::reverseLookup(ip);
    if (!reverse) {
        return names;
    }
    names.push_back(*reverse);

    const std::optional<std::string> canonical = NetUtils::canonicalName(*reverse);
    if (canonical && *canonical != ip &&
        std::find(names.begin(), names.end(), *canonical) == names.end()) {
        names.push_back(*canonical);
    }
    return names;
}

std::vector<int> SystemHostProbes::scanPorts(const std::string& ip, std::chrono::milliseconds timeout) {
    return PortProbe::scanCommon(ip, timeout);
}

std::optional<SsdpResult> SystemHostProbes::probeSsdp(const std::string& ip, std::chrono::milliseconds timeout) {
    return SsdpProbe::probe(ip, std::chrono::milliseconds(SSDP_WAIT_MS), timeout);
}

std::optional<std::string> SystemHostProbes::probeNetbios(const std::string& ip, std::chrono::milliseconds timeout) {
    return NetbiosProbe::query(ip, std::min(timeout, std::chrono::milliseconds(NETBIOS_TIMEOUT_MS)));
}

std::optional<HttpFingerprint> SystemHostProbes::probeHttp(const std::string& ip, std::chrono::milliseconds timeout) {
    return HttpProbe::probe(ip, timeout);
}

MdnsHostMap SystemHostProbes::browseMdns(const std::set<std::string>& targets) {
    return m_resolver.browse(targets);
}

ServiceRecordMap SystemHostProbes::browseFallback(const std::set<std::string>& targets) {
    return m_fallback.browse(targets);
}

std::vector<std::string> SystemHostProbes::mdnsReverseQuery(const std::string& ip,
                                                            std::chrono::milliseconds timeout) {
    return MdnsFallbackBrowser::reverseQuery(ip, timeout);
}

}  // namespace LanMonitor
