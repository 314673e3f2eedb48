/**
 * @file MdnsFallbackBrowser.cpp
 * @brief Embedded multicast DNS-SD browse used when the external browser yields nothing
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#include "lanmonitor/MdnsFallbackBrowser.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/NetUtils.h"
#include "lanmonitor/SocketHandle.h"
#include "lanmonitor/StringUtils.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <map>

namespace LanMonitor {

namespace {

/// Lowercase, no trailing dot.
std::string canonicalName(const std::string& name) {
    std::string out = StringUtils::toLower(name);
    while (!out.empty() && out.back() == '.') {
        out.pop_back();
    }
    return out;
}

struct InstanceParts {
    std::string label;     ///< "Living Room"
    std::string service;   ///< "_googlecast._tcp"
    std::string domain;    ///< "local"
};

/// Split "Living Room._googlecast._tcp.local" at the first "._".
InstanceParts splitInstanceName(const std::string& instance) {
    InstanceParts out;
    const size_t pos = instance.find("._");
    if (pos == std::string::npos) {
        out.label = instance;
        return out;
    }
    out.label = instance.substr(0, pos);

    for (const auto& label : StringUtils::split(instance.substr(pos + 1), '.')) {
        if (!out.domain.empty() || label.empty() || label.front() != '_') {
            if (!label.empty()) {
                out.domain += out.domain.empty() ? label : "." + label;
            }
            continue;
        }
        out.service += out.service.empty() ? label : "." + label;
    }
    return out;
}

std::map<std::string, std::string> parseTxtStrings(const std::vector<std::string>& strings) {
    std::map<std::string, std::string> txt;
    for (const auto& s : strings) {
        const size_t eq = s.find('=');
        if (eq == std::string::npos) {
            txt.emplace(s, "true");
        } else if (eq > 0) {
            txt.emplace(s.substr(0, eq), s.substr(eq + 1));
        }
    }
    return txt;
}

std::chrono::milliseconds remainingUntil(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
}

/// Receive datagrams until the deadline; calls onPacket(data, len, sourceIp).
template <typename Fn>
void receiveUntil(int fd, std::chrono::steady_clock::time_point deadline, Fn&& onPacket) {
    std::vector<uint8_t> buf(MDNS_MAX_PACKET_SIZE);
    for (;;) {
        const auto left = remainingUntil(deadline);
        if (left.count() <= 0) {
            return;
        }
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            return;
        }

        sockaddr_in src{};
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(fd, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr*>(&src), &slen);
        if (n <= 0) {
            continue;
        }
        char ip[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &src.sin_addr, ip, sizeof(ip));
        if (!onPacket(buf.data(), static_cast<size_t>(n), std::string(ip))) {
            return;
        }
    }
}

}  // namespace

//=============================================================================
// Constructor / service types
//=============================================================================

MdnsFallbackBrowser::MdnsFallbackBrowser(std::string interfaceName)
    : m_interfaceName(std::move(interfaceName))
{
}

const std::vector<std::string>& MdnsFallbackBrowser::serviceTypes() {
    static const std::vector<std::string> types = {
        "_http._tcp.local.",        "_https._tcp.local.",         "_airplay._tcp.local.",
        "_raop._tcp.local.",        "_googlecast._tcp.local.",    "_spotify-connect._tcp.local.",
        "_homekit._tcp.local.",     "_hap._tcp.local.",           "_printer._tcp.local.",
        "_ipp._tcp.local.",         "_pdl-datastream._tcp.local.", "_scanner._tcp.local.",
        "_smb._tcp.local.",         "_afpovertcp._tcp.local.",    "_ssh._tcp.local.",
        "_device-info._tcp.local.", "_companion-link._tcp.local.", "_sonos._tcp.local.",
    };
    return types;
}

//=============================================================================
// browse()
//=============================================================================

ServiceRecordMap MdnsFallbackBrowser::browse(const std::set<std::string>& targets,
                                             std::chrono::milliseconds listenWindow) {
    if (targets.empty()) {
        return {};
    }

    SocketHandle sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        LOG_DEBUG("[MdnsFallback] socket() failed: " << std::strerror(errno));
        return {};
    }

    int yes = 1;
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#ifdef SO_REUSEPORT
    setsockopt(sock.get(), SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
#endif

    in_addr ifaceAddr{};
    ifaceAddr.s_addr = htonl(INADDR_ANY);
    if (!m_interfaceName.empty()) {
        const auto ifaces = NetUtils::listInterfaces(m_interfaceName);
        if (!ifaces.empty()) {
            ifaceAddr.s_addr = htonl(ifaces.front().address);
            setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_IF, &ifaceAddr, sizeof(ifaceAddr));
        }
    }

    // Share port 5353 with a running responder; fall back to an ephemeral
    // port and ask for unicast replies when that is not possible.
    bool unicastReplies = false;
    sockaddr_in bindAddr{};
    bindAddr.sin_family = AF_INET;
    bindAddr.sin_port = htons(MDNS_PORT);
    bindAddr.sin_addr.s_addr = htonl(INADDR_ANY);
    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) < 0) {
        bindAddr.sin_port = htons(0);
        if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&bindAddr), sizeof(bindAddr)) < 0) {
            LOG_DEBUG("[MdnsFallback] bind() failed: " << std::strerror(errno));
            return {};
        }
        unicastReplies = true;
    } else {
        ip_mreq mreq{};
        inet_pton(AF_INET, MDNS_MULTICAST_ADDR, &mreq.imr_multiaddr);
        mreq.imr_interface = ifaceAddr;
        if (setsockopt(sock.get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
            LOG_DEBUG("[MdnsFallback] IP_ADD_MEMBERSHIP failed: " << std::strerror(errno));
            unicastReplies = true;
        }
    }
    uint8_t ttl = 255;
    setsockopt(sock.get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    std::vector<DnsQuestion> questions;
    for (const auto& type : serviceTypes()) {
        questions.push_back({type, DnsType::PTR});
    }
    const std::vector<uint8_t> query = DnsCodec::buildQuery(questions, unicastReplies);

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(MDNS_PORT);
    inet_pton(AF_INET, MDNS_MULTICAST_ADDR, &group.sin_addr);
    if (::sendto(sock.get(), query.data(), query.size(), 0,
                 reinterpret_cast<sockaddr*>(&group), sizeof(group)) < 0) {
        LOG_DEBUG("[MdnsFallback] sendto() failed: " << std::strerror(errno));
        return {};
    }

    std::vector<DnsRecord> collected;
    const auto deadline = std::chrono::steady_clock::now() + listenWindow;
    receiveUntil(sock.get(), deadline, [&collected](const uint8_t* data, size_t len, const std::string&) {
        DnsMessage message;
        std::string parseError;
        if (DnsCodec::parse(data, len, message, parseError) && (message.flags & 0x8000) != 0) {
            collected.insert(collected.end(), message.records.begin(), message.records.end());
        }
        return true;
    });

    ServiceRecordMap joined = joinRecords(collected, targets);
    LOG_DEBUG("[MdnsFallback] " << collected.size() << " records, services for "
              << joined.size() << " target hosts");
    return joined;
}

//=============================================================================
// reverseQuery()
//=============================================================================

std::vector<std::string> MdnsFallbackBrowser::reverseQuery(const std::string& ip,
                                                           std::chrono::milliseconds timeout) {
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(MDNS_PORT);
    if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
        return {};
    }

    SocketHandle sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        return {};
    }

    const std::vector<uint8_t> query =
        DnsCodec::buildQuery({DnsQuestion{DnsCodec::reversePointerName(ip), DnsType::PTR}});
    if (::sendto(sock.get(), query.data(), query.size(), 0,
                 reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
        return {};
    }

    std::vector<std::string> names;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    receiveUntil(sock.get(), deadline, [&names, &ip](const uint8_t* data, size_t len, const std::string& source) {
        if (source != ip) {
            return true;
        }
        DnsMessage message;
        std::string parseError;
        if (DnsCodec::parse(data, len, message, parseError)) {
            names = localNamesFrom(message);
        }
        return false;
    });
    return names;
}

//=============================================================================
// Joining
//=============================================================================

ServiceRecordMap MdnsFallbackBrowser::joinRecords(const std::vector<DnsRecord>& records,
                                                  const std::set<std::string>& targets) {
    std::vector<std::string> instances;          // original case, arrival order
    std::set<std::string> instanceKeys;
    std::map<std::string, const DnsRecord*> srvByInstance;
    std::map<std::string, std::vector<std::string>> txtByInstance;
    std::map<std::string, std::vector<std::string>> addressesByHost;

    auto noteInstance = [&](const std::string& name) {
        if (instanceKeys.insert(canonicalName(name)).second) {
            instances.push_back(name);
        }
    };

    for (const auto& rr : records) {
        switch (rr.type) {
        case DnsType::PTR:
            if (!rr.target.empty() && StringUtils::contains(rr.target, "._")) {
                noteInstance(rr.target);
            }
            break;
        case DnsType::SRV:
            noteInstance(rr.name);
            srvByInstance[canonicalName(rr.name)] = &rr;
            break;
        case DnsType::TXT:
            txtByInstance[canonicalName(rr.name)] = rr.txt;
            break;
        case DnsType::A:
            if (!rr.address.empty()) {
                auto& list = addressesByHost[canonicalName(rr.name)];
                if (std::find(list.begin(), list.end(), rr.address) == list.end()) {
                    list.push_back(rr.address);
                }
            }
            break;
        default:
            break;
        }
    }

    ServiceRecordMap out;
    for (const auto& instance : instances) {
        const std::string key = canonicalName(instance);
        const auto srv = srvByInstance.find(key);
        if (srv == srvByInstance.end()) {
            continue;
        }
        const auto addrs = addressesByHost.find(canonicalName(srv->second->target));
        if (addrs == addressesByHost.end()) {
            continue;
        }

        const InstanceParts parts = splitInstanceName(instance);
        for (const auto& address : addrs->second) {
            if (targets.count(address) == 0) {
                continue;
            }
            ServiceRecord record;
            record.protocol = "IPv4";
            record.name = parts.label;
            record.type = parts.service;
            record.domain = parts.domain;
            record.hostname = srv->second->target;
            record.address = address;
            record.port = srv->second->port;
            const auto txt = txtByInstance.find(key);
            if (txt != txtByInstance.end()) {
                record.txt = parseTxtStrings(txt->second);
            }
            out[address].push_back(std::move(record));
        }
    }
    return out;
}

std::vector<std::string> MdnsFallbackBrowser::localNamesFrom(const DnsMessage& message) {
    std::vector<std::string> names;
    auto add = [&names](const std::string& name) {
        std::string n = name;
        while (!n.empty() && n.back() == '.') {
            n.pop_back();
        }
        if (!StringUtils::endsWith(StringUtils::toLower(n), ".local") || StringUtils::contains(n, "._")) {
            return;
        }
        if (std::find(names.begin(), names.end(), n) == names.end()) {
            names.push_back(n);
        }
    };

    for (const auto& rr : message.records) {
        if (rr.type == DnsType::PTR || rr.type == DnsType::SRV) {
            add(rr.target);
        } else if (rr.type == DnsType::A) {
            add(rr.name);
        }
    }
    return names;
}

}  // namespace LanMonitor
