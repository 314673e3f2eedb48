/**
 * @file NetUtils.cpp
 * @brief IPv4, MAC address and interface helpers.
 */

#include "lanmonitor/NetUtils.h"
#include "lanmonitor/config.h"
#include "lanmonitor/StringUtils.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <map>

namespace LanMonitor {

//=============================================================================
// Ipv4Network
//=============================================================================

uint32_t Ipv4Network::netmask() const {
    if (prefixLength == 0) {
        return 0;
    }
    return 0xFFFFFFFFu << (32 - prefixLength);
}

uint32_t Ipv4Network::broadcast() const {
    return network | ~netmask();
}

bool Ipv4Network::contains(uint32_t address) const {
    return (address & netmask()) == network;
}

std::string Ipv4Network::toString() const {
    return NetUtils::formatIpv4(network) + "/" + std::to_string(prefixLength);
}

//=============================================================================
// MAC helpers
//=============================================================================

std::string NetUtils::normalizeMac(const std::string& mac) {
    std::string hex;
    hex.reserve(12);
    for (unsigned char c : mac) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        if (!std::isxdigit(c)) {
            return {};
        }
        hex.push_back(static_cast<char>(std::tolower(c)));
    }
    if (hex.size() != 12) {
        return {};
    }

    std::string out;
    out.reserve(17);
    for (size_t i = 0; i < 12; i += 2) {
        if (i > 0) {
            out.push_back(':');
        }
        out.append(hex, i, 2);
    }
    return out;
}

std::string NetUtils::formatMac(const uint8_t* bytes) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5]);
    return std::string(buf);
}

//=============================================================================
// IPv4 helpers
//=============================================================================

std::optional<uint32_t> NetUtils::parseIpv4(const std::string& text) {
    in_addr addr{};
    if (text.empty() || inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string NetUtils::formatIpv4(uint32_t address) {
    in_addr addr{};
    addr.s_addr = htonl(address);
    char buf[INET_ADDRSTRLEN] = {};
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
        return {};
    }
    return std::string(buf);
}

std::optional<Ipv4Network> NetUtils::parseCidr(const std::string& cidr) {
    const std::string text = StringUtils::trim(cidr);
    const size_t slash = text.find('/');

    const auto address = parseIpv4(text.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    int prefix = 32;
    if (slash != std::string::npos) {
        const std::string prefixText = text.substr(slash + 1);
        if (!StringUtils::isAllDigits(prefixText) || prefixText.size() > 2) {
            return std::nullopt;
        }
        prefix = std::stoi(prefixText);
        if (prefix < 0 || prefix > 32) {
            return std::nullopt;
        }
    }

    Ipv4Network net;
    net.prefixLength = static_cast<uint8_t>(prefix);
    net.network = *address & net.netmask();
    return net;
}

std::vector<std::string> NetUtils::hostAddresses(const Ipv4Network& net, size_t limit) {
    std::vector<std::string> out;
    if (limit == 0) {
        return out;
    }

    uint64_t first = net.network;
    uint64_t last = net.broadcast();
    if (net.prefixLength < 31) {
        first += 1;
        last -= 1;
    }

    for (uint64_t a = first; a <= last && out.size() < limit; ++a) {
        out.push_back(formatIpv4(static_cast<uint32_t>(a)));
    }
    return out;
}

bool NetUtils::isLoopbackOrLinkLocal(const std::string& ip) {
    return StringUtils::startsWith(ip, "127.") || StringUtils::startsWith(ip, "169.254.");
}

std::optional<std::string> NetUtils::reverseLookup(const std::string& ip) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) {
        return std::nullopt;
    }

    char host[NI_MAXHOST] = {};
    const int rc = getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa),
                               host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (rc != 0 || host[0] == '\0') {
        return std::nullopt;
    }
    return std::string(host);
}

std::optional<std::string> NetUtils::canonicalName(const std::string& hostname) {
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_flags = AI_CANONNAME;

    addrinfo* res = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &res) != 0 || res == nullptr) {
        return std::nullopt;
    }
    std::optional<std::string> name;
    if (res->ai_canonname != nullptr && res->ai_canonname[0] != '\0') {
        name = std::string(res->ai_canonname);
    }
    freeaddrinfo(res);
    return name;
}

SocketHandle NetUtils::connectTcp(const std::string& host, uint16_t port,
                                  std::chrono::milliseconds connectTimeout,
                                  std::chrono::milliseconds ioTimeout,
                                  std::string& errorMsg) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        addrinfo hints{};
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        addrinfo* res = nullptr;
        const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
        if (rc != 0 || res == nullptr) {
            errorMsg = "Cannot resolve " + host + ": " + gai_strerror(rc);
            return SocketHandle();
        }
        addr.sin_addr = reinterpret_cast<const sockaddr_in*>(res->ai_addr)->sin_addr;
        freeaddrinfo(res);
    }

    SocketHandle sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!sock.valid()) {
        errorMsg = std::string("socket() failed: ") + std::strerror(errno);
        return SocketHandle();
    }

    const int flags = fcntl(sock.get(), F_GETFL, 0);
    if (flags < 0 || fcntl(sock.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        errorMsg = std::string("fcntl() failed: ") + std::strerror(errno);
        return SocketHandle();
    }

    if (::connect(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            errorMsg = std::string("connect() failed: ") + std::strerror(errno);
            return SocketHandle();
        }
        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLOUT;
        int ready = 0;
        do {
            ready = ::poll(&pfd, 1, static_cast<int>(connectTimeout.count()));
        } while (ready < 0 && errno == EINTR);
        if (ready == 0) {
            errorMsg = "connect() timed out";
            return SocketHandle();
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (ready < 0 || getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0) {
            errorMsg = std::string("connect() failed: ") + std::strerror(soError != 0 ? soError : errno);
            return SocketHandle();
        }
    }

    if (fcntl(sock.get(), F_SETFL, flags) < 0) {
        errorMsg = std::string("fcntl() failed: ") + std::strerror(errno);
        return SocketHandle();
    }

    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ioTimeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ioTimeout.count() % 1000) * 1000);
    setsockopt(sock.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return sock;
}

//=============================================================================
// Interfaces
//=============================================================================

std::vector<LocalInterface> NetUtils::listInterfaces(const std::string& interfaceName) {
    std::vector<LocalInterface> out;

    ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        return out;
    }

    // Link-layer addresses arrive as separate AF_PACKET entries.
    std::map<std::string, std::array<uint8_t, 6>> macs;
    for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_PACKET) {
            continue;
        }
        const auto* ll = reinterpret_cast<const sockaddr_ll*>(ifa->ifa_addr);
        if (ll->sll_halen != 6) {
            continue;
        }
        std::array<uint8_t, 6> mac{};
        std::memcpy(mac.data(), ll->sll_addr, 6);
        macs[ifa->ifa_name] = mac;
    }

    for (ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) {
            continue;
        }
        if (!interfaceName.empty() && interfaceName != ifa->ifa_name) {
            continue;
        }

        LocalInterface iface;
        iface.name = ifa->ifa_name;
        iface.index = static_cast<int>(if_nametoindex(ifa->ifa_name));
        iface.address = ntohl(reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr);
        if (ifa->ifa_netmask != nullptr) {
            iface.netmask = ntohl(reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr);
        }
        auto it = macs.find(iface.name);
        if (it != macs.end()) {
            iface.mac = it->second;
        }
        out.push_back(iface);
    }

    freeifaddrs(ifaddr);
    return out;
}

std::optional<LocalInterface> NetUtils::interfaceForAddress(uint32_t address,
                                                            const std::string& interfaceName) {
    for (const auto& iface : listInterfaces(interfaceName)) {
        if (iface.netmask != 0 && (iface.address & iface.netmask) == (address & iface.netmask)) {
            return iface;
        }
    }
    return std::nullopt;
}

std::optional<std::string> NetUtils::detectLocalSubnet(const std::string& interfaceName) {
    for (const auto& iface : listInterfaces(interfaceName)) {
        if (iface.netmask == 0) {
            continue;
        }
        uint8_t prefix = 0;
        for (uint32_t m = iface.netmask; m & 0x80000000u; m <<= 1) {
            ++prefix;
        }
        Ipv4Network net;
        net.prefixLength = prefix;
        net.network = iface.address & net.netmask();
        return net.toString();
    }
    return std::nullopt;
}

std::string NetUtils::resolveScanSubnet(const std::optional<std::string>& requested,
                                        const std::string& configuredDefault,
                                        const std::string& interfaceName) {
    if (requested && !requested->empty()) {
        return *requested;
    }
    if (!configuredDefault.empty()) {
        return configuredDefault;
    }
    if (auto detected = detectLocalSubnet(interfaceName)) {
        return *detected;
    }
    return FALLBACK_SUBNET;
}

}  // namespace LanMonitor
