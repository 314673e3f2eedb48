/**
 * @file SystemDiscoveryBackend.cpp
 * @brief Linux implementation of DiscoveryBackend
 */

#include "lanmonitor/SystemDiscoveryBackend.h"
#include "lanmonitor/AtomicFile.h"
#include "lanmonitor/Debug.h"
#include "lanmonitor/ProcessRunner.h"
#include "lanmonitor/SocketHandle.h"

#include <arpa/inet.h>
#include <linux/if_ether.h>
#include <linux/if_packet.h>
#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

namespace LanMonitor {

SystemDiscoveryBackend::SystemDiscoveryBackend(std::string interfaceName)
    : m_interfaceName(std::move(interfaceName))
{
}

//=============================================================================
// Raw ARP
//=============================================================================

std::vector<SystemDiscoveryBackend::TimedReply> SystemDiscoveryBackend::arpExchange(
    const LocalInterface& iface,
    const std::vector<uint32_t>& targets,
    std::chrono::milliseconds timeout,
    bool stopOnFirst)
{
    SocketHandle sock(::socket(AF_PACKET, SOCK_RAW, htons(ETH_P_ARP)));
    if (!sock.valid()) {
        throw std::runtime_error(std::string("raw ARP socket failed: ") + std::strerror(errno));
    }

    sockaddr_ll addr{};
    addr.sll_family = AF_PACKET;
    addr.sll_protocol = htons(ETH_P_ARP);
    addr.sll_ifindex = iface.index;
    if (::bind(sock.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        throw std::runtime_error("bind to " + iface.name + " failed: " + std::strerror(errno));
    }

    sockaddr_ll dest = addr;
    dest.sll_halen = 6;
    std::memset(dest.sll_addr, 0xFF, 6);

    const auto start = std::chrono::steady_clock::now();
    for (uint32_t target : targets) {
        const std::vector<uint8_t> frame = ArpPacket::buildRequest(iface.mac, iface.address, target);
        if (::sendto(sock.get(), frame.data(), frame.size(), 0,
                     reinterpret_cast<sockaddr*>(&dest), sizeof(dest)) < 0) {
            LOG_DEBUG("[ARP] sendto " << NetUtils::formatIpv4(target) << " failed: " << std::strerror(errno));
        }
    }

    const std::unordered_set<uint32_t> wanted(targets.begin(), targets.end());
    std::unordered_set<uint32_t> answered;
    std::vector<TimedReply> replies;
    const auto deadline = start + timeout;
    uint8_t buffer[1514];

    while (true) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        pollfd pfd{};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()) + 1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
        }
        if (rc == 0) {
            break;
        }

        const ssize_t n = ::recv(sock.get(), buffer, sizeof(buffer), 0);
        if (n <= 0) {
            continue;
        }

        const auto reply = ArpPacket::parseReply(buffer, static_cast<size_t>(n));
        if (!reply || wanted.count(reply->senderIp) == 0 || !answered.insert(reply->senderIp).second) {
            continue;
        }

        TimedReply timed;
        timed.reply = *reply;
        timed.responseTimeMs = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        replies.push_back(timed);

        if (stopOnFirst) {
            break;
        }
    }

    return replies;
}

std::vector<DiscoveredHost> SystemDiscoveryBackend::arpBroadcastSweep(const Ipv4Network& net,
                                                                      std::chrono::milliseconds timeout) {
    const auto iface = NetUtils::interfaceForAddress(net.network, m_interfaceName);
    if (!iface) {
        throw std::runtime_error("no local interface on " + net.toString());
    }

    std::vector<uint32_t> targets;
    for (const auto& ip : NetUtils::hostAddresses(net, ARP_SWEEP_MAX_HOSTS)) {
        const auto addr = NetUtils::parseIpv4(ip);
        if (addr && *addr != iface->address) {
            targets.push_back(*addr);
        }
    }

    std::vector<DiscoveredHost> out;
    for (const auto& timed : arpExchange(*iface, targets, timeout, false)) {
        DiscoveredHost host;
        host.ip = NetUtils::formatIpv4(timed.reply.senderIp);
        host.mac = NetUtils::formatMac(timed.reply.senderMac.data());
        host.responseTimeMs = timed.responseTimeMs;
        host.method = DiscoveryMethod::ARP_BROADCAST;
        out.push_back(std::move(host));
    }
    return out;
}

std::optional<std::string> SystemDiscoveryBackend::arpProbe(const std::string& ip) {
    const auto addr = NetUtils::parseIpv4(ip);
    if (!addr) {
        return std::nullopt;
    }
    const auto iface = NetUtils::interfaceForAddress(*addr, m_interfaceName);
    if (!iface) {
        return std::nullopt;
    }

    // One initial request plus VERIFY_ARP_RETRIES retransmissions.
    for (uint32_t attempt = 0; attempt <= VERIFY_ARP_RETRIES; ++attempt) {
        const auto replies = arpExchange(*iface, {*addr},
                                         std::chrono::seconds(VERIFY_ARP_TIMEOUT_S), true);
        if (!replies.empty()) {
            return NetUtils::formatMac(replies.front().reply.senderMac.data());
        }
    }
    return std::nullopt;
}

//=============================================================================
// Subprocess techniques
//=============================================================================

std::optional<std::string> SystemDiscoveryBackend::runArpSweepTool(const Ipv4Network& net) {
    std::vector<std::string> argv = {"arp-scan", "-q", "-x"};
    if (!m_interfaceName.empty()) {
        argv.push_back("--interface=" + m_interfaceName);
    }
    argv.push_back(net.toString());

    const ProcessResult result = ProcessRunner::run(argv, std::chrono::seconds(ARP_SWEEP_TOOL_TIMEOUT_S));
    if (!result.launched) {
        return std::nullopt;
    }
    if (result.timedOut) {
        throw std::runtime_error("arp-scan timed out");
    }
    if (result.exitCode != 0) {
        throw std::runtime_error("arp-scan exited with status " + std::to_string(result.exitCode));
    }
    return result.output;
}

std::string SystemDiscoveryBackend::readNeighborCache() {
    std::string content;
    std::string errorMsg;
    if (readWholeFile("/proc/net/arp", content, errorMsg) && !content.empty()) {
        return content;
    }

    const ProcessResult neigh = ProcessRunner::run({"ip", "-4", "neigh", "show"},
                                                   std::chrono::seconds(NEIGHBOR_CACHE_TIMEOUT_S));
    if (neigh.succeeded()) {
        return neigh.output;
    }

    const ProcessResult arp = ProcessRunner::run({"arp", "-an"},
                                                 std::chrono::seconds(NEIGHBOR_CACHE_TIMEOUT_S));
    if (arp.succeeded()) {
        return arp.output;
    }

    throw std::runtime_error("neighbor cache unavailable: " + errorMsg);
}

bool SystemDiscoveryBackend::ping(const std::string& ip) {
    const ProcessResult result = ProcessRunner::run(
        {"ping", "-c", "1", "-W", std::to_string(PING_TIMEOUT_S), ip},
        std::chrono::seconds(PING_TIMEOUT_S + 2));
    return result.succeeded();
}

std::optional<std::string> SystemDiscoveryBackend::reverseLookup(const std::string& ip) {
    return NetUtils::reverseLookup(ip);
}

}  // namespace LanMonitor
