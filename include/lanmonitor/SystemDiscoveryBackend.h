/**
 * @file SystemDiscoveryBackend.h
 * @brief Linux implementation of DiscoveryBackend
 */

#pragma once

#include "ArpPacket.h"
#include "SubnetDiscovery.h"

#include <string>
#include <vector>

namespace LanMonitor {

/**
 * @brief Raw AF_PACKET ARP, arp-scan, /proc/net/arp (or `ip neigh`), and ping.
 *
 * The ARP techniques need CAP_NET_RAW; without it they throw and the other
 * techniques still contribute.
 */
class SystemDiscoveryBackend final : public DiscoveryBackend {
public:
    /**
     * @param interfaceName Restrict layer-2 traffic to this interface when non-empty
     */
    explicit SystemDiscoveryBackend(std::string interfaceName = {});

    std::vector<DiscoveredHost> arpBroadcastSweep(const Ipv4Network& net,
                                                  std::chrono::milliseconds timeout) override;
    std::optional<std::string> runArpSweepTool(const Ipv4Network& net) override;
    std::string readNeighborCache() override;
    bool ping(const std::string& ip) override;
    std::optional<std::string> arpProbe(const std::string& ip) override;
    std::optional<std::string> reverseLookup(const std::string& ip) override;

private:
    struct TimedReply {
        ArpReply reply;
        double responseTimeMs = 0.0;
    };

    /**
     * @brief Send one request per target and collect replies until the deadline.
     * @param stopOnFirst Return as soon as any target answered
     * @throws std::runtime_error if the raw socket cannot be opened or bound
     */
    std::vector<TimedReply> arpExchange(const LocalInterface& iface,
                                        const std::vector<uint32_t>& targets,
                                        std::chrono::milliseconds timeout,
                                        bool stopOnFirst);

    std::string m_interfaceName;
};

}  // namespace LanMonitor
