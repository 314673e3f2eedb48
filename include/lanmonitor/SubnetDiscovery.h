/**
 * @file SubnetDiscovery.h
 * @brief Multi-technique host discovery for one IPv4 subnet
 *
 * (c) 2026 LanMonitor Project
 * Licensed under MIT License
 */

#pragma once

#include "config.h"
#include "NetUtils.h"
#include "VendorLookup.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace LanMonitor {

//=============================================================================
// DiscoveredHost Structure
//=============================================================================

/**
 * @struct DiscoveredHost
 * @brief One host seen during one scan cycle
 *
 * MAC is canonical (lowercase, colon-separated) and is the dedup key within
 * a cycle.
 */
struct DiscoveredHost {
    std::string mac;
    std::string ip;
    std::optional<std::string> hostname;
    std::optional<std::string> vendor;
    std::optional<double> responseTimeMs;
    std::string method;              ///< technique tag, e.g. "arp-broadcast"
};

namespace DiscoveryMethod {
inline constexpr const char* ARP_BROADCAST = "arp-broadcast";
inline constexpr const char* ARP_SWEEP_TOOL = "arp-scan";
inline constexpr const char* NEIGHBOR_CACHE = "arp-table";
}  // namespace DiscoveryMethod

//=============================================================================
// DiscoveryBackend Interface
//=============================================================================

/**
 * @brief Packet, subprocess and resolver access used by SubnetDiscovery.
 *
 * Every method may block for up to its own timeout and may throw
 * std::exception on a technique-level failure; SubnetDiscovery catches and
 * logs those. Implementations must be safe to call from several threads.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    /**
     * @brief One layer-2 ARP broadcast sweep of every host address in net.
     * @return Responders with hostname/vendor unset
     */
    virtual std::vector<DiscoveredHost> arpBroadcastSweep(const Ipv4Network& net,
                                                          std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Run the external ARP-sweep utility against net.
     * @return Its stdout, or std::nullopt when the utility is not installed
     */
    virtual std::optional<std::string> runArpSweepTool(const Ipv4Network& net) = 0;

    /// Text dump of the OS neighbor cache.
    virtual std::string readNeighborCache() = 0;

    /// Single ICMP echo; true on reply.
    virtual bool ping(const std::string& ip) = 0;

    /**
     * @brief Unicast ARP resolution of a single address.
     * @return MAC of the responder, std::nullopt if nobody answered
     */
    virtual std::optional<std::string> arpProbe(const std::string& ip) = 0;

    virtual std::optional<std::string> reverseLookup(const std::string& ip) = 0;
};

//=============================================================================
// DiscoveryOptions
//=============================================================================

struct DiscoveryOptions {
    uint32_t arpRetries = ARP_RETRIES;
    std::chrono::milliseconds arpTimeout{ARP_TIMEOUT_S * 1000};
    std::chrono::milliseconds arpRetryDelay{ARP_RETRY_DELAY_MS};
    size_t pingMaxHosts = PING_SWEEP_MAX_HOSTS;
    size_t pingBatchSize = PING_SWEEP_BATCH_SIZE;
    std::chrono::milliseconds pingBatchTimeout{PING_SWEEP_BATCH_TIMEOUT_MS};
    bool resolveHostnames = true;
};

//=============================================================================
// SubnetDiscovery Class
//=============================================================================

/**
 * @class SubnetDiscovery
 * @brief Runs the four discovery techniques and merges their results
 *
 * Techniques, in merge precedence order:
 * 1. ARP broadcast sweep, repeated arpRetries times
 * 2. External ARP-sweep utility (skipped when not installed)
 * 3. Neighbor cache read
 * 4. Ping sweep (only to warm the neighbor cache), then a second cache read
 *
 * The techniques run concurrently; results are merged afterwards in the
 * fixed order above and the first record for a MAC wins. A failing technique
 * contributes nothing and never aborts the scan.
 */
class SubnetDiscovery {
public:
    SubnetDiscovery(std::shared_ptr<DiscoveryBackend> backend,
                    std::shared_ptr<const VendorLookup> vendors,
                    DiscoveryOptions options = {});

    // Prevent copying
    SubnetDiscovery(const SubnetDiscovery&) = delete;
    SubnetDiscovery& operator=(const SubnetDiscovery&) = delete;

    /**
     * @brief Discover hosts in a subnet.
     * @param cidr Subnet in CIDR form
     * @throws std::invalid_argument if cidr is not a valid IPv4 network
     */
    std::vector<DiscoveredHost> discover(const std::string& cidr);

    /**
     * @brief Confirm a single host is still present before marking it offline.
     *
     * Tries ping, then a unicast ARP probe, then the neighbor cache. When
     * expectedMac is supplied, an ARP or cache answer carrying a different MAC
     * means another device now holds the address and yields false.
     */
    bool verifyHostOnline(const std::string& ip,
                          const std::optional<std::string>& expectedMac = std::nullopt);

    //=========================================================================
    // Output parsers (exposed for tests)
    //=========================================================================

    /**
     * @brief Parse ARP-sweep utility output ("IP  MAC  vendor" rows).
     *
     * An empty vendor column is filled from vendors when given.
     */
    static std::vector<DiscoveredHost> parseArpSweepOutput(const std::string& output,
                                                           const VendorLookup* vendors);

    /**
     * @brief Parse a neighbor cache dump.
     *
     * Understands /proc/net/arp, `ip neigh` and `arp -a` formats. Incomplete,
     * all-zero and broadcast entries are dropped.
     */
    static std::vector<DiscoveredHost> parseNeighborCache(const std::string& output);

private:
    std::vector<DiscoveredHost> runArpBroadcast(const Ipv4Network& net);
    std::vector<DiscoveredHost> runArpSweepTool(const Ipv4Network& net);
    std::vector<DiscoveredHost> runNeighborCache(const Ipv4Network& net);
    std::vector<DiscoveredHost> runPingSweep(const Ipv4Network& net);

    void pingSweep(const Ipv4Network& net);
    void resolveHostnames(std::vector<DiscoveredHost>& hosts);

    std::shared_ptr<DiscoveryBackend> m_backend;
    std::shared_ptr<const VendorLookup> m_vendors;
    DiscoveryOptions m_options;
};

}  // namespace LanMonitor
