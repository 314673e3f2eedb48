/**
 * @file NetUtils.h
 * @brief IPv4, MAC address and interface helpers for the discovery engine.
 */

#pragma once

#include "SocketHandle.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LanMonitor {

/**
 * @brief An IPv4 network in CIDR form, host byte order.
 */
struct Ipv4Network {
    uint32_t network = 0;       ///< Network address (host bits cleared)
    uint8_t prefixLength = 0;   ///< 0..32

    uint32_t netmask() const;
    uint32_t broadcast() const;
    bool contains(uint32_t address) const;

    /// "a.b.c.d/n"
    std::string toString() const;
};

/**
 * @brief A local interface able to originate layer-2 traffic.
 */
struct LocalInterface {
    std::string name;
    int index = 0;
    uint32_t address = 0;                 ///< IPv4, host byte order
    uint32_t netmask = 0;                 ///< host byte order
    std::array<uint8_t, 6> mac{};
};

class NetUtils {
public:
    /**
     * @brief Canonicalize a MAC address to lowercase colon-separated form.
     *
     * Accepts ':', '-' and '.' separators or none at all.
     * @return "aa:bb:cc:dd:ee:ff", or empty string when input is not 12 hex digits
     */
    static std::string normalizeMac(const std::string& mac);

    /// Format six raw bytes as a canonical MAC string.
    static std::string formatMac(const uint8_t* bytes);

    /**
     * @brief Parse dotted-quad IPv4 text.
     * @return Address in host byte order, or nullopt on malformed input
     */
    static std::optional<uint32_t> parseIpv4(const std::string& text);

    static std::string formatIpv4(uint32_t address);

    static bool isIpv4(const std::string& text) { return parseIpv4(text).has_value(); }

    /**
     * @brief Parse "a.b.c.d/n" (a bare address means /32).
     *
     * Host bits set in the address are cleared rather than rejected.
     */
    static std::optional<Ipv4Network> parseCidr(const std::string& cidr);

    /**
     * @brief Usable host addresses of a network, in ascending order.
     *
     * Network and broadcast addresses are excluded except for /31 and /32.
     * @param limit Maximum number of addresses returned
     */
    static std::vector<std::string> hostAddresses(const Ipv4Network& net, size_t limit);

    /// True for 127.0.0.0/8 and 169.254.0.0/16.
    static bool isLoopbackOrLinkLocal(const std::string& ip);

    /**
     * @brief Reverse DNS lookup (PTR) through the system resolver.
     * @return Host name, or nullopt when no name is registered
     */
    static std::optional<std::string> reverseLookup(const std::string& ip);

    /**
     * @brief Canonical name of a host name through the system resolver.
     * @return The canonical name, or nullopt when the name does not resolve
     */
    static std::optional<std::string> canonicalName(const std::string& hostname);

    /**
     * @brief Open a TCP connection with a connect timeout.
     *
     * host may be a dotted quad or a resolvable name. The returned socket is
     * blocking, with SO_RCVTIMEO and SO_SNDTIMEO set to ioTimeout.
     * @return Invalid handle on failure (errorMsg describes why)
     */
    static SocketHandle connectTcp(const std::string& host, uint16_t port,
                                   std::chrono::milliseconds connectTimeout,
                                   std::chrono::milliseconds ioTimeout,
                                   std::string& errorMsg);

    /**
     * @brief Up, non-loopback IPv4 interfaces with their link-layer address.
     * @param interfaceName Restrict to this interface when non-empty
     */
    static std::vector<LocalInterface> listInterfaces(const std::string& interfaceName = {});

    /**
     * @brief Interface whose IPv4 network contains the given address.
     */
    static std::optional<LocalInterface> interfaceForAddress(uint32_t address,
                                                             const std::string& interfaceName = {});

    /**
     * @brief CIDR of the first up, non-loopback IPv4 interface.
     * @param interfaceName Restrict to this interface when non-empty
     */
    static std::optional<std::string> detectLocalSubnet(const std::string& interfaceName = {});

    /**
     * @brief Resolve the subnet a scan should target.
     *
     * Explicit value, else configured default, else detected subnet, else
     * FALLBACK_SUBNET.
     */
    static std::string resolveScanSubnet(const std::optional<std::string>& requested,
                                         const std::string& configuredDefault,
                                         const std::string& interfaceName);
};

}  // namespace LanMonitor
