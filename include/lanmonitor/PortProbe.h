/**
 * @file PortProbe.h
 * @brief TCP connect probe against a table of well-known ports
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace LanMonitor {

struct KnownPort {
    uint16_t port;
    const char* service;
};

class PortProbe {
public:
    /// SSH, Telnet, DNS, HTTP(S), SMB, AFP, IPP, RDP, UPnP, Synology, AirTunes,
    /// alternate HTTP, JetDirect, Plex and iPhone sync.
    static const std::vector<KnownPort>& commonPorts();

    /// Service name of a port in commonPorts(), or empty.
    static std::string serviceName(uint16_t port);

    /**
     * @brief Attempt all connects at once and report which succeeded.
     *
     * Every port shares the same deadline. Refused, unreachable and timed out
     * ports are simply absent from the result.
     * @return Open ports in the order they were given
     */
    static std::vector<int> scan(const std::string& ip,
                                 const std::vector<uint16_t>& ports,
                                 std::chrono::milliseconds timeout);

    /// scan() over commonPorts().
    static std::vector<int> scanCommon(const std::string& ip, std::chrono::milliseconds timeout);
};

}  // namespace LanMonitor
