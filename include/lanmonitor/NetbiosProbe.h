/**
 * @file NetbiosProbe.h
 * @brief NetBIOS node status (NBSTAT) query for Windows and Samba host names
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LanMonitor {

class NetbiosProbe {
public:
    /// Wildcard ("*") node status request, transaction id 1.
    static std::vector<uint8_t> buildStatusQuery();

    /**
     * @brief Pick the host name out of a node status reply.
     *
     * The first workstation (0x00) or file server (0x20) entry that is not
     * the wildcard wins.
     */
    static std::optional<std::string> parseStatusReply(const uint8_t* data, size_t len);

    /// Send the query to ip:137 and wait up to timeout for the reply.
    static std::optional<std::string> query(const std::string& ip, std::chrono::milliseconds timeout);
};

}  // namespace LanMonitor
