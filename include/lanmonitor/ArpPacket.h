/**
 * @file ArpPacket.h
 * @brief Ethernet II + ARP (IPv4 over Ethernet) frame builder and parser
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace LanMonitor {

using MacBytes = std::array<uint8_t, 6>;

constexpr uint16_t ETHERTYPE_ARP = 0x0806;
constexpr uint16_t ARP_OPER_REQUEST = 1;
constexpr uint16_t ARP_OPER_REPLY = 2;

/// Ethernet header (14) + ARP payload (28).
constexpr size_t ARP_FRAME_SIZE = 42;

/**
 * @brief Sender fields of a received ARP reply.
 */
struct ArpReply {
    uint32_t senderIp = 0;   ///< host byte order
    MacBytes senderMac{};
};

class ArpPacket {
public:
    /**
     * @brief Build a broadcast "who-has targetIp" request.
     * @param sourceMac Our interface MAC
     * @param sourceIp Our interface IPv4, host byte order
     * @param targetIp Address being resolved, host byte order
     */
    static std::vector<uint8_t> buildRequest(const MacBytes& sourceMac,
                                             uint32_t sourceIp,
                                             uint32_t targetIp);

    /**
     * @brief Parse a received frame.
     * @return Sender fields if the frame is an IPv4-over-Ethernet ARP reply
     */
    static std::optional<ArpReply> parseReply(const uint8_t* frame, size_t length);
};

}  // namespace LanMonitor
