/**
 * @file ArpPacket.cpp
 * @brief Ethernet II + ARP frame builder and parser
 */

#include "lanmonitor/ArpPacket.h"

namespace LanMonitor {

namespace {

void put16(std::vector<uint8_t>& out, size_t offset, uint16_t value) {
    out[offset] = static_cast<uint8_t>(value >> 8);
    out[offset + 1] = static_cast<uint8_t>(value & 0xFF);
}

void put32(std::vector<uint8_t>& out, size_t offset, uint32_t value) {
    out[offset] = static_cast<uint8_t>(value >> 24);
    out[offset + 1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[offset + 2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[offset + 3] = static_cast<uint8_t>(value & 0xFF);
}

uint16_t get16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

// Offsets into the frame
constexpr size_t ETH_DST = 0;
constexpr size_t ETH_SRC = 6;
constexpr size_t ETH_TYPE = 12;
constexpr size_t ARP_HTYPE = 14;
constexpr size_t ARP_PTYPE = 16;
constexpr size_t ARP_HLEN = 18;
constexpr size_t ARP_PLEN = 19;
constexpr size_t ARP_OPER = 20;
constexpr size_t ARP_SHA = 22;
constexpr size_t ARP_SPA = 28;
constexpr size_t ARP_THA = 32;
constexpr size_t ARP_TPA = 38;

}  // namespace

std::vector<uint8_t> ArpPacket::buildRequest(const MacBytes& sourceMac,
                                             uint32_t sourceIp,
                                             uint32_t targetIp) {
    std::vector<uint8_t> frame(ARP_FRAME_SIZE, 0);

    // Ethernet II header: broadcast destination
    for (size_t i = 0; i < 6; ++i) {
        frame[ETH_DST + i] = 0xFF;
        frame[ETH_SRC + i] = sourceMac[i];
    }
    put16(frame, ETH_TYPE, ETHERTYPE_ARP);

    // ARP payload
    put16(frame, ARP_HTYPE, 1);        // Ethernet
    put16(frame, ARP_PTYPE, 0x0800);   // IPv4
    frame[ARP_HLEN] = 6;
    frame[ARP_PLEN] = 4;
    put16(frame, ARP_OPER, ARP_OPER_REQUEST);
    for (size_t i = 0; i < 6; ++i) {
        frame[ARP_SHA + i] = sourceMac[i];
        frame[ARP_THA + i] = 0x00;
    }
    put32(frame, ARP_SPA, sourceIp);
    put32(frame, ARP_TPA, targetIp);

    return frame;
}

std::optional<ArpReply> ArpPacket::parseReply(const uint8_t* frame, size_t length) {
    if (frame == nullptr || length < ARP_FRAME_SIZE) {
        return std::nullopt;
    }
    if (get16(frame + ETH_TYPE) != ETHERTYPE_ARP) {
        return std::nullopt;
    }
    if (get16(frame + ARP_HTYPE) != 1 || get16(frame + ARP_PTYPE) != 0x0800) {
        return std::nullopt;
    }
    if (frame[ARP_HLEN] != 6 || frame[ARP_PLEN] != 4) {
        return std::nullopt;
    }
    if (get16(frame + ARP_OPER) != ARP_OPER_REPLY) {
        return std::nullopt;
    }

    ArpReply reply;
    for (size_t i = 0; i < 6; ++i) {
        reply.senderMac[i] = frame[ARP_SHA + i];
    }
    reply.senderIp = get32(frame + ARP_SPA);
    return reply;
}

}  // namespace LanMonitor
