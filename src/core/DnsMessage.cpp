/**
 * @file DnsMessage.cpp
 * @brief Minimal DNS wire format codec for mDNS queries and responses
 */

#include "lanmonitor/DnsMessage.h"
#include "lanmonitor/StringUtils.h"

#include <arpa/inet.h>

namespace LanMonitor {

namespace {

constexpr int MAX_POINTER_DEPTH = 20;

uint16_t rd16(const uint8_t* p) {
    return static_cast<uint16_t>((uint16_t(p[0]) << 8) | p[1]);
}

uint32_t rd32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3];
}

void wr16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

/**
 * @brief Read a possibly compressed name starting at off.
 *
 * On success off is advanced past the name as it appears at the original
 * position (a compression pointer counts as two bytes).
 */
bool readName(const uint8_t* buf, size_t len, size_t& off, std::string& out, int depth = 0) {
    if (depth > MAX_POINTER_DEPTH) {
        return false;
    }

    size_t pos = off;
    while (pos < len) {
        const uint8_t lab = buf[pos++];
        if (lab == 0) {
            off = pos;
            return true;
        }
        if ((lab & 0xC0) == 0xC0) {
            if (pos >= len) {
                return false;
            }
            size_t target = (static_cast<size_t>(lab & 0x3F) << 8) | buf[pos++];
            if (target >= len) {
                return false;
            }
            std::string rest;
            if (!readName(buf, len, target, rest, depth + 1)) {
                return false;
            }
            if (!out.empty() && !rest.empty()) {
                out.push_back('.');
            }
            out += rest;
            off = pos;
            return true;
        }
        if ((lab & 0xC0) != 0 || pos + lab > len) {
            return false;
        }
        if (!out.empty()) {
            out.push_back('.');
        }
        out.append(reinterpret_cast<const char*>(buf + pos), lab);
        pos += lab;
    }
    return false;
}

bool parseRecord(const uint8_t* buf, size_t len, size_t& off, DnsRecord& rr) {
    if (!readName(buf, len, off, rr.name) || off + 10 > len) {
        return false;
    }
    rr.type = rd16(buf + off);
    rr.rrClass = rd16(buf + off + 2) & 0x7FFF;
    rr.ttl = rd32(buf + off + 4);
    const uint16_t rdlen = rd16(buf + off + 8);
    const size_t rdoff = off + 10;
    const size_t next = rdoff + rdlen;
    if (next > len) {
        return false;
    }

    if (rr.type == DnsType::PTR) {
        size_t t = rdoff;
        readName(buf, len, t, rr.target);
    } else if (rr.type == DnsType::SRV && rdlen >= 6) {
        rr.port = rd16(buf + rdoff + 4);
        size_t t = rdoff + 6;
        readName(buf, len, t, rr.target);
    } else if (rr.type == DnsType::TXT) {
        size_t p = rdoff;
        while (p < next) {
            const uint8_t l = buf[p++];
            if (p + l > next) {
                break;
            }
            if (l > 0) {
                rr.txt.emplace_back(reinterpret_cast<const char*>(buf + p), l);
            }
            p += l;
        }
    } else if (rr.type == DnsType::A && rdlen == 4) {
        char ip[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, buf + rdoff, ip, sizeof(ip));
        rr.address = ip;
    }

    off = next;
    return true;
}

}  // namespace

bool DnsCodec::encodeName(const std::string& name, std::vector<uint8_t>& out) {
    for (const auto& label : StringUtils::split(name, '.')) {
        if (label.empty()) {
            continue;
        }
        if (label.size() > 63) {
            return false;
        }
        out.push_back(static_cast<uint8_t>(label.size()));
        out.insert(out.end(), label.begin(), label.end());
    }
    out.push_back(0);
    return true;
}

std::vector<uint8_t> DnsCodec::buildQuery(const std::vector<DnsQuestion>& questions, bool unicastResponse) {
    std::vector<uint8_t> out;
    wr16(out, 0);                                         // id
    wr16(out, 0);                                         // flags
    wr16(out, static_cast<uint16_t>(questions.size()));   // qdcount
    wr16(out, 0);
    wr16(out, 0);
    wr16(out, 0);

    for (const auto& q : questions) {
        if (!encodeName(q.name, out)) {
            return {};
        }
        wr16(out, q.type);
        wr16(out, static_cast<uint16_t>(DNS_CLASS_IN | (unicastResponse ? 0x8000 : 0)));
    }
    return out;
}

bool DnsCodec::parse(const uint8_t* data, size_t len, DnsMessage& out, std::string& errorMsg) {
    out = DnsMessage{};
    if (!data || len < DNS_HEADER_SIZE) {
        errorMsg = "DNS message shorter than header";
        return false;
    }

    out.id = rd16(data);
    out.flags = rd16(data + 2);
    const uint16_t qd = rd16(data + 4);
    const size_t rrCount = size_t(rd16(data + 6)) + rd16(data + 8) + rd16(data + 10);

    size_t off = DNS_HEADER_SIZE;
    for (uint16_t i = 0; i < qd; ++i) {
        DnsQuestion q;
        if (!readName(data, len, off, q.name) || off + 4 > len) {
            errorMsg = "Malformed question section";
            return false;
        }
        q.type = rd16(data + off);
        off += 4;
        out.questions.push_back(std::move(q));
    }

    for (size_t i = 0; i < rrCount; ++i) {
        DnsRecord rr;
        if (!parseRecord(data, len, off, rr)) {
            errorMsg = "Malformed resource record";
            return false;
        }
        out.records.push_back(std::move(rr));
    }
    return true;
}

std::string DnsCodec::reversePointerName(const std::string& ip) {
    const auto octets = StringUtils::split(ip, '.');
    std::string out;
    for (auto it = octets.rbegin(); it != octets.rend(); ++it) {
        out += *it;
        out += '.';
    }
    return out + "in-addr.arpa";
}

}  // namespace LanMonitor
