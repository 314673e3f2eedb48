/**
 * @file DnsMessage.h
 * @brief Minimal DNS wire format codec for mDNS queries and responses
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace LanMonitor {

namespace DnsType {
constexpr uint16_t A = 1;
constexpr uint16_t PTR = 12;
constexpr uint16_t TXT = 16;
constexpr uint16_t SRV = 33;
}  // namespace DnsType

constexpr uint16_t DNS_CLASS_IN = 1;
constexpr size_t DNS_HEADER_SIZE = 12;

struct DnsQuestion {
    std::string name;
    uint16_t type = DnsType::PTR;
};

/**
 * @brief One resource record; only the fields of its type are filled.
 *
 * Names keep their original case and have no trailing dot.
 */
struct DnsRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rrClass = 0;         ///< cache-flush bit cleared
    uint32_t ttl = 0;

    std::string target;           ///< PTR target or SRV host
    uint16_t port = 0;            ///< SRV
    std::vector<std::string> txt; ///< TXT character-strings
    std::string address;          ///< A, dotted quad
};

struct DnsMessage {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<DnsQuestion> questions;
    std::vector<DnsRecord> records;   ///< answer, authority and additional sections
};

class DnsCodec {
public:
    /**
     * @brief Build a query carrying the given questions.
     * @param unicastResponse Set the QU bit so responders answer by unicast
     * @return Empty if a label is longer than 63 bytes
     */
    static std::vector<uint8_t> buildQuery(const std::vector<DnsQuestion>& questions,
                                           bool unicastResponse = false);

    /**
     * @brief Parse a complete DNS message.
     *
     * Records of unknown types are kept with only name/type/class/ttl set.
     * @return false on truncation or a malformed name
     */
    static bool parse(const uint8_t* data, size_t len, DnsMessage& out, std::string& errorMsg);

    /// Append a dotted name as length-prefixed labels.
    static bool encodeName(const std::string& name, std::vector<uint8_t>& out);

    /// "192.168.1.10" -> "10.1.168.192.in-addr.arpa"
    static std::string reversePointerName(const std::string& ip);
};

}  // namespace LanMonitor
