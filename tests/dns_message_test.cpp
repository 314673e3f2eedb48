/**
 * @file dns_message_test.cpp
 * @brief Tests for the DNS codec and fallback record joining.
 */

#include "lanmonitor/DnsMessage.h"
#include "lanmonitor/MdnsFallbackBrowser.h"

#include <gtest/gtest.h>

using namespace LanMonitor;

namespace {

/// Builds response messages record by record (uncompressed names).
class ResponseBuilder {
public:
    ResponseBuilder() : m_bytes(DNS_HEADER_SIZE, 0) {
        m_bytes[2] = 0x84;   // response, authoritative
    }

    ResponseBuilder& ptr(const std::string& owner, const std::string& target) {
        std::vector<uint8_t> rdata;
        DnsCodec::encodeName(target, rdata);
        return add(owner, DnsType::PTR, rdata);
    }

    ResponseBuilder& srv(const std::string& owner, uint16_t port, const std::string& host) {
        std::vector<uint8_t> rdata = {0, 0, 0, 0, static_cast<uint8_t>(port >> 8), static_cast<uint8_t>(port & 0xFF)};
        DnsCodec::encodeName(host, rdata);
        return add(owner, DnsType::SRV, rdata);
    }

    ResponseBuilder& txt(const std::string& owner, const std::vector<std::string>& strings) {
        std::vector<uint8_t> rdata;
        for (const auto& s : strings) {
            rdata.push_back(static_cast<uint8_t>(s.size()));
            rdata.insert(rdata.end(), s.begin(), s.end());
        }
        return add(owner, DnsType::TXT, rdata);
    }

    ResponseBuilder& a(const std::string& owner, uint8_t a0, uint8_t a1, uint8_t a2, uint8_t a3) {
        return add(owner, DnsType::A, {a0, a1, a2, a3});
    }

    std::vector<uint8_t> bytes() const {
        std::vector<uint8_t> out = m_bytes;
        out[6] = static_cast<uint8_t>(m_count >> 8);
        out[7] = static_cast<uint8_t>(m_count & 0xFF);
        return out;
    }

private:
    ResponseBuilder& add(const std::string& owner, uint16_t type, const std::vector<uint8_t>& rdata) {
        DnsCodec::encodeName(owner, m_bytes);
        const uint16_t cls = 0x8001;   // cache-flush + IN
        const uint8_t fixed[] = {
            static_cast<uint8_t>(type >> 8), static_cast<uint8_t>(type & 0xFF),
            static_cast<uint8_t>(cls >> 8), static_cast<uint8_t>(cls & 0xFF),
            0, 0, 0x11, 0x94,
            static_cast<uint8_t>(rdata.size() >> 8), static_cast<uint8_t>(rdata.size() & 0xFF)};
        m_bytes.insert(m_bytes.end(), std::begin(fixed), std::end(fixed));
        m_bytes.insert(m_bytes.end(), rdata.begin(), rdata.end());
        ++m_count;
        return *this;
    }

    std::vector<uint8_t> m_bytes;
    uint16_t m_count = 0;
};

DnsMessage parseOrFail(const std::vector<uint8_t>& bytes) {
    DnsMessage message;
    std::string err;
    EXPECT_TRUE(DnsCodec::parse(bytes.data(), bytes.size(), message, err)) << err;
    return message;
}

}  // namespace

//=============================================================================
// Codec
//=============================================================================

TEST(DnsCodecTest, BuildQueryEncodesQuestions) {
    auto q = DnsCodec::buildQuery({DnsQuestion{"_http._tcp.local", DnsType::PTR}}, true);
    ASSERT_GT(q.size(), DNS_HEADER_SIZE);
    EXPECT_EQ(q[5], 1);   // qdcount

    DnsMessage parsed = parseOrFail(q);
    ASSERT_EQ(parsed.questions.size(), 1u);
    EXPECT_EQ(parsed.questions[0].name, "_http._tcp.local");
    EXPECT_EQ(parsed.questions[0].type, DnsType::PTR);
    // QU bit on the class
    EXPECT_EQ(q[q.size() - 2], 0x80);
}

TEST(DnsCodecTest, RejectsOverlongLabel) {
    EXPECT_TRUE(DnsCodec::buildQuery({DnsQuestion{std::string(64, 'a') + ".local", DnsType::A}}).empty());
}

TEST(DnsCodecTest, ParsesRecordTypes) {
    auto bytes = ResponseBuilder()
                     .ptr("_googlecast._tcp.local", "Den TV._googlecast._tcp.local")
                     .srv("Den TV._googlecast._tcp.local", 8009, "den-tv.local")
                     .txt("Den TV._googlecast._tcp.local", {"md=Chromecast", "fn=Den TV"})
                     .a("den-tv.local", 192, 168, 1, 44)
                     .bytes();

    DnsMessage m = parseOrFail(bytes);
    ASSERT_EQ(m.records.size(), 4u);
    EXPECT_EQ(m.records[0].target, "Den TV._googlecast._tcp.local");
    EXPECT_EQ(m.records[1].port, 8009);
    EXPECT_EQ(m.records[1].target, "den-tv.local");
    EXPECT_EQ(m.records[1].rrClass, DNS_CLASS_IN);
    ASSERT_EQ(m.records[2].txt.size(), 2u);
    EXPECT_EQ(m.records[2].txt[1], "fn=Den TV");
    EXPECT_EQ(m.records[3].address, "192.168.1.44");
    EXPECT_EQ(m.records[3].ttl, 0x1194u);
}

TEST(DnsCodecTest, FollowsCompressionPointers) {
    std::vector<uint8_t> bytes(DNS_HEADER_SIZE, 0);
    bytes[7] = 1;
    const size_t ownerOffset = bytes.size();
    DnsCodec::encodeName("host.local", bytes);
    const uint8_t fixed[] = {0, 12, 0, 1, 0, 0, 0, 10, 0, 7};
    bytes.insert(bytes.end(), std::begin(fixed), std::end(fixed));
    // rdata: "www" + pointer to "host.local"
    bytes.push_back(3);
    bytes.push_back('w');
    bytes.push_back('w');
    bytes.push_back('w');
    bytes.push_back(0xC0);
    bytes.push_back(static_cast<uint8_t>(ownerOffset));
    bytes.push_back(0);   // padding counted in rdlength

    DnsMessage m = parseOrFail(bytes);
    ASSERT_EQ(m.records.size(), 1u);
    EXPECT_EQ(m.records[0].target, "www.host.local");
}

TEST(DnsCodecTest, TruncatedMessageFails) {
    auto bytes = ResponseBuilder().a("den-tv.local", 10, 0, 0, 1).bytes();
    bytes.resize(bytes.size() - 3);
    DnsMessage m;
    std::string err;
    EXPECT_FALSE(DnsCodec::parse(bytes.data(), bytes.size(), m, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(DnsCodec::parse(bytes.data(), 5, m, err));
}

TEST(DnsCodecTest, ReversePointerName) {
    EXPECT_EQ(DnsCodec::reversePointerName("192.168.1.10"), "10.1.168.192.in-addr.arpa");
}

//=============================================================================
// Fallback browse joining
//=============================================================================

TEST(MdnsFallbackJoinTest, JoinsPtrSrvTxtAndA) {
    auto bytes = ResponseBuilder()
                     .ptr("_googlecast._tcp.local", "Den TV._googlecast._tcp.local")
                     .srv("Den TV._googlecast._tcp.local", 8009, "den-tv.local")
                     .txt("Den TV._googlecast._tcp.local", {"md=Chromecast", "fn=Den TV", "flag"})
                     .a("DEN-TV.local", 192, 168, 1, 44)
                     .ptr("_ipp._tcp.local", "Orphan._ipp._tcp.local")
                     .srv("Elsewhere._http._tcp.local", 80, "other.local")
                     .a("other.local", 192, 168, 1, 99)
                     .bytes();
    DnsMessage m = parseOrFail(bytes);

    auto joined = MdnsFallbackBrowser::joinRecords(m.records, {"192.168.1.44"});
    ASSERT_EQ(joined.size(), 1u);
    const auto& records = joined.at("192.168.1.44");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].name, "Den TV");
    EXPECT_EQ(records[0].type, "_googlecast._tcp");
    EXPECT_EQ(records[0].domain, "local");
    EXPECT_EQ(records[0].port, 8009);
    EXPECT_EQ(records[0].txt.at("md"), "Chromecast");
    EXPECT_EQ(records[0].txt.at("flag"), "true");
    EXPECT_TRUE(records[0].isIpv4());
}

TEST(MdnsFallbackJoinTest, LocalNamesFromReverseReply) {
    auto bytes = ResponseBuilder()
                     .ptr("44.1.168.192.in-addr.arpa", "den-tv.local.")
                     .ptr("_services._dns-sd._udp.local", "_googlecast._tcp.local")
                     .a("den-tv.local", 192, 168, 1, 44)
                     .bytes();
    auto names = MdnsFallbackBrowser::localNamesFrom(parseOrFail(bytes));
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "den-tv.local");
}
