/**
 * @file subnet_discovery_test.cpp
 * @brief Tests for technique merging, output parsers and host verification.
 */

#include "lanmonitor/SubnetDiscovery.h"

#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>

using namespace LanMonitor;

namespace {

DiscoveredHost makeHost(const std::string& ip, const std::string& mac) {
    DiscoveredHost h;
    h.ip = ip;
    h.mac = mac;
    return h;
}

class FakeBackend : public DiscoveryBackend {
public:
    std::vector<DiscoveredHost> arpHosts;
    bool arpThrows = false;
    std::optional<std::string> sweepOutput;
    std::string neighborCache;
    std::map<std::string, bool> pingReplies;
    std::map<std::string, std::string> arpAnswers;
    std::map<std::string, std::string> names;

    std::atomic<int> arpCalls{0};
    std::atomic<int> pingCalls{0};

    std::vector<DiscoveredHost> arpBroadcastSweep(const Ipv4Network&, std::chrono::milliseconds) override {
        ++arpCalls;
        if (arpThrows) {
            throw std::runtime_error("raw socket not permitted");
        }
        return arpHosts;
    }

    std::optional<std::string> runArpSweepTool(const Ipv4Network&) override {
        return sweepOutput;
    }

    std::string readNeighborCache() override {
        return neighborCache;
    }

    bool ping(const std::string& ip) override {
        ++pingCalls;
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = pingReplies.find(ip);
        return it != pingReplies.end() && it->second;
    }

    std::optional<std::string> arpProbe(const std::string& ip) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = arpAnswers.find(ip);
        if (it == arpAnswers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> reverseLookup(const std::string& ip) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = names.find(ip);
        if (it == names.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::mutex m_mutex;
};

DiscoveryOptions fastOptions() {
    DiscoveryOptions o;
    o.arpRetryDelay = std::chrono::milliseconds(0);
    o.pingBatchTimeout = std::chrono::milliseconds(200);
    return o;
}

}  // namespace

//=============================================================================
// Parsers
//=============================================================================

TEST(SubnetDiscoveryParserTest, ArpSweepOutputRows) {
    const std::string output =
        "Interface: eth0, type: EN10MB, MAC: 02:11:22:33:44:55, IPv4: 192.168.1.2\n"
        "Starting arp-scan 1.10.0 with 256 hosts\n"
        "192.168.1.1\taa:bb:cc:dd:ee:01\tUbiquiti Inc\n"
        "192.168.1.20\tB8:27:EB:11:22:33\t\n"
        "192.168.1.30\tnot-a-mac\tNobody\n"
        "\n"
        "3 packets received by filter, 0 packets dropped by kernel\n";

    VendorLookup vendors;
    auto hosts = SubnetDiscovery::parseArpSweepOutput(output, &vendors);
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].ip, "192.168.1.1");
    EXPECT_EQ(hosts[0].mac, "aa:bb:cc:dd:ee:01");
    EXPECT_EQ(hosts[0].vendor.value_or(""), "Ubiquiti Inc");
    EXPECT_EQ(hosts[0].method, DiscoveryMethod::ARP_SWEEP_TOOL);
    EXPECT_EQ(hosts[1].mac, "b8:27:eb:11:22:33");
    EXPECT_EQ(hosts[1].vendor.value_or(""), "Raspberry Pi");
}

TEST(SubnetDiscoveryParserTest, NeighborCacheFormats) {
    const std::string output =
        "? (192.168.1.1) at aa:bb:cc:dd:ee:01 [ether] on eth0\n"
        "? (192.168.1.9) at <incomplete> on eth0\n"
        "192.168.1.5 dev eth0 lladdr AA:BB:CC:DD:EE:05 REACHABLE\n"
        "192.168.1.6 dev eth0 lladdr aa:bb:cc:dd:ee:06 FAILED\n"
        "192.168.1.7 dev eth0  FAILED\n"
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "192.168.1.8      0x1         0x2         aa:bb:cc:dd:ee:08     *        eth0\n"
        "192.168.1.10     0x1         0x0         00:00:00:00:00:00     *        eth0\n"
        "192.168.1.255    0x1         0x2         ff:ff:ff:ff:ff:ff     *        eth0\n"
        "192.168.1.11 dev eth0 lladdr aa:bb:cc:dd:ee:01 STALE\n";

    auto hosts = SubnetDiscovery::parseNeighborCache(output);
    ASSERT_EQ(hosts.size(), 3u);
    EXPECT_EQ(hosts[0].ip, "192.168.1.1");
    EXPECT_EQ(hosts[1].ip, "192.168.1.5");
    EXPECT_EQ(hosts[1].mac, "aa:bb:cc:dd:ee:05");
    EXPECT_EQ(hosts[2].ip, "192.168.1.8");
    for (const auto& h : hosts) {
        EXPECT_EQ(h.method, DiscoveryMethod::NEIGHBOR_CACHE);
    }
}

//=============================================================================
// discover()
//=============================================================================

TEST(SubnetDiscoveryTest, InvalidSubnetThrows) {
    auto backend = std::make_shared<FakeBackend>();
    SubnetDiscovery discovery(backend, nullptr, fastOptions());
    EXPECT_THROW(discovery.discover("192.168.1.0/40"), std::invalid_argument);
    EXPECT_THROW(discovery.discover("lan"), std::invalid_argument);
}

TEST(SubnetDiscoveryTest, MergesTechniquesByMacWithArpPrecedence) {
    auto backend = std::make_shared<FakeBackend>();
    backend->arpHosts = {makeHost("192.168.1.20", "B8-27-EB-11-22-33")};
    backend->sweepOutput = std::string(
        "192.168.1.20\tb8:27:eb:11:22:33\tRaspberry Pi Trading\n"
        "192.168.1.30\taa:bb:cc:dd:ee:30\tAcme\n");
    backend->neighborCache =
        "? (192.168.1.30) at aa:bb:cc:dd:ee:30 [ether] on eth0\n"
        "? (192.168.1.40) at aa:bb:cc:dd:ee:40 [ether] on eth0\n"
        "? (10.0.0.5) at aa:bb:cc:dd:ee:50 [ether] on eth1\n";
    backend->names["192.168.1.40"] = "printer.lan";

    auto vendors = std::make_shared<VendorLookup>();
    SubnetDiscovery discovery(backend, vendors, fastOptions());
    auto hosts = discovery.discover("192.168.1.0/24");

    ASSERT_EQ(hosts.size(), 3u);
    EXPECT_EQ(hosts[0].mac, "b8:27:eb:11:22:33");
    EXPECT_EQ(hosts[0].method, DiscoveryMethod::ARP_BROADCAST);
    EXPECT_EQ(hosts[0].vendor.value_or(""), "Raspberry Pi");
    EXPECT_EQ(hosts[1].mac, "aa:bb:cc:dd:ee:30");
    EXPECT_EQ(hosts[1].method, DiscoveryMethod::ARP_SWEEP_TOOL);
    EXPECT_EQ(hosts[1].vendor.value_or(""), "Acme");
    EXPECT_EQ(hosts[2].mac, "aa:bb:cc:dd:ee:40");
    EXPECT_EQ(hosts[2].method, DiscoveryMethod::NEIGHBOR_CACHE);
    EXPECT_EQ(hosts[2].hostname.value_or(""), "printer.lan");

    EXPECT_EQ(backend->arpCalls.load(), 2);
    EXPECT_GT(backend->pingCalls.load(), 0);
}

TEST(SubnetDiscoveryTest, FailedTechniqueDoesNotAbortDiscovery) {
    auto backend = std::make_shared<FakeBackend>();
    backend->arpThrows = true;
    backend->neighborCache = "192.168.1.5 dev eth0 lladdr aa:bb:cc:dd:ee:05 REACHABLE\n";

    SubnetDiscovery discovery(backend, nullptr, fastOptions());
    auto hosts = discovery.discover("192.168.1.0/24");
    ASSERT_EQ(hosts.size(), 1u);
    EXPECT_EQ(hosts[0].ip, "192.168.1.5");
}

TEST(SubnetDiscoveryTest, EmptyNetworkYieldsNoHosts) {
    auto backend = std::make_shared<FakeBackend>();
    SubnetDiscovery discovery(backend, nullptr, fastOptions());
    EXPECT_TRUE(discovery.discover("192.168.1.0/24").empty());
}

//=============================================================================
// verifyHostOnline()
//=============================================================================

TEST(SubnetDiscoveryTest, VerifyAcceptsPingReply) {
    auto backend = std::make_shared<FakeBackend>();
    backend->pingReplies["192.168.1.20"] = true;
    SubnetDiscovery discovery(backend, nullptr, fastOptions());
    EXPECT_TRUE(discovery.verifyHostOnline("192.168.1.20", std::string("b8:27:eb:11:22:33")));
}

TEST(SubnetDiscoveryTest, VerifyFallsBackToArpAndChecksMac) {
    auto backend = std::make_shared<FakeBackend>();
    backend->arpAnswers["192.168.1.20"] = "B8:27:EB:11:22:33";
    SubnetDiscovery discovery(backend, nullptr, fastOptions());

    EXPECT_TRUE(discovery.verifyHostOnline("192.168.1.20", std::string("b8:27:eb:11:22:33")));
    EXPECT_FALSE(discovery.verifyHostOnline("192.168.1.20", std::string("aa:aa:aa:aa:aa:aa")));
}

TEST(SubnetDiscoveryTest, VerifyUsesNeighborCacheLast) {
    auto backend = std::make_shared<FakeBackend>();
    backend->neighborCache = "192.168.1.20 dev eth0 lladdr b8:27:eb:11:22:33 STALE\n";
    SubnetDiscovery discovery(backend, nullptr, fastOptions());

    EXPECT_TRUE(discovery.verifyHostOnline("192.168.1.20"));
    EXPECT_FALSE(discovery.verifyHostOnline("192.168.1.21"));
}
