/**
 * @file net_utils_test.cpp
 * @brief Tests for address parsing and subnet helpers.
 */

#include "lanmonitor/NetUtils.h"

#include <gtest/gtest.h>

using namespace LanMonitor;

TEST(NetUtilsTest, NormalizeMacAcceptsCommonStyles) {
    EXPECT_EQ(NetUtils::normalizeMac("AA:BB:CC:DD:EE:FF"), "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(NetUtils::normalizeMac("aa-bb-cc-dd-ee-ff"), "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(NetUtils::normalizeMac("aabb.ccdd.eeff"), "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(NetUtils::normalizeMac("aabbccddeeff"), "aa:bb:cc:dd:ee:ff");
}

TEST(NetUtilsTest, NormalizeMacRejectsMalformedInput) {
    EXPECT_EQ(NetUtils::normalizeMac("aa:bb:cc:dd:ee"), "");
    EXPECT_EQ(NetUtils::normalizeMac("(incomplete)"), "");
    EXPECT_EQ(NetUtils::normalizeMac(""), "");
}

TEST(NetUtilsTest, ParseIpv4) {
    EXPECT_EQ(NetUtils::parseIpv4("192.168.1.10").value_or(0), 0xC0A8010Au);
    EXPECT_FALSE(NetUtils::parseIpv4("192.168.1").has_value());
    EXPECT_FALSE(NetUtils::parseIpv4("192.168.1.256").has_value());
    EXPECT_FALSE(NetUtils::parseIpv4("host.local").has_value());
    EXPECT_EQ(NetUtils::formatIpv4(0xC0A8010Au), "192.168.1.10");
}

TEST(NetUtilsTest, ParseCidrClearsHostBits) {
    auto net = NetUtils::parseCidr("192.168.1.77/24");
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(net->toString(), "192.168.1.0/24");
    EXPECT_EQ(NetUtils::formatIpv4(net->broadcast()), "192.168.1.255");
    EXPECT_TRUE(net->contains(*NetUtils::parseIpv4("192.168.1.200")));
    EXPECT_FALSE(net->contains(*NetUtils::parseIpv4("192.168.2.1")));
}

TEST(NetUtilsTest, ParseCidrRejectsBadInput) {
    EXPECT_FALSE(NetUtils::parseCidr("192.168.1.0/33").has_value());
    EXPECT_FALSE(NetUtils::parseCidr("192.168.1.0/x").has_value());
    EXPECT_FALSE(NetUtils::parseCidr("not-a-subnet").has_value());
    EXPECT_EQ(NetUtils::parseCidr("10.0.0.5")->prefixLength, 32);
}

TEST(NetUtilsTest, HostAddressesSkipNetworkAndBroadcast) {
    auto hosts = NetUtils::hostAddresses(*NetUtils::parseCidr("10.0.0.0/30"), 100);
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0], "10.0.0.1");
    EXPECT_EQ(hosts[1], "10.0.0.2");

    EXPECT_EQ(NetUtils::hostAddresses(*NetUtils::parseCidr("10.0.0.0/24"), 254).size(), 254u);
    EXPECT_EQ(NetUtils::hostAddresses(*NetUtils::parseCidr("10.0.0.0/16"), 254).size(), 254u);
    EXPECT_EQ(NetUtils::hostAddresses(*NetUtils::parseCidr("10.0.0.9/32"), 10).front(), "10.0.0.9");
}

TEST(NetUtilsTest, ResolveScanSubnetPrefersExplicitThenConfigured) {
    EXPECT_EQ(NetUtils::resolveScanSubnet(std::string("10.9.0.0/24"), "10.1.0.0/24", ""), "10.9.0.0/24");
    EXPECT_EQ(NetUtils::resolveScanSubnet(std::nullopt, "10.1.0.0/24", ""), "10.1.0.0/24");
}

TEST(NetUtilsTest, LoopbackAndLinkLocal) {
    EXPECT_TRUE(NetUtils::isLoopbackOrLinkLocal("127.0.0.1"));
    EXPECT_TRUE(NetUtils::isLoopbackOrLinkLocal("169.254.10.1"));
    EXPECT_FALSE(NetUtils::isLoopbackOrLinkLocal("192.168.1.1"));
}
