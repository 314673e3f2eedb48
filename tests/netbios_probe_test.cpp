#include "lanmonitor/NetbiosProbe.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace LanMonitor;

TEST(NetbiosProbeTest, StatusQueryIsWildcardNbstat) {
    auto q = NetbiosProbe::buildStatusQuery();
    ASSERT_EQ(q.size(), 50u);
    EXPECT_EQ(q[1], 0x01);
    EXPECT_EQ(q[12], 0x20);
    EXPECT_EQ(q[13], 'C');   // '*' = 0x2A -> 'C','K'
    EXPECT_EQ(q[14], 'K');
    EXPECT_EQ(q[47], 0x21);
}

TEST(NetbiosProbeTest, ParsesFirstWorkstationName) {
    std::vector<uint8_t> reply(57, 0);
    reply[56] = 3;
    auto addName = [&reply](const std::string& name, uint8_t type) {
        std::string padded = name;
        padded.resize(15, ' ');
        reply.insert(reply.end(), padded.begin(), padded.end());
        reply.push_back(type);
        reply.push_back(0x04);
        reply.push_back(0x00);
    };
    addName("WORKGROUP", 0x1E);
    addName("*", 0x00);
    addName("DESKTOP-42", 0x20);

    auto name = NetbiosProbe::parseStatusReply(reply.data(), reply.size());
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "DESKTOP-42");
}

TEST(NetbiosProbeTest, ShortReplyYieldsNothing) {
    std::vector<uint8_t> reply(40, 0);
    EXPECT_FALSE(NetbiosProbe::parseStatusReply(reply.data(), reply.size()).has_value());
}
