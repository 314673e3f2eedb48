/**
 * @file ssdp_probe_test.cpp
 * @brief Tests for SSDP request/response handling and UPnP descriptions.
 */

#include "lanmonitor/SsdpProbe.h"

#include <gtest/gtest.h>

using namespace LanMonitor;

TEST(SsdpProbeTest, SearchRequestIsMSearchAll) {
    const std::string req = SsdpProbe::buildSearchRequest();
    EXPECT_EQ(req.rfind("M-SEARCH * HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(req.find("HOST: 239.255.255.250:1900\r\n"), std::string::npos);
    EXPECT_NE(req.find("MAN: \"ssdp:discover\"\r\n"), std::string::npos);
    EXPECT_NE(req.find("ST: ssdp:all\r\n"), std::string::npos);
    EXPECT_EQ(req.substr(req.size() - 4), "\r\n\r\n");
}

TEST(SsdpProbeTest, ParsesResponseHeaders) {
    auto h = SsdpProbe::parseResponseHeaders(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "Location: http://192.168.1.1:49152/rootDesc.xml\r\n"
        "SERVER: Linux/3.14 UPnP/1.0 MiniUPnPd/2.1\r\n"
        "ST: upnp:rootdevice\r\n\r\n");
    EXPECT_EQ(h["location"], "http://192.168.1.1:49152/rootDesc.xml");
    EXPECT_EQ(h["server"], "Linux/3.14 UPnP/1.0 MiniUPnPd/2.1");
    EXPECT_EQ(h["st"], "upnp:rootdevice");
    EXPECT_EQ(h.count("HTTP/1.1 200 OK"), 0u);
}

TEST(SsdpProbeTest, DescriptionUsesRootDeviceFields) {
    const std::string xml = R"(<?xml version="1.0"?>
<root xmlns="urn:schemas-upnp-org:device-1-0">
  <specVersion><major>1</major></specVersion>
  <device>
    <deviceType>urn:schemas-upnp-org:device:InternetGatewayDevice:1</deviceType>
    <friendlyName> Home Router </friendlyName>
    <manufacturer>AT&amp;T</manufacturer>
    <modelName>BGW210</modelName>
    <modelDescription></modelDescription>
    <deviceList>
      <device>
        <deviceType>urn:schemas-upnp-org:device:WANDevice:1</deviceType>
        <friendlyName>WAN Device</friendlyName>
      </device>
    </deviceList>
  </device>
</root>)";

    auto d = SsdpProbe::parseDescription(xml);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->deviceType.value_or(""), "urn:schemas-upnp-org:device:InternetGatewayDevice:1");
    EXPECT_EQ(d->friendlyName.value_or(""), "Home Router");
    EXPECT_EQ(d->manufacturer.value_or(""), "AT&T");
    EXPECT_EQ(d->modelName.value_or(""), "BGW210");
    EXPECT_FALSE(d->modelDescription.has_value());
}

TEST(SsdpProbeTest, DescriptionWithoutDeviceElement) {
    EXPECT_FALSE(SsdpProbe::parseDescription("<root><specVersion/></root>").has_value());
    EXPECT_FALSE(SsdpProbe::parseDescription("").has_value());
}

TEST(SsdpProbeTest, InvalidAddressIsNotProbed) {
    EXPECT_FALSE(SsdpProbe::probe("not-an-ip", std::chrono::milliseconds(10)).has_value());
}
