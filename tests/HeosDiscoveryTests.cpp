//
//  HeosDiscoveryTests.cpp
//  heoslink Tests
//
//  SSDP response parsing.
//

#include <gtest/gtest.h>

#include "HeosDiscovery.h"

namespace {

const char* kResponse =
    "HTTP/1.1 200 OK\r\n"
    "CACHE-CONTROL: max-age=180\r\n"
    "EXT:\r\n"
    "Location: http://192.168.1.40:60006/upnp/desc/aios_device/aios_device.xml\r\n"
    "SERVER: LINUX UPnP/1.0 Denon-Heos/149200\r\n"
    "ST: urn:schemas-denon-com:device:ACT-Denon:1\r\n"
    "USN: uuid:7b0a0f0a-1111-2222-3333-000000000000::urn:schemas-denon-com:device:ACT-Denon:1\r\n"
    "\r\n";

} // namespace

TEST(HeosDiscoveryTests, HeaderLookupIsCaseInsensitive) {
    EXPECT_EQ(ssdpHeader(kResponse, "ST"), HEOS_SSDP_TARGET);
    EXPECT_EQ(ssdpHeader(kResponse, "location"),
              "http://192.168.1.40:60006/upnp/desc/aios_device/aios_device.xml");
    EXPECT_EQ(ssdpHeader(kResponse, "cache-control"), "max-age=180");
}

TEST(HeosDiscoveryTests, MissingOrEmptyHeader) {
    EXPECT_EQ(ssdpHeader(kResponse, "EXT"), "");
    EXPECT_EQ(ssdpHeader(kResponse, "NT"), "");
    EXPECT_EQ(ssdpHeader("", "ST"), "");
}

TEST(HeosDiscoveryTests, HostFromLocation) {
    EXPECT_EQ(hostFromLocation("http://192.168.1.40:60006/upnp/desc.xml"), "192.168.1.40");
    EXPECT_EQ(hostFromLocation("http://10.0.0.7/desc.xml"), "10.0.0.7");
    EXPECT_EQ(hostFromLocation("10.0.0.8:1255"), "10.0.0.8");
    EXPECT_EQ(hostFromLocation(""), "");
}
