#include <gtest/gtest.h>
#include "core/PortRegistry.h"

TEST(PortRegistryTest, KnownPortsResolve) {
    const uint16_t required[] = {21, 22, 23, 25, 53, 80, 110, 123, 143, 161, 443,
                                 465, 587, 993, 995, 1194, 1723, 3389, 5060, 8080, 8443};
    for (auto port : required) {
        EXPECT_TRUE(lookupService(port).has_value()) << "port " << port;
    }
}

TEST(PortRegistryTest, EntriesCarryProtocolAndName) {
    auto dns = lookupService(53);
    ASSERT_TRUE(dns.has_value());
    EXPECT_EQ(dns->name, "DNS");
    EXPECT_EQ(dns->protocol, "udp");

    auto https = lookupService(443);
    ASSERT_TRUE(https.has_value());
    EXPECT_EQ(https->name, "HTTPS");
    EXPECT_EQ(https->protocol, "tcp");
}

// TEST Unregistered ports are simply absent
TEST(PortRegistryTest, UnknownPortIsAbsent) {
    EXPECT_FALSE(lookupService(0).has_value());
    EXPECT_FALSE(lookupService(31337).has_value());
}
