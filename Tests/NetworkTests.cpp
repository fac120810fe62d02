#include "TunnelConf/Network.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace TunnelConf;

TEST(Network, ParseCidr)
{
    const IpNetwork v4 = ParseCidr("10.38.22.35/32");
    ASSERT_TRUE(v4.ip.has_value());
    EXPECT_EQ(v4.ip->to_string(), "10.38.22.35");
    EXPECT_EQ(v4.prefix_length, 32u);

    const IpNetwork v6 = ParseCidr("::/0");
    ASSERT_TRUE(v6.ip.has_value());
    EXPECT_TRUE(IsIPv6(*v6.ip));
    EXPECT_EQ(v6.prefix_length, 0u);
    EXPECT_EQ(ToString(v6), "::/0");
}

TEST(Network, ParseCidrRejectsMalformed)
{
    for (const std::string s : {"x", "10.0.0.1", "10.0.0.1/33", "::1/129", "10.0.0.1/", "/24"})
    {
        SCOPED_TRACE(s);
        try
        {
            (void)ParseCidr(s);
            ADD_FAILURE() << "no exception";
        }
        catch (const std::invalid_argument &e)
        {
            EXPECT_EQ(std::string(e.what()), "invalid CIDR address: " + s);
        }
    }
}

TEST(Network, ParseCidrListKeepsOrder)
{
    const IpNetworks list = ParseCidrList("10.0.0.0/8, fd00::/64 ,");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(ToString(*list[0]), "10.0.0.0/8");
    EXPECT_EQ(ToString(*list[1]), "fd00::/64");
}

TEST(Network, ParseEndpoint)
{
    const Endpoint v4 = ParseEndpoint("1.2.3.4:51820");
    EXPECT_EQ(v4.ip->to_string(), "1.2.3.4");
    EXPECT_EQ(v4.port, 51820);
    EXPECT_EQ(ToString(v4), "1.2.3.4:51820");

    const Endpoint v6 = ParseEndpoint("[2001:db8::1]:443");
    EXPECT_EQ(v6.port, 443);
    EXPECT_EQ(ToString(v6), "[2001:db8::1]:443");

    for (const std::string s : {"1.2.3.4", "1.2.3.4:0", "1.2.3.4:70000", "host:80", "::1:80", "[::1]80"})
    {
        SCOPED_TRACE(s);
        EXPECT_THROW((void)ParseEndpoint(s), std::invalid_argument);
    }
}

TEST(Network, ParsePort)
{
    EXPECT_EQ(ParsePort("1"), 1);
    EXPECT_EQ(ParsePort("65535"), 65535);
    EXPECT_THROW((void)ParsePort("0"), std::invalid_argument);
    EXPECT_THROW((void)ParsePort("65536"), std::invalid_argument);
    EXPECT_THROW((void)ParsePort("8o"), std::invalid_argument);
}

TEST(Network, IPv4MappedIsNotIPv6)
{
    EXPECT_FALSE(IsIPv6(ParseAddress("::ffff:1.2.3.4")));
    EXPECT_FALSE(IsIPv6(ParseAddress("1.2.3.4")));
    EXPECT_TRUE(IsIPv6(ParseAddress("2001:db8::1")));
}

TEST(Network, InterfaceName)
{
    EXPECT_TRUE(IsValidInterfaceName("wg0"));
    EXPECT_TRUE(IsValidInterfaceName("tun_1"));
    EXPECT_FALSE(IsValidInterfaceName(""));
    EXPECT_FALSE(IsValidInterfaceName("wg-0"));
    EXPECT_FALSE(IsValidInterfaceName("wg 0"));
}

TEST(Network, MissingPartsRenderAsNil)
{
    EXPECT_EQ(ToString(IpNetwork{}), "<nil>/<nil>");
    IpNetwork no_mask;
    no_mask.ip = ParseAddress("10.0.0.1");
    EXPECT_EQ(ToString(no_mask), "10.0.0.1/<nil>");
}
