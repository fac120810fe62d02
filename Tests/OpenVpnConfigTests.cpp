#include "TunnelConf/OpenVpnConfig.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "Helpers.hpp"

using namespace TunnelConf;

TEST(OpenVpnConfig, FirstRemoteWins)
{
    const std::vector<std::string> lines = {
        "client",
        "# remote commented.example 1",
        "remote 1.2.3.4 443 tcp",
        "remote 5.6.7.8 1195",
    };
    const OpenVpnConfig::Connection c = OpenVpnConfig::Extract(lines);
    EXPECT_EQ(c.host, "1.2.3.4");
    EXPECT_EQ(c.port, 443);
    EXPECT_EQ(c.protocol, "tcp");
}

TEST(OpenVpnConfig, ProtoDirectiveAndDefaults)
{
    const OpenVpnConfig::Connection c = OpenVpnConfig::Extract({"proto tcp-client", "remote vpn.example.com"});
    EXPECT_EQ(c.host, "vpn.example.com");
    EXPECT_EQ(c.port, 1194);
    EXPECT_EQ(c.protocol, "tcp");
}

TEST(OpenVpnConfig, SkipsInlineBlocks)
{
    const std::vector<std::string> lines = {
        "<ca>",
        "remote not.a.directive 1",
        "</ca>",
        "remote real.example 1195 udp6",
    };
    const OpenVpnConfig::Connection c = OpenVpnConfig::Extract(lines);
    EXPECT_EQ(c.host, "real.example");
    EXPECT_EQ(c.port, 1195);
    EXPECT_EQ(c.protocol, "udp");
}

TEST(OpenVpnConfig, Errors)
{
    struct Case { std::vector<std::string> lines; std::string message; };
    const std::vector<Case> cases = {
        {{"client"},                       "remote line not found"},
        {{"remote host abc"},              "remote port is not valid: abc"},
        {{"remote host 1194 sctp"},        "network protocol not supported: sctp"},
        {{"proto icmp", "remote host"},    "network protocol not supported: icmp"},
    };

    for (const Case &c : cases)
    {
        SCOPED_TRACE(c.message);
        try
        {
            (void)OpenVpnConfig::Extract(c.lines);
            ADD_FAILURE() << "no exception";
        }
        catch (const std::runtime_error &e)
        {
            EXPECT_EQ(std::string(e.what()), c.message);
        }
    }
}

TEST(OpenVpnConfig, ExtractFile)
{
    TestHelpers::TempDir dir;
    const std::string path = dir.Write("custom.ovpn", "client\nremote 9.9.9.9 1194\n");
    EXPECT_EQ(OpenVpnConfig::ExtractFile(path).host, "9.9.9.9");

    EXPECT_THROW((void)OpenVpnConfig::ExtractFile((dir.Path() / "missing.ovpn").string()),
                 std::runtime_error);
}
