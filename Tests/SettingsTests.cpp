#include "TunnelConf/Settings/Settings.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Resolver.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "Helpers.hpp"

using namespace TunnelConf;

namespace
{

Settings WireguardFragment(const std::string &provider)
{
    Settings s;
    s.vpn.type = "wireguard";
    s.vpn.provider = provider;
    s.vpn.wireguard.private_key = TestHelpers::kPrivateKey;
    s.vpn.wireguard.public_key  = TestHelpers::kPublicKey;
    s.vpn.wireguard.endpoint    = ParseEndpoint("1.2.3.4:51820");
    s.vpn.wireguard.addresses   = IpNetworks{ParseCidr("10.64.222.21/32")};
    return s;
}

Settings OpenVpnFragment()
{
    Settings s;
    s.vpn.provider = "nordvpn";
    s.vpn.openvpn.user = "john";
    s.vpn.openvpn.password = "secret";
    return s;
}

Settings WithDefaults(const Settings &s)
{
    return Resolver::Combine<Settings>({s}, {});
}

}

TEST(Settings, EmptyFragment)
{
    EXPECT_TRUE(Settings{}.Empty());

    Settings s;
    s.updater.mullvad = false;
    EXPECT_FALSE(s.Empty());
}

TEST(Settings, DefaultsApplyToEveryDomain)
{
    const Settings d = WithDefaults(Settings{});
    EXPECT_EQ(d.vpn.type, "openvpn");
    EXPECT_EQ(d.vpn.provider, "private internet access");
    EXPECT_EQ(d.vpn.openvpn.encryption_preset, "strong");
    EXPECT_EQ(d.vpn.wireguard.interface_name, "wg0");
    EXPECT_EQ(d.control_server.address, ":8000");
    EXPECT_EQ(d.updater.period, std::chrono::seconds(0));
}

TEST(Settings, MergeDelegatesToEveryDomain)
{
    Settings a;
    a.vpn.provider = "mullvad";
    a.control_server.log = false;

    Settings b;
    b.vpn.provider = "nordvpn";
    b.vpn.type = "wireguard";
    b.control_server.address = ":9000";
    b.updater.dns_address = "9.9.9.9";

    Settings merged = a.Copy();
    merged.MergeWith(b);
    EXPECT_EQ(merged.vpn.provider, "mullvad");
    EXPECT_EQ(merged.vpn.type, "wireguard");
    EXPECT_EQ(merged.control_server.log, false);
    EXPECT_EQ(merged.control_server.address, ":9000");
    EXPECT_EQ(merged.updater.dns_address, "9.9.9.9");

    Settings overridden = a.Copy();
    overridden.OverrideWith(b);
    EXPECT_EQ(overridden.vpn.provider, "nordvpn");
    EXPECT_EQ(overridden.control_server.log, false);

    EXPECT_EQ(a.vpn.provider, "mullvad");
    EXPECT_FALSE(a.vpn.type.has_value());
}

TEST(Settings, ValidSettingsPass)
{
    EXPECT_NO_THROW(WithDefaults(OpenVpnFragment()).Validate());
    EXPECT_NO_THROW(WithDefaults(WireguardFragment("mullvad")).Validate());
}

TEST(Settings, ValidationErrorsCarryDomainPrefix)
{
    struct Case
    {
        std::string name;
        Settings fragment;
        Errc code;
        std::string message;
    };

    Settings bad_type = OpenVpnFragment();
    bad_type.vpn.type = "ipsec";

    Settings bad_provider = OpenVpnFragment();
    bad_provider.vpn.provider = "acme";

    Settings bad_user = OpenVpnFragment();
    bad_user.vpn.openvpn.user = "";

    Settings bad_address = OpenVpnFragment();
    bad_address.control_server.address = "8000";

    Settings bad_period = OpenVpnFragment();
    bad_period.updater.period = std::chrono::seconds(10);

    const std::vector<Case> cases = {
        {"vpn type", bad_type, Errc::VpnTypeInvalid,
         "VPN settings: VPN type is not valid: ipsec is not one of openvpn, wireguard"},
        {"provider", bad_provider, Errc::ProviderInvalid,
         "VPN settings: VPN provider is not valid: acme"},
        {"wireguard not supported", WireguardFragment("privado"), Errc::WireguardNotSupported,
         "VPN settings: Wireguard is not supported by VPN provider: privado"},
        {"openvpn user", bad_user, Errc::OpenVpnUserEmpty,
         "VPN settings: OpenVPN user is empty"},
        {"control server", bad_address, Errc::ControlServerAddressInvalid,
         "control server settings: control server listening address is not valid: "
         "8000: missing port in address"},
        {"updater", bad_period, Errc::UpdaterPeriodTooSmall,
         "updater settings: updater period is too small: 10s must be at least 1m0s"},
    };

    for (const Case &c : cases)
    {
        SCOPED_TRACE(c.name);
        try
        {
            WithDefaults(c.fragment).Validate();
            ADD_FAILURE() << "no exception";
        }
        catch (const ValidationError &e)
        {
            EXPECT_EQ(e.Code(), c.code);
            EXPECT_EQ(std::string(e.what()), c.message);
        }
    }
}

TEST(Settings, RenderingShowsSelectedProtocol)
{
    const Settings openvpn = WithDefaults(OpenVpnFragment());
    const std::vector<std::string> lines = openvpn.ToLines();
    ASSERT_GE(lines.size(), 5u);
    EXPECT_EQ(lines[0], "Settings summary:");
    EXPECT_EQ(lines[1], "├── VPN settings:");
    EXPECT_EQ(lines[2], "    ├── VPN type: openvpn");
    EXPECT_EQ(lines[3], "    ├── VPN provider: nordvpn");
    EXPECT_EQ(lines[4], "    └── OpenVPN settings:");
    EXPECT_EQ(openvpn.String().find("Wireguard settings:"), std::string::npos);

    const Settings wireguard = WithDefaults(WireguardFragment("mullvad"));
    const std::string text = wireguard.String();
    EXPECT_NE(text.find("Wireguard settings:"), std::string::npos);
    EXPECT_EQ(text.find("OpenVPN settings:"), std::string::npos);
    EXPECT_NE(text.find("└── Server data updater settings:"), std::string::npos);
    EXPECT_EQ(text.find(TestHelpers::kPrivateKey), std::string::npos);
}
