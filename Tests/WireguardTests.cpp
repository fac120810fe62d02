#include "TunnelConf/Settings/Wireguard.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Resolver.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <string>
#include <vector>

#include "Helpers.hpp"

using namespace TunnelConf;

namespace
{

Wireguard Valid()
{
    Wireguard w;
    w.interface_name = "wg0";
    w.private_key    = TestHelpers::kPrivateKey;
    w.public_key     = TestHelpers::kPublicKey;
    w.endpoint       = ParseEndpoint("1.2.3.4:51820");
    w.allowed_ips    = IpNetworks{ParseCidr("0.0.0.0/0")};
    w.addresses      = IpNetworks{ParseCidr("10.64.222.21/32")};
    w.firewall_mark  = 51820;
    w.ipv6           = false;
    w.implementation = "auto";
    return w;
}

Wireguard WithDefaults(const Wireguard &w)
{
    return Resolver::Combine<Wireguard>({w}, {});
}

}

TEST(Wireguard, ValidSettingsPass)
{
    EXPECT_NO_THROW(Valid().Validate());

    Wireguard ipv6 = Valid();
    ipv6.ipv6 = true;
    ipv6.allowed_ips = IpNetworks{ParseCidr("0.0.0.0/0"), ParseCidr("::/0")};
    ipv6.addresses = IpNetworks{ParseCidr("10.64.222.21/32"), ParseCidr("fc00:bbbb::1/128")};
    EXPECT_NO_THROW(ipv6.Validate());
}

TEST(Wireguard, ValidationFailsFast)
{
    struct Case
    {
        std::string name;
        std::function<void(Wireguard &)> mutate;
        Errc code;
        std::string message;
    };

    const std::vector<Case> cases = {
        {"empty settings",
         [](Wireguard &w){ w = Wireguard{}; },
         Errc::InterfaceNameInvalid, "invalid interface name: "},
        {"bad interface name",
         [](Wireguard &w){ w.interface_name = "wg-0"; },
         Errc::InterfaceNameInvalid, "invalid interface name: wg-0"},
        {"private key missing",
         [](Wireguard &w){ w.private_key.reset(); },
         Errc::PrivateKeyMissing, "private key is missing"},
        {"private key empty",
         [](Wireguard &w){ w.private_key = ""; },
         Errc::PrivateKeyMissing, "private key is missing"},
        {"private key malformed",
         [](Wireguard &w){ w.private_key = "c2VjcmV0"; },
         Errc::PrivateKeyInvalid, "cannot parse private key"},
        {"public key missing",
         [](Wireguard &w){ w.public_key.reset(); },
         Errc::PublicKeyMissing, "public key is missing"},
        {"public key malformed",
         [](Wireguard &w){ w.public_key = "abc"; },
         Errc::PublicKeyInvalid, "cannot parse public key: abc"},
        {"pre-shared key malformed",
         [](Wireguard &w){ w.pre_shared_key = "bad"; },
         Errc::PreSharedKeyInvalid, "cannot parse pre-shared key"},
        {"endpoint missing",
         [](Wireguard &w){ w.endpoint.reset(); },
         Errc::EndpointMissing, "endpoint is missing"},
        {"endpoint IP missing",
         [](Wireguard &w){ w.endpoint = Endpoint{std::nullopt, 51820}; },
         Errc::EndpointIPMissing, "endpoint IP is missing"},
        {"endpoint port zero",
         [](Wireguard &w){ w.endpoint->port = 0; },
         Errc::EndpointPortMissing, "endpoint port is missing"},
        {"allowed IPs missing",
         [](Wireguard &w){ w.allowed_ips.reset(); },
         Errc::AllowedIPsMissing, "allowed IPs are missing"},
        {"allowed IPs empty",
         [](Wireguard &w){ w.allowed_ips = IpNetworks{}; },
         Errc::AllowedIPsMissing, "allowed IPs are missing"},
        {"allowed IP nil",
         [](Wireguard &w){ w.allowed_ips = IpNetworks{ParseCidr("0.0.0.0/0"), std::nullopt}; },
         Errc::AllowedIPIsNil, "allowed IP is nil: for allowed IP 2 of 2"},
        {"allowed IP without IP",
         [](Wireguard &w){ w.allowed_ips = IpNetworks{IpNetwork{}}; },
         Errc::AllowedIPIPIsNil, "allowed IP IP field is nil: for allowed IP 1 of 1"},
        {"allowed IP without mask",
         [](Wireguard &w){ w.allowed_ips = IpNetworks{IpNetwork{ParseAddress("10.0.0.0"), std::nullopt}}; },
         Errc::AllowedIPMaskMissing, "allowed IP mask is missing: for allowed IP 1 of 1"},
        {"allowed IPv6 while disabled",
         [](Wireguard &w){ w.allowed_ips = IpNetworks{ParseCidr("0.0.0.0/0"), ParseCidr("::/0")}; },
         Errc::AllowedIPv6NotSupported, "allowed IPv6 address not supported: for allowed IP ::/0"},
        {"addresses missing",
         [](Wireguard &w){ w.addresses.reset(); },
         Errc::AddressMissing, "interface address is missing"},
        {"address nil",
         [](Wireguard &w){ w.addresses = IpNetworks{std::nullopt, ParseCidr("10.0.0.2/32")}; },
         Errc::AddressNil, "interface address is nil: for address 1 of 2"},
        {"address without IP",
         [](Wireguard &w){ w.addresses = IpNetworks{ParseCidr("10.0.0.2/32"), IpNetwork{std::nullopt, 32u}}; },
         Errc::AddressIPMissing, "interface address IP is missing: for address 2 of 2"},
        {"address without mask",
         [](Wireguard &w){ w.addresses = IpNetworks{IpNetwork{ParseAddress("10.0.0.2"), std::nullopt}}; },
         Errc::AddressMaskMissing, "interface address mask is missing: for address 1 of 1"},
        {"address IPv6 while disabled",
         [](Wireguard &w){ w.addresses = IpNetworks{ParseCidr("fc00:bbbb::1/128")}; },
         Errc::AddressIPv6NotSupported,
         "interface address is IPv6 but IPv6 is not supported: for address 1 of 1"},
        {"firewall mark zero",
         [](Wireguard &w){ w.firewall_mark = 0; },
         Errc::FirewallMarkMissing, "firewall mark is missing"},
        {"implementation unknown",
         [](Wireguard &w){ w.implementation = "bpf"; },
         Errc::ImplementationInvalid, "invalid implementation: bpf"},
    };

    for (const Case &c : cases)
    {
        SCOPED_TRACE(c.name);
        Wireguard w = Valid();
        c.mutate(w);
        try
        {
            w.Validate();
            ADD_FAILURE() << "no exception";
        }
        catch (const ValidationError &e)
        {
            EXPECT_EQ(e.Code(), c.code);
            EXPECT_EQ(std::string(e.what()), c.message);
        }
    }
}

TEST(Wireguard, EndpointPortMissingWithValidKeys)
{
    Wireguard w;
    w.interface_name = "wg0";
    w.private_key = TestHelpers::kPrivateKey;
    w.public_key = TestHelpers::kPublicKey;
    w.endpoint = Endpoint{ParseAddress("1.2.3.4"), 0};

    try
    {
        w.Validate();
        FAIL() << "no exception";
    }
    catch (const ValidationError &e)
    {
        EXPECT_EQ(e.ErrorCode(), make_error_code(Errc::EndpointPortMissing));
    }
}

TEST(Wireguard, ListErrorsCarryPosition)
{
    Wireguard w = Valid();
    w.addresses = IpNetworks{ParseCidr("10.0.0.2/32"), ParseCidr("10.0.0.3/32"), std::nullopt};
    try
    {
        w.Validate();
        FAIL() << "no exception";
    }
    catch (const ValidationError &e)
    {
        EXPECT_EQ(e.Position(), 3u);
        EXPECT_EQ(e.Count(), 3u);
    }
}

TEST(Wireguard, ValidationIsDeterministic)
{
    Wireguard w = Valid();
    w.allowed_ips = IpNetworks{ParseCidr("::/0")};

    std::string first;
    for (int i = 0; i < 3; ++i)
    {
        try
        {
            w.Validate();
            FAIL() << "no exception";
        }
        catch (const ValidationError &e)
        {
            if (i == 0) first = e.what();
            EXPECT_EQ(first, e.what());
        }
    }
}

TEST(Wireguard, MergeFillsOnlyAbsentFields)
{
    Wireguard a;
    a.allowed_ips = IpNetworks{ParseCidr("10.0.0.0/8")};

    Wireguard b;
    b.endpoint = ParseEndpoint("1.2.3.4:51820");
    b.allowed_ips = IpNetworks{ParseCidr("0.0.0.0/0")};

    a.MergeWith(b);
    EXPECT_EQ(a.endpoint, b.endpoint);
    EXPECT_EQ(a.allowed_ips, IpNetworks{ParseCidr("10.0.0.0/8")});
}

TEST(Wireguard, MergeKeepsPresentEmptyValues)
{
    Wireguard a;
    a.pre_shared_key = "";
    a.rule_priority = 0;

    Wireguard b = Valid();
    b.pre_shared_key = TestHelpers::kPreSharedKey;
    b.rule_priority = 100;

    a.MergeWith(b);
    EXPECT_EQ(a.pre_shared_key, std::string());
    EXPECT_EQ(a.rule_priority, 0u);
    EXPECT_EQ(a.interface_name, b.interface_name);
}

TEST(Wireguard, OverrideIsRightBiased)
{
    Wireguard a = Valid();

    Wireguard b;
    b.interface_name = "wg1";
    b.pre_shared_key = "";
    b.ipv6 = true;

    a.OverrideWith(b);
    EXPECT_EQ(a.interface_name, "wg1");
    EXPECT_EQ(a.pre_shared_key, std::string());
    EXPECT_EQ(a.ipv6, true);
    EXPECT_EQ(a.private_key, TestHelpers::kPrivateKey);
    EXPECT_EQ(a.endpoint, Valid().endpoint);
}

TEST(Wireguard, CopySharesNothing)
{
    const Wireguard original = Valid();
    Wireguard copy = original.Copy();
    ASSERT_EQ(copy, original);

    copy.allowed_ips->push_back(ParseCidr("::/0"));
    (*copy.addresses)[0]->prefix_length = 24;
    copy.endpoint->port = 1;

    EXPECT_EQ(original.allowed_ips->size(), 1u);
    EXPECT_EQ((*original.addresses)[0]->prefix_length, 32u);
    EXPECT_EQ(original.endpoint->port, 51820);
}

TEST(Wireguard, Defaults)
{
    const Wireguard d = WithDefaults(Wireguard{});
    EXPECT_EQ(d.interface_name, "wg0");
    EXPECT_EQ(d.firewall_mark, 51820u);
    EXPECT_EQ(d.rule_priority, 0u);
    EXPECT_EQ(d.ipv6, false);
    EXPECT_EQ(d.implementation, "auto");
    EXPECT_EQ(d.allowed_ips, IpNetworks{ParseCidr("0.0.0.0/0")});
    EXPECT_FALSE(d.private_key.has_value());
    EXPECT_FALSE(d.endpoint.has_value());
    EXPECT_FALSE(d.addresses.has_value());

    Wireguard ipv6;
    ipv6.ipv6 = true;
    ipv6.endpoint = Endpoint{ParseAddress("1.2.3.4"), 0};
    const Wireguard d6 = WithDefaults(ipv6);
    EXPECT_EQ(d6.allowed_ips, (IpNetworks{ParseCidr("0.0.0.0/0"), ParseCidr("::/0")}));
    EXPECT_EQ(d6.endpoint->port, 51820);
}

TEST(Wireguard, DefaultsAreIdempotent)
{
    Wireguard partial;
    partial.private_key = TestHelpers::kPrivateKey;
    partial.ipv6 = true;

    const Wireguard once = WithDefaults(partial);
    EXPECT_EQ(WithDefaults(once), once);
}

TEST(Wireguard, RenderingWithMostFieldsAbsent)
{
    Wireguard w;
    w.interface_name = "wg0";
    w.ipv6 = true;

    const std::vector<std::string> expected = {
        "├── Interface name: wg0",
        "├── Private key: not set",
        "├── Pre shared key: not set",
        "├── Endpoint: not set",
        "├── IPv6: enabled",
        "├── Implementation: not set",
        "└── Addresses: not set",
    };
    EXPECT_EQ(w.ToLines(), expected);
}

TEST(Wireguard, RenderingNeverShowsSecrets)
{
    Wireguard w = Valid();
    w.pre_shared_key = TestHelpers::kPreSharedKey;
    w.rule_priority = 101;
    w.addresses = IpNetworks{ParseCidr("10.64.222.21/32"), std::nullopt};

    const std::vector<std::string> expected = {
        "├── Interface name: wg0",
        "├── Private key: set",
        "├── Public key: " + TestHelpers::kPublicKey,
        "├── Pre shared key: set",
        "├── Endpoint: 1.2.3.4:51820",
        "├── IPv6: disabled",
        "├── Firewall mark: 51820",
        "├── Rule priority: 101",
        "├── Implementation: auto",
        "└── Addresses:",
        "    ├── 10.64.222.21/32",
        "    └── <nil>",
    };
    EXPECT_EQ(w.ToLines(), expected);

    const std::string text = w.String();
    EXPECT_EQ(text.find(TestHelpers::kPreSharedKey), std::string::npos);
}
