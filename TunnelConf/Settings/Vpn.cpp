#include "TunnelConf/Settings/Vpn.hpp"
#include "TunnelConf/Settings/Fields.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Providers.hpp"

#include <utility>

namespace TunnelConf
{

Vpn Vpn::Copy() const
{
    return *this;
}

void Vpn::MergeWith(const Vpn &other)
{
    Fields::MergeWith(type,     other.type);
    Fields::MergeWith(provider, other.provider);
    openvpn.MergeWith(other.openvpn);
    wireguard.MergeWith(other.wireguard);
}

void Vpn::OverrideWith(const Vpn &other)
{
    Fields::OverrideWith(type,     other.type);
    Fields::OverrideWith(provider, other.provider);
    openvpn.OverrideWith(other.openvpn);
    wireguard.OverrideWith(other.wireguard);
}

void Vpn::SetDefaults()
{
    Fields::Default(type, kVpnTypeOpenVpn);
    Fields::Default(provider, std::string(Providers::kPrivateInternetAccess));
    openvpn.SetDefaults(*provider);
    wireguard.SetDefaults();
}

bool Vpn::IsWireguard() const
{
    return Fields::ValueOr(type) == kVpnTypeWireguard;
}

void Vpn::Validate() const
{
    const std::string t = Fields::ValueOr(type);
    if (t != kVpnTypeOpenVpn && t != kVpnTypeWireguard)
    {
        throw Error::VpnTypeInvalid(t, std::string(kVpnTypeOpenVpn) + ", " + kVpnTypeWireguard);
    }

    const std::string p = Fields::ValueOr(provider);
    const Providers::Rules *rules = Providers::Find(p);
    if (!rules)
    {
        throw Error::ProviderInvalid(p);
    }

    if (IsWireguard())
    {
        if (!rules->wireguard_supported)
        {
            throw Error::WireguardNotSupported(p);
        }
        wireguard.Validate();
    }
    else
    {
        openvpn.Validate(p);
    }
}

Tree::Node Vpn::ToLinesNode() const
{
    Tree::Node node("VPN settings:");
    node.Append("VPN type: " + Fields::ValueOr(type, std::string("not set")));
    node.Append("VPN provider: " + Fields::ValueOr(provider, std::string("not set")));

    if (IsWireguard())
    {
        node.Append(wireguard.ToLinesNode());
    }
    else
    {
        node.Append(openvpn.ToLinesNode());
    }
    return node;
}

std::vector<std::string> Vpn::ToLines(const ToLinesSettings &style) const
{
    return ToLinesNode().Lines(style);
}

std::string Vpn::String() const
{
    return JoinLines(ToLines());
}

}
