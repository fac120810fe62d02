#include "TunnelConf/Settings/Wireguard.hpp"
#include "TunnelConf/Settings/Fields.hpp"
#include "TunnelConf/Base64.hpp"
#include "TunnelConf/Errors.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace TunnelConf
{

namespace
{

constexpr std::uint32_t kDefaultFirewallMark = 51820;
constexpr std::uint16_t kDefaultEndpointPort = 51820;

constexpr std::array<const char *, 3> kImplementations = {"auto", "kernelspace", "userspace"};

bool IsImplementation(const std::string &value)
{
    return std::any_of(kImplementations.begin(), kImplementations.end(),
                       [&value](const char *i){ return value == i; });
}

}

Wireguard Wireguard::Copy() const
{
    return *this;
}

void Wireguard::MergeWith(const Wireguard &other)
{
    Fields::MergeWith(interface_name, other.interface_name);
    Fields::MergeWith(private_key,    other.private_key);
    Fields::MergeWith(public_key,     other.public_key);
    Fields::MergeWith(pre_shared_key, other.pre_shared_key);
    Fields::MergeWith(endpoint,       other.endpoint);
    Fields::MergeWith(allowed_ips,    other.allowed_ips);
    Fields::MergeWith(addresses,      other.addresses);
    Fields::MergeWith(firewall_mark,  other.firewall_mark);
    Fields::MergeWith(rule_priority,  other.rule_priority);
    Fields::MergeWith(ipv6,           other.ipv6);
    Fields::MergeWith(implementation, other.implementation);
}

void Wireguard::OverrideWith(const Wireguard &other)
{
    Fields::OverrideWith(interface_name, other.interface_name);
    Fields::OverrideWith(private_key,    other.private_key);
    Fields::OverrideWith(public_key,     other.public_key);
    Fields::OverrideWith(pre_shared_key, other.pre_shared_key);
    Fields::OverrideWith(endpoint,       other.endpoint);
    Fields::OverrideWith(allowed_ips,    other.allowed_ips);
    Fields::OverrideWith(addresses,      other.addresses);
    Fields::OverrideWith(firewall_mark,  other.firewall_mark);
    Fields::OverrideWith(rule_priority,  other.rule_priority);
    Fields::OverrideWith(ipv6,           other.ipv6);
    Fields::OverrideWith(implementation, other.implementation);
}

void Wireguard::SetDefaults()
{
    Fields::Default(interface_name, "wg0");
    Fields::Default(firewall_mark, kDefaultFirewallMark);
    Fields::Default(rule_priority, 0u);
    Fields::Default(ipv6, false);
    Fields::Default(implementation, "auto");

    if (!allowed_ips)
    {
        IpNetworks all{AllIPv4()};
        if (*ipv6)
        {
            all.emplace_back(AllIPv6());
        }
        allowed_ips = std::move(all);
    }

    if (endpoint && endpoint->port == 0)
    {
        endpoint->port = kDefaultEndpointPort;
    }
}

void Wireguard::Validate() const
{
    const std::string name = Fields::ValueOr(interface_name);
    if (!IsValidInterfaceName(name))
    {
        throw Error::InterfaceNameInvalid(name);
    }

    if (!Fields::IsSet(private_key))
    {
        throw Error::PrivateKeyMissing();
    }
    if (!Base64::IsWireguardKey(*private_key))
    {
        throw Error::PrivateKeyInvalid();
    }

    if (!Fields::IsSet(public_key))
    {
        throw Error::PublicKeyMissing();
    }
    if (!Base64::IsWireguardKey(*public_key))
    {
        throw Error::PublicKeyInvalid(*public_key);
    }

    if (Fields::IsSet(pre_shared_key) && !Base64::IsWireguardKey(*pre_shared_key))
    {
        throw Error::PreSharedKeyInvalid();
    }

    if (!endpoint)
    {
        throw Error::EndpointMissing();
    }
    if (!endpoint->ip)
    {
        throw Error::EndpointIPMissing();
    }
    if (endpoint->port == 0)
    {
        throw Error::EndpointPortMissing();
    }

    // Отсутствующий флаг IPv6 трактуется как выключенный.
    const bool ipv6_enabled = Fields::ValueOr(ipv6, false);

    if (!allowed_ips || allowed_ips->empty())
    {
        throw Error::AllowedIPsMissing();
    }
    const std::size_t allowed_count = allowed_ips->size();
    for (std::size_t i = 0; i < allowed_count; ++i)
    {
        const std::optional<IpNetwork> &entry = (*allowed_ips)[i];
        if (!entry)
        {
            throw Error::AllowedIPIsNil(i + 1, allowed_count);
        }
        if (!entry->ip)
        {
            throw Error::AllowedIPIPIsNil(i + 1, allowed_count);
        }
        if (!entry->prefix_length)
        {
            throw Error::AllowedIPMaskMissing(i + 1, allowed_count);
        }
        if (!ipv6_enabled && IsIPv6(*entry->ip))
        {
            throw Error::AllowedIPv6NotSupported(ToString(*entry));
        }
    }

    if (!addresses || addresses->empty())
    {
        throw Error::AddressMissing();
    }
    const std::size_t address_count = addresses->size();
    for (std::size_t i = 0; i < address_count; ++i)
    {
        const std::optional<IpNetwork> &entry = (*addresses)[i];
        if (!entry)
        {
            throw Error::AddressNil(i + 1, address_count);
        }
        if (!entry->ip)
        {
            throw Error::AddressIPMissing(i + 1, address_count);
        }
        if (!entry->prefix_length)
        {
            throw Error::AddressMaskMissing(i + 1, address_count);
        }
        if (!ipv6_enabled && IsIPv6(*entry->ip))
        {
            throw Error::AddressIPv6NotSupported(i + 1, address_count);
        }
    }

    if (Fields::ValueOr(firewall_mark) == 0)
    {
        throw Error::FirewallMarkMissing();
    }

    const std::string impl = Fields::ValueOr(implementation);
    if (!IsImplementation(impl))
    {
        throw Error::ImplementationInvalid(impl);
    }
}

Tree::Node Wireguard::ToLinesNode() const
{
    Tree::Node node("Wireguard settings:");

    node.Append("Interface name: " + (interface_name ? *interface_name : std::string("not set")));
    node.Append("Private key: " + Fields::SetOrNot(private_key));
    if (Fields::IsSet(public_key))
    {
        node.Append("Public key: " + *public_key);
    }
    node.Append("Pre shared key: " + Fields::SetOrNot(pre_shared_key));
    node.Append("Endpoint: " + (endpoint ? ToString(*endpoint) : std::string("not set")));

    if (ipv6)
    {
        node.Append(std::string("IPv6: ") + (*ipv6 ? "enabled" : "disabled"));
    }
    else
    {
        node.Append("IPv6: not set");
    }

    if (Fields::ValueOr(firewall_mark) != 0)
    {
        node.Append("Firewall mark: " + std::to_string(*firewall_mark));
    }
    if (Fields::ValueOr(rule_priority) != 0)
    {
        node.Append("Rule priority: " + std::to_string(*rule_priority));
    }

    node.Append("Implementation: " + (implementation ? *implementation : std::string("not set")));

    if (!addresses || addresses->empty())
    {
        node.Append("Addresses: not set");
    }
    else
    {
        Tree::Node list("Addresses:");
        for (const std::optional<IpNetwork> &address : *addresses)
        {
            list.Append(address ? ToString(*address) : std::string("<nil>"));
        }
        node.Append(std::move(list));
    }

    return node;
}

std::vector<std::string> Wireguard::ToLines(const ToLinesSettings &style) const
{
    return ToLinesNode().ChildLines(style);
}

std::string Wireguard::String() const
{
    return JoinLines(ToLines());
}

}
