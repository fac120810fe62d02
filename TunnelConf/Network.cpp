#include "TunnelConf/Network.hpp"
#include "TunnelConf/Config.hpp"

#include <charconv>
#include <regex>
#include <stdexcept>

namespace TunnelConf
{

namespace
{

std::optional<unsigned long> ParseNumber(const std::string &s)
{
    if (s.empty())
        return std::nullopt;
    unsigned long n = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return n;
}

std::optional<IpAddress> TryParseAddress(const std::string &s)
{
    boost::system::error_code ec;
    IpAddress ip = boost::asio::ip::make_address(s, ec);
    if (ec)
        return std::nullopt;
    return ip;
}

}

IpAddress ParseAddress(const std::string &s)
{
    if (auto ip = TryParseAddress(s))
        return *ip;
    throw std::invalid_argument("invalid IP address: " + s);
}

IpNetwork ParseCidr(const std::string &s)
{
    const std::size_t slash = s.find('/');
    if (slash == std::string::npos)
        throw std::invalid_argument("invalid CIDR address: " + s);

    auto ip = TryParseAddress(s.substr(0, slash));
    auto bits = ParseNumber(s.substr(slash + 1));
    if (!ip || !bits)
        throw std::invalid_argument("invalid CIDR address: " + s);

    const unsigned long max_bits = ip->is_v4() ? 32 : 128;
    if (*bits > max_bits)
        throw std::invalid_argument("invalid CIDR address: " + s);

    return IpNetwork{*ip, static_cast<unsigned>(*bits)};
}

IpNetworks ParseCidrList(const std::string &csv)
{
    IpNetworks out;
    for (const std::string &item : Config::Split(csv, ','))
    {
        out.emplace_back(ParseCidr(item));
    }
    return out;
}

Endpoint ParseEndpoint(const std::string &s)
{
    std::string host;
    std::string port;

    if (!s.empty() && s.front() == '[')
    {
        const std::size_t close = s.find(']');
        if (close == std::string::npos || close + 1 >= s.size() || s[close + 1] != ':')
            throw std::invalid_argument("invalid endpoint: " + s);
        host = s.substr(1, close - 1);
        port = s.substr(close + 2);
    }
    else
    {
        const std::size_t colon = s.rfind(':');
        if (colon == std::string::npos || s.find(':') != colon)
            throw std::invalid_argument("invalid endpoint: " + s);
        host = s.substr(0, colon);
        port = s.substr(colon + 1);
    }

    auto ip = TryParseAddress(host);
    auto n  = ParseNumber(port);
    if (!ip || !n || *n == 0 || *n > 65535)
        throw std::invalid_argument("invalid endpoint: " + s);

    return Endpoint{*ip, static_cast<std::uint16_t>(*n)};
}

std::uint16_t ParsePort(const std::string &s)
{
    auto n = ParseNumber(s);
    if (!n || *n == 0 || *n > 65535)
        throw std::invalid_argument("invalid port: " + s);
    return static_cast<std::uint16_t>(*n);
}

bool IsIPv6(const IpAddress &ip) noexcept
{
    return ip.is_v6() && !ip.to_v6().is_v4_mapped();
}

bool IsValidInterfaceName(const std::string &name)
{
    static const std::regex pattern(kInterfaceNamePattern);
    return std::regex_match(name, pattern);
}

IpNetwork AllIPv4()
{
    return IpNetwork{IpAddress(boost::asio::ip::address_v4::any()), 0u};
}

IpNetwork AllIPv6()
{
    return IpNetwork{IpAddress(boost::asio::ip::address_v6::any()), 0u};
}

std::string ToString(const IpNetwork &network)
{
    std::string out = network.ip ? network.ip->to_string() : std::string("<nil>");
    out += "/";
    out += network.prefix_length ? std::to_string(*network.prefix_length) : std::string("<nil>");
    return out;
}

std::string ToString(const Endpoint &endpoint)
{
    std::string host = endpoint.ip ? endpoint.ip->to_string() : std::string();
    if (endpoint.ip && endpoint.ip->is_v6())
    {
        host = "[" + host + "]";
    }
    return host + ":" + std::to_string(endpoint.port);
}

}
