#include "TunnelConf/Sources/WireguardConfSource.hpp"
#include "TunnelConf/Base64.hpp"
#include "TunnelConf/Config.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Logger.hpp"
#include "TunnelConf/Network.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace TunnelConf
{

namespace
{

using boost::property_tree::ptree;

// Комментарий в конце строки начинается с '#' или ';' после пробела.
std::string StripComment(const std::string &value)
{
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        if ((value[i] == '#' || value[i] == ';') &&
            (i == 0 || value[i - 1] == ' ' || value[i - 1] == '\t'))
        {
            return Config::Trim(value.substr(0, i));
        }
    }
    return value;
}

std::optional<std::string> Value(const ptree &section, const char *key)
{
    const boost::optional<std::string> v = section.get_optional<std::string>(key);
    if (!v)
        return std::nullopt;
    std::string value = StripComment(*v);
    if (value.empty())
        return std::nullopt;
    return value;
}

std::optional<std::string> ParseKey(const ptree &section, const char *key)
{
    std::optional<std::string> value = Value(section, key);
    if (!value)
        return std::nullopt;

    try
    {
        Base64::ParseWireguardKey(*value);
    }
    catch (const std::invalid_argument &e)
    {
        throw std::invalid_argument(std::string("parsing ") + key + ": " + *value + ": " + e.what());
    }
    return value;
}

std::optional<IpNetworks> ParseNetworks(const ptree &section, const char *key, const char *context)
{
    const std::optional<std::string> value = Value(section, key);
    if (!value)
        return std::nullopt;

    try
    {
        return ParseCidrList(*value);
    }
    catch (const std::invalid_argument &e)
    {
        throw std::invalid_argument(std::string("parsing ") + context + ": " + e.what());
    }
}

}

WireguardConfSource::WireguardConfSource(std::string path)
    : path_(std::move(path))
{
}

std::string WireguardConfSource::Name() const
{
    return "wireguard configuration file";
}

Settings WireguardConfSource::Read()
{
    Settings s;

    std::optional<std::string> content;
    try
    {
        content = Config::ReadTextFile(path_);
    }
    catch (const std::runtime_error &e)
    {
        throw SourceError(Name(), e.what());
    }

    if (!content)
    {
        LOGD("source.ini") << "No WireGuard configuration file at " << path_;
        return s;
    }

    s.vpn.wireguard = Parse(*content);
    LOGD("source.ini") << "Read WireGuard configuration file " << path_;
    return s;
}

Wireguard WireguardConfSource::Parse(const std::string &content) const
{
    ptree tree;
    try
    {
        std::istringstream in(content);
        boost::property_tree::ini_parser::read_ini(in, tree);
    }
    catch (const boost::property_tree::ini_parser_error &e)
    {
        throw SourceError(Name(), "loading ini from reader: " + e.message());
    }

    Wireguard w;

    if (const boost::optional<const ptree &> section = std::as_const(tree).get_child_optional("Interface"))
    {
        try
        {
            ParseInterfaceSection(*section, w);
        }
        catch (const std::invalid_argument &e)
        {
            throw SourceError(Name(), std::string("parsing interface section: ") + e.what());
        }
    }

    if (const boost::optional<const ptree &> section = std::as_const(tree).get_child_optional("Peer"))
    {
        try
        {
            ParsePeerSection(*section, w);
        }
        catch (const std::invalid_argument &e)
        {
            throw SourceError(Name(), std::string("parsing peer section: ") + e.what());
        }
    }

    return w;
}

void WireguardConfSource::ParseInterfaceSection(const ptree &section, Wireguard &w)
{
    w.private_key    = ParseKey(section, "PrivateKey");
    w.pre_shared_key = ParseKey(section, "PreSharedKey");
    w.addresses      = ParseNetworks(section, "Address", "address");
}

void WireguardConfSource::ParsePeerSection(const ptree &section, Wireguard &w)
{
    w.public_key = ParseKey(section, "PublicKey");

    // wg-quick пишет PresharedKey в секции пира.
    if (std::optional<std::string> psk = ParseKey(section, "PresharedKey"))
    {
        w.pre_shared_key = std::move(psk);
    }

    if (const std::optional<std::string> endpoint = Value(section, "Endpoint"))
    {
        try
        {
            w.endpoint = ParseEndpoint(*endpoint);
        }
        catch (const std::invalid_argument &e)
        {
            throw std::invalid_argument(std::string("parsing Endpoint: ") + e.what());
        }
    }

    w.allowed_ips = ParseNetworks(section, "AllowedIPs", "AllowedIPs");
}

}
