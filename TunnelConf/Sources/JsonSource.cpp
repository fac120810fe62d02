#include "TunnelConf/Sources/JsonSource.hpp"
#include "TunnelConf/Config.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Logger.hpp"
#include "TunnelConf/Network.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

namespace TunnelConf
{

namespace
{

template <class T>
std::optional<T> OptionalInteger(const boost::json::object &o, const char *key)
{
    const std::optional<std::int64_t> n = Config::OptionalInt(o, key);
    if (!n)
        return std::nullopt;
    if (*n < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
        *n > static_cast<std::int64_t>(std::numeric_limits<T>::max()))
    {
        throw std::runtime_error(std::string("integer field '") + key + "' is out of range");
    }
    return static_cast<T>(*n);
}

std::optional<IpNetworks> OptionalNetworks(const boost::json::object &o, const char *key)
{
    const std::optional<std::vector<std::string>> items = Config::OptionalStringList(o, key);
    if (!items)
        return std::nullopt;

    IpNetworks out;
    for (const std::string &item : *items)
    {
        try
        {
            out.emplace_back(ParseCidr(item));
        }
        catch (const std::invalid_argument &e)
        {
            throw std::runtime_error(std::string("field '") + key + "': " + e.what());
        }
    }
    return out;
}

// Раздел верхнего уровня с контекстом в сообщении об ошибке.
template <class Fn>
void Section(const boost::json::object &o, const char *key, Fn &&parse)
{
    const boost::json::object *section = Config::OptionalObject(o, key);
    if (!section)
        return;
    try
    {
        parse(*section);
    }
    catch (const std::runtime_error &e)
    {
        throw std::runtime_error(std::string(key) + ": " + e.what());
    }
}

}

JsonSource::JsonSource(std::string path)
    : path_(std::move(path))
{
}

std::string JsonSource::Name() const
{
    return "json file";
}

Settings JsonSource::Read()
{
    std::optional<std::string> text;
    try
    {
        text = Config::ReadTextFile(path_);
    }
    catch (const std::runtime_error &e)
    {
        throw SourceError(Name(), e.what());
    }

    if (!text)
    {
        LOGD("source.json") << "No settings file at " << path_;
        return Settings{};
    }

    Settings s = Parse(*text);
    LOGD("source.json") << "Read settings file " << path_;
    return s;
}

Settings JsonSource::Parse(const std::string &text) const
{
    boost::system::error_code ec;
    boost::json::value jv = boost::json::parse(text, ec);
    if (ec)
    {
        throw SourceError(Name(), "parsing JSON: " + ec.message());
    }
    if (!jv.is_object())
    {
        throw SourceError(Name(), "parsing JSON: root must be an object");
    }

    const boost::json::object &o = jv.as_object();
    Settings s;
    try
    {
        Section(o, "vpn",            [&s](const boost::json::object &v){ ParseVpn(v, s.vpn); });
        Section(o, "control_server", [&s](const boost::json::object &v){ ParseControlServer(v, s.control_server); });
        Section(o, "updater",        [&s](const boost::json::object &v){ ParseUpdater(v, s.updater); });
    }
    catch (const std::runtime_error &e)
    {
        throw SourceError(Name(), e.what());
    }
    return s;
}

void JsonSource::ParseVpn(const boost::json::object &o, Vpn &vpn)
{
    vpn.type     = Config::OptionalString(o, "type");
    vpn.provider = Config::OptionalString(o, "provider");
    Section(o, "wireguard", [&vpn](const boost::json::object &v){ ParseWireguard(v, vpn.wireguard); });
    Section(o, "openvpn",   [&vpn](const boost::json::object &v){ ParseOpenVpn(v, vpn.openvpn); });
}

void JsonSource::ParseWireguard(const boost::json::object &o, Wireguard &w)
{
    w.interface_name = Config::OptionalString(o, "interface");
    w.private_key    = Config::OptionalString(o, "private_key");
    w.public_key     = Config::OptionalString(o, "public_key");
    w.pre_shared_key = Config::OptionalString(o, "pre_shared_key");
    w.implementation = Config::OptionalString(o, "implementation");
    w.allowed_ips    = OptionalNetworks(o, "allowed_ips");
    w.addresses      = OptionalNetworks(o, "addresses");
    w.firewall_mark  = OptionalInteger<std::uint32_t>(o, "firewall_mark");
    w.rule_priority  = OptionalInteger<std::uint32_t>(o, "rule_priority");
    w.ipv6           = Config::OptionalBool(o, "ipv6");

    if (const std::optional<std::string> endpoint = Config::OptionalString(o, "endpoint"))
    {
        try
        {
            w.endpoint = ParseEndpoint(*endpoint);
        }
        catch (const std::invalid_argument &e)
        {
            throw std::runtime_error(std::string("field 'endpoint': ") + e.what());
        }
    }
}

void JsonSource::ParseOpenVpn(const boost::json::object &o, OpenVpn &ovpn)
{
    ovpn.version           = Config::OptionalString(o, "version");
    ovpn.user              = Config::OptionalString(o, "user");
    ovpn.password          = Config::OptionalString(o, "password");
    ovpn.conf_file         = Config::OptionalString(o, "config_file");
    ovpn.ciphers           = Config::OptionalStringList(o, "ciphers");
    ovpn.auth              = Config::OptionalString(o, "auth");
    ovpn.cert              = Config::OptionalString(o, "cert");
    ovpn.key               = Config::OptionalString(o, "key");
    ovpn.encrypted_key     = Config::OptionalString(o, "encrypted_key");
    ovpn.key_passphrase    = Config::OptionalString(o, "key_passphrase");
    ovpn.encryption_preset = Config::OptionalString(o, "encryption_preset");
    ovpn.mss_fix           = OptionalInteger<std::uint16_t>(o, "mssfix");
    ovpn.interface_name    = Config::OptionalString(o, "interface");
    ovpn.process_user      = Config::OptionalString(o, "process_user");
    ovpn.verbosity         = OptionalInteger<int>(o, "verbosity");
    ovpn.flags             = Config::OptionalStringList(o, "flags");
}

void JsonSource::ParseControlServer(const boost::json::object &o, ControlServer &c)
{
    c.address = Config::OptionalString(o, "address");
    c.log     = Config::OptionalBool(o, "log");
}

void JsonSource::ParseUpdater(const boost::json::object &o, Updater &u)
{
    // Период: число секунд либо строка "24h".
    if (const boost::json::value *v = o.if_contains("period"); v && !v->is_null())
    {
        if (v->is_string())
        {
            try
            {
                u.period = ParseDuration(boost::json::value_to<std::string>(*v));
            }
            catch (const std::invalid_argument &e)
            {
                throw std::runtime_error(std::string("field 'period': ") + e.what());
            }
        }
        else
        {
            const std::optional<std::int64_t> seconds = Config::OptionalInt(o, "period");
            u.period = std::chrono::seconds(*seconds);
        }
    }

    u.dns_address = Config::OptionalString(o, "dns_address");

    if (const std::optional<std::vector<std::string>> providers = Config::OptionalStringList(o, "providers"))
    {
        const std::vector<std::string> unknown = u.EnableOnly(*providers);
        if (!unknown.empty())
        {
            throw std::runtime_error("field 'providers': provider " + unknown.front() + " cannot be updated");
        }
    }
}

}
