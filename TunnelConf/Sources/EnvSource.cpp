#include "TunnelConf/Sources/EnvSource.hpp"
#include "TunnelConf/Config.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Logger.hpp"
#include "TunnelConf/Network.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <utility>

#include <unistd.h>

extern char **environ;

namespace TunnelConf
{

namespace
{

const char *kName = "environment";

[[noreturn]] void Fail(const std::string &key, const std::string &reason)
{
    throw SourceError(kName, "environment variable " + key + ": " + reason);
}

std::optional<std::string> Optional(std::string value)
{
    if (value.empty())
        return std::nullopt;
    return value;
}

template <class T>
std::optional<T> ParseInteger(const std::string &key, const std::string &value)
{
    if (value.empty())
        return std::nullopt;

    long long n = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
    if (ec != std::errc() || ptr != value.data() + value.size())
    {
        Fail(key, "value " + value + " is not an integer");
    }
    if (n < static_cast<long long>(std::numeric_limits<T>::min()) ||
        n > static_cast<long long>(std::numeric_limits<T>::max()))
    {
        Fail(key, "value " + value + " is out of range");
    }
    return static_cast<T>(n);
}

std::optional<bool> ParseBinaryValue(const std::string &key, const std::string &value)
{
    if (value.empty())
        return std::nullopt;
    const std::optional<bool> b = Config::ParseBinary(value);
    if (!b)
    {
        Fail(key, "value " + value + " is not a binary value");
    }
    return b;
}

std::optional<std::vector<std::string>> ParseList(const std::string &value, char separator)
{
    std::vector<std::string> items = Config::Split(value, separator);
    if (items.empty())
        return std::nullopt;
    return items;
}

std::string Lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

}

EnvSource::EnvSource(Environment environment)
    : EnvSource(std::move(environment), false)
{
}

EnvSource::EnvSource(Environment environment, bool unset_secrets)
    : env_(std::move(environment))
    , unset_secrets_(unset_secrets)
{
}

EnvSource EnvSource::FromProcess()
{
    Environment env;
    for (char **e = environ; e && *e; ++e)
    {
        const std::string entry(*e);
        const std::size_t eq = entry.find('=');
        if (eq == std::string::npos)
            continue;
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return EnvSource(std::move(env), true);
}

const std::vector<std::string> &EnvSource::SecretKeys()
{
    static const std::vector<std::string> keys = {
        "OPENVPN_USER",
        "OPENVPN_PASSWORD",
        "OPENVPN_KEY_PASSPHRASE",
        "OPENVPN_CERT",
        "OPENVPN_KEY",
        "OPENVPN_ENCRYPTED_KEY",
        "WIREGUARD_PRIVATE_KEY",
        "WIREGUARD_PRESHARED_KEY",
    };
    return keys;
}

std::string EnvSource::Name() const
{
    return kName;
}

std::string EnvSource::Get(const std::string &key) const
{
    const auto it = env_.find(key);
    return it == env_.end() ? std::string() : it->second;
}

std::pair<std::string, std::string> EnvSource::GetWithRetro(const std::string &key,
                                                            const std::vector<std::string> &retro) const
{
    std::string value = Get(key);
    if (!value.empty())
        return {key, value};

    for (const std::string &old : retro)
    {
        value = Get(old);
        if (!value.empty())
        {
            LOGW("source.env") << "Variable " << old << " is deprecated, use " << key << " instead";
            return {old, value};
        }
    }
    return {std::string(), std::string()};
}

Settings EnvSource::Read()
{
    Settings s;
    ReadVpn(s);
    ReadControlServer(s.control_server);
    ReadUpdater(s.updater);

    if (unset_secrets_)
    {
        for (const std::string &key : SecretKeys())
        {
            if (::unsetenv(key.c_str()) != 0)
            {
                Fail(key, "cannot unset variable");
            }
        }
    }

    LOGD("source.env") << "Read " << env_.size() << " variables";
    return s;
}

void EnvSource::ReadVpn(Settings &s) const
{
    s.vpn.type = Optional(Lower(Get("VPN_TYPE")));
    s.vpn.provider = Optional(Lower(Get("VPN_SERVICE_PROVIDER")));
    ReadWireguard(s.vpn.wireguard);
    ReadOpenVpn(s.vpn.openvpn);
}

void EnvSource::ReadWireguard(Wireguard &w) const
{
    w.interface_name = Optional(GetWithRetro("VPN_INTERFACE", {"WIREGUARD_INTERFACE"}).second);
    w.private_key    = Optional(Get("WIREGUARD_PRIVATE_KEY"));
    w.public_key     = Optional(Get("WIREGUARD_PUBLIC_KEY"));
    w.pre_shared_key = Optional(Get("WIREGUARD_PRESHARED_KEY"));
    w.implementation = Optional(Get("WIREGUARD_IMPLEMENTATION"));

    const std::string allowed = Get("WIREGUARD_ALLOWED_IPS");
    if (!allowed.empty())
    {
        try
        {
            w.allowed_ips = ParseCidrList(allowed);
        }
        catch (const std::invalid_argument &e)
        {
            Fail("WIREGUARD_ALLOWED_IPS", e.what());
        }
    }

    const auto [address_key, addresses] = GetWithRetro("WIREGUARD_ADDRESSES", {"WIREGUARD_ADDRESS"});
    if (!addresses.empty())
    {
        try
        {
            w.addresses = ParseCidrList(addresses);
        }
        catch (const std::invalid_argument &e)
        {
            Fail(address_key, e.what());
        }
    }

    const std::string endpoint_ip = Get("WIREGUARD_ENDPOINT_IP");
    const std::string endpoint_port = Get("WIREGUARD_ENDPOINT_PORT");
    if (!endpoint_ip.empty() || !endpoint_port.empty())
    {
        Endpoint endpoint;
        if (!endpoint_ip.empty())
        {
            try
            {
                endpoint.ip = ParseAddress(endpoint_ip);
            }
            catch (const std::invalid_argument &e)
            {
                Fail("WIREGUARD_ENDPOINT_IP", e.what());
            }
        }
        if (!endpoint_port.empty())
        {
            try
            {
                endpoint.port = ParsePort(endpoint_port);
            }
            catch (const std::invalid_argument &e)
            {
                Fail("WIREGUARD_ENDPOINT_PORT", e.what());
            }
        }
        w.endpoint = endpoint;
    }

    w.firewall_mark = ParseInteger<std::uint32_t>("WIREGUARD_FIREWALL_MARK", Get("WIREGUARD_FIREWALL_MARK"));
    w.ipv6 = ParseBinaryValue("WIREGUARD_IPV6", Get("WIREGUARD_IPV6"));
}

void EnvSource::ReadOpenVpn(OpenVpn &o) const
{
    o.version        = Optional(Get("OPENVPN_VERSION"));
    o.user           = Optional(Get("OPENVPN_USER"));
    o.password       = Optional(Get("OPENVPN_PASSWORD"));
    o.conf_file      = Optional(Get("OPENVPN_CUSTOM_CONFIG"));
    o.ciphers        = ParseList(Get("OPENVPN_CIPHERS"), ',');
    o.auth           = Optional(Get("OPENVPN_AUTH"));
    o.cert           = Optional(Get("OPENVPN_CERT"));
    o.key            = Optional(Get("OPENVPN_KEY"));
    o.encrypted_key  = Optional(Get("OPENVPN_ENCRYPTED_KEY"));
    o.key_passphrase = Optional(Get("OPENVPN_KEY_PASSPHRASE"));
    o.encryption_preset = Optional(Lower(Get("PRIVATE_INTERNET_ACCESS_OPENVPN_ENCRYPTION_PRESET")));
    o.mss_fix        = ParseInteger<std::uint16_t>("OPENVPN_MSSFIX", Get("OPENVPN_MSSFIX"));
    o.interface_name = Optional(GetWithRetro("VPN_INTERFACE", {"OPENVPN_INTERFACE"}).second);
    o.process_user   = Optional(Get("OPENVPN_PROCESS_USER"));
    o.verbosity      = ParseInteger<int>("OPENVPN_VERBOSITY", Get("OPENVPN_VERBOSITY"));
    o.flags          = ParseList(Get("OPENVPN_FLAGS"), ' ');
}

void EnvSource::ReadControlServer(ControlServer &c) const
{
    const auto [key, value] = GetWithRetro("HTTP_CONTROL_SERVER_ADDRESS", {"CONTROL_SERVER_ADDRESS"});
    if (!value.empty())
    {
        // Устаревшая переменная задавала только порт.
        c.address = key == "HTTP_CONTROL_SERVER_ADDRESS" ? value : ":" + value;
    }
    c.log = ParseBinaryValue("HTTP_CONTROL_SERVER_LOG", Get("HTTP_CONTROL_SERVER_LOG"));
}

void EnvSource::ReadUpdater(Updater &u) const
{
    const std::string period = Get("UPDATER_PERIOD");
    if (!period.empty())
    {
        try
        {
            u.period = ParseDuration(period);
        }
        catch (const std::invalid_argument &e)
        {
            Fail("UPDATER_PERIOD", e.what());
        }
    }

    u.dns_address = Optional(Get("UPDATER_DNS_ADDRESS"));

    const std::string providers = Get("UPDATER_VPN_SERVICE_PROVIDERS");
    if (!providers.empty())
    {
        std::vector<std::string> names = Config::Split(Lower(providers), ',');
        const std::vector<std::string> unknown = u.EnableOnly(names);
        if (!unknown.empty())
        {
            Fail("UPDATER_VPN_SERVICE_PROVIDERS", "provider " + unknown.front() + " cannot be updated");
        }
    }
}

}
