#include "TunnelConf/Settings/OpenVpn.hpp"
#include "TunnelConf/Settings/Fields.hpp"
#include "TunnelConf/Base64.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Network.hpp"
#include "TunnelConf/OpenVpnConfig.hpp"
#include "TunnelConf/Providers.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace TunnelConf
{

namespace
{

std::string Join(const std::vector<std::string> &items, const char *sep)
{
    std::string out;
    for (const std::string &item : items)
    {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

// Проверка base64-блоба: обязателен ли он, и декодируется ли.
void ValidateBlob(const char *context, bool required, const std::string &value)
{
    if (value.empty())
    {
        if (required)
        {
            throw Error::Wrap(context, Error::MissingValue());
        }
        return;
    }

    try
    {
        (void)Base64::Decode(value);
    }
    catch (const std::invalid_argument &e)
    {
        throw Error::Wrap(context, Error::Base64Invalid(e.what()));
    }
}

void ValidateConfFile(bool required, const std::string &path)
{
    if (!required)
    {
        return;
    }

    static const char *context = "custom configuration file";
    if (path.empty())
    {
        throw Error::Wrap(context, Error::FilepathMissing());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        throw Error::Wrap(context, Error::FileNotFound(path));
    }

    try
    {
        (void)OpenVpnConfig::ExtractFile(path);
    }
    catch (const std::runtime_error &e)
    {
        throw Error::Wrap(context, Error::CustomConfigInvalid(path, e.what()));
    }
}

}

OpenVpn OpenVpn::Copy() const
{
    return *this;
}

void OpenVpn::MergeWith(const OpenVpn &other)
{
    Fields::MergeWith(version,           other.version);
    Fields::MergeWith(user,              other.user);
    Fields::MergeWith(password,          other.password);
    Fields::MergeWith(conf_file,         other.conf_file);
    Fields::MergeWith(ciphers,           other.ciphers);
    Fields::MergeWith(auth,              other.auth);
    Fields::MergeWith(cert,              other.cert);
    Fields::MergeWith(key,               other.key);
    Fields::MergeWith(encrypted_key,     other.encrypted_key);
    Fields::MergeWith(key_passphrase,    other.key_passphrase);
    Fields::MergeWith(encryption_preset, other.encryption_preset);
    Fields::MergeWith(mss_fix,           other.mss_fix);
    Fields::MergeWith(interface_name,    other.interface_name);
    Fields::MergeWith(process_user,      other.process_user);
    Fields::MergeWith(verbosity,         other.verbosity);
    Fields::MergeWith(flags,             other.flags);
}

void OpenVpn::OverrideWith(const OpenVpn &other)
{
    Fields::OverrideWith(version,           other.version);
    Fields::OverrideWith(user,              other.user);
    Fields::OverrideWith(password,          other.password);
    Fields::OverrideWith(conf_file,         other.conf_file);
    Fields::OverrideWith(ciphers,           other.ciphers);
    Fields::OverrideWith(auth,              other.auth);
    Fields::OverrideWith(cert,              other.cert);
    Fields::OverrideWith(key,               other.key);
    Fields::OverrideWith(encrypted_key,     other.encrypted_key);
    Fields::OverrideWith(key_passphrase,    other.key_passphrase);
    Fields::OverrideWith(encryption_preset, other.encryption_preset);
    Fields::OverrideWith(mss_fix,           other.mss_fix);
    Fields::OverrideWith(interface_name,    other.interface_name);
    Fields::OverrideWith(process_user,      other.process_user);
    Fields::OverrideWith(verbosity,         other.verbosity);
    Fields::OverrideWith(flags,             other.flags);
}

void OpenVpn::SetDefaults(const std::string &provider)
{
    const Providers::Rules &rules = Providers::Lookup(provider);

    Fields::Default(version, kOpenVpn25);
    Fields::Default(user, std::string());
    Fields::Default(password, std::string(rules.default_password));
    Fields::Default(conf_file, std::string());
    Fields::Default(auth, std::string());
    Fields::Default(cert, std::string());
    Fields::Default(key, std::string());
    Fields::Default(encrypted_key, std::string());
    Fields::Default(key_passphrase, std::string());
    Fields::Default(encryption_preset, std::string(rules.default_encryption_preset));
    Fields::Default(mss_fix, std::uint16_t{0});
    Fields::Default(interface_name, "tun0");
    Fields::Default(process_user, "root");
    Fields::Default(verbosity, 1);
}

void OpenVpn::Validate(const std::string &provider) const
{
    const Providers::Rules &rules = Providers::Lookup(provider);

    const std::string v = Fields::ValueOr(version);
    if (v != kOpenVpn25 && v != kOpenVpn26)
    {
        throw Error::OpenVpnVersionInvalid(v, Join({kOpenVpn25, kOpenVpn26}, ", "));
    }

    const std::string u = Fields::ValueOr(user);
    if (rules.user_required && u.empty())
    {
        throw Error::OpenVpnUserEmpty();
    }

    if (Providers::PasswordRequired(rules, u) && !Fields::IsSet(password))
    {
        throw Error::OpenVpnPasswordEmpty();
    }

    ValidateConfFile(rules.custom_config_required, Fields::ValueOr(conf_file));

    ValidateBlob("client certificate", rules.cert_required, Fields::ValueOr(cert));
    ValidateBlob("client key", rules.key_required, Fields::ValueOr(key));
    ValidateBlob("encrypted key", rules.encrypted_key_required, Fields::ValueOr(encrypted_key));

    if (Fields::IsSet(encrypted_key) && !Fields::IsSet(key_passphrase))
    {
        throw Error::OpenVpnKeyPassphraseEmpty();
    }

    const std::uint16_t mss = Fields::ValueOr(mss_fix);
    if (mss > kMaxMssFix)
    {
        throw Error::OpenVpnMssFixTooHigh(mss, kMaxMssFix);
    }

    const std::string name = Fields::ValueOr(interface_name);
    if (!IsValidInterfaceName(name))
    {
        throw Error::OpenVpnInterfaceInvalid(name, kInterfaceNamePattern);
    }

    const int level = Fields::ValueOr(verbosity);
    if (level < kMinVerbosity || level > kMaxVerbosity)
    {
        throw Error::OpenVpnVerbosityOutOfBounds(level, kMinVerbosity, kMaxVerbosity);
    }
}

Tree::Node OpenVpn::ToLinesNode() const
{
    Tree::Node node("OpenVPN settings:");

    node.Append("OpenVPN version: " + Fields::ValueOr(version, std::string("not set")));
    node.Append("User: " + Fields::Obfuscate(user));
    node.Append("Password: " + Fields::Obfuscate(password));

    if (Fields::IsSet(conf_file))
    {
        node.Append("Custom configuration file: " + *conf_file);
    }
    if (ciphers && !ciphers->empty())
    {
        node.Append("Ciphers: " + Join(*ciphers, ", "));
    }
    if (Fields::IsSet(auth))
    {
        node.Append("Auth: " + *auth);
    }
    if (Fields::IsSet(cert))
    {
        node.Append("Client crt: " + Fields::Obfuscate(cert));
    }
    if (Fields::IsSet(key))
    {
        node.Append("Client key: " + Fields::Obfuscate(key));
    }
    if (Fields::IsSet(encrypted_key))
    {
        node.Append("Encrypted key: " + Fields::Obfuscate(encrypted_key) +
                    " (key passphrase " + Fields::Obfuscate(key_passphrase) + ")");
    }
    if (Fields::IsSet(encryption_preset))
    {
        node.Append("Private Internet Access encryption preset: " + *encryption_preset);
    }
    if (Fields::ValueOr(mss_fix) > 0)
    {
        node.Append("MSS Fix: " + std::to_string(*mss_fix));
    }

    node.Append("Network interface: " + Fields::ValueOr(interface_name, std::string("not set")));
    node.Append("Run OpenVPN as: " + Fields::ValueOr(process_user, std::string("not set")));
    node.Append("Verbosity level: " +
                (verbosity ? std::to_string(*verbosity) : std::string("not set")));

    if (flags && !flags->empty())
    {
        node.Append("Flags: " + Join(*flags, " "));
    }

    return node;
}

std::vector<std::string> OpenVpn::ToLines(const ToLinesSettings &style) const
{
    return ToLinesNode().Lines(style);
}

std::string OpenVpn::String() const
{
    return JoinLines(ToLines());
}

}
