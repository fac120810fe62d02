#include "TunnelConf/Errors.hpp"

#include <utility>

namespace TunnelConf
{

namespace
{

class SettingsCategoryImpl : public std::error_category
{
public:
    const char *name() const noexcept override
    {
        return "tunnelconf.settings";
    }

    std::string message(int ev) const override
    {
        return Describe(static_cast<Errc>(ev));
    }
};

std::string With(Errc code, const std::string &detail)
{
    return std::string(Describe(code)) + ": " + detail;
}

std::string Position(const char *what, std::size_t position, std::size_t count)
{
    return std::string("for ") + what + " " + std::to_string(position) +
           " of " + std::to_string(count);
}

}

const std::error_category &SettingsCategory() noexcept
{
    static const SettingsCategoryImpl category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept
{
    return {static_cast<int>(e), SettingsCategory()};
}

const char *Describe(Errc e) noexcept
{
    switch (e)
    {
        case Errc::InterfaceNameInvalid:        return "invalid interface name";
        case Errc::PrivateKeyMissing:           return "private key is missing";
        case Errc::PrivateKeyInvalid:           return "cannot parse private key";
        case Errc::PublicKeyMissing:            return "public key is missing";
        case Errc::PublicKeyInvalid:            return "cannot parse public key";
        case Errc::PreSharedKeyInvalid:         return "cannot parse pre-shared key";
        case Errc::EndpointMissing:             return "endpoint is missing";
        case Errc::EndpointIPMissing:           return "endpoint IP is missing";
        case Errc::EndpointPortMissing:         return "endpoint port is missing";
        case Errc::AllowedIPsMissing:           return "allowed IPs are missing";
        case Errc::AllowedIPIsNil:              return "allowed IP is nil";
        case Errc::AllowedIPIPIsNil:            return "allowed IP IP field is nil";
        case Errc::AllowedIPMaskMissing:        return "allowed IP mask is missing";
        case Errc::AllowedIPv6NotSupported:     return "allowed IPv6 address not supported";
        case Errc::AddressMissing:              return "interface address is missing";
        case Errc::AddressNil:                  return "interface address is nil";
        case Errc::AddressIPMissing:            return "interface address IP is missing";
        case Errc::AddressMaskMissing:          return "interface address mask is missing";
        case Errc::AddressIPv6NotSupported:     return "interface address is IPv6 but IPv6 is not supported";
        case Errc::FirewallMarkMissing:         return "firewall mark is missing";
        case Errc::ImplementationInvalid:       return "invalid implementation";
        case Errc::OpenVpnVersionInvalid:       return "OpenVPN version is not valid";
        case Errc::OpenVpnUserEmpty:            return "OpenVPN user is empty";
        case Errc::OpenVpnPasswordEmpty:        return "OpenVPN password is empty";
        case Errc::FilepathMissing:             return "filepath is missing";
        case Errc::FileNotFound:                return "file does not exist";
        case Errc::CustomConfigInvalid:         return "extracting information from custom configuration file";
        case Errc::MissingValue:                return "missing value";
        case Errc::Base64Invalid:               return "illegal base64 data";
        case Errc::OpenVpnKeyPassphraseEmpty:   return "OpenVPN key passphrase is empty";
        case Errc::OpenVpnMssFixTooHigh:        return "mssfix option value is too high";
        case Errc::OpenVpnInterfaceInvalid:     return "interface name is not valid";
        case Errc::OpenVpnVerbosityOutOfBounds: return "verbosity value is out of bounds";
        case Errc::VpnTypeInvalid:              return "VPN type is not valid";
        case Errc::ProviderInvalid:             return "VPN provider is not valid";
        case Errc::WireguardNotSupported:       return "Wireguard is not supported by VPN provider";
        case Errc::ControlServerAddressInvalid: return "control server listening address is not valid";
        case Errc::UpdaterPeriodTooSmall:       return "updater period is too small";
        case Errc::UpdaterDnsAddressInvalid:    return "updater DNS address is not valid";
    }
    return "unknown settings error";
}

ValidationError::ValidationError(Errc code,
                                 const std::string &message,
                                 std::string value,
                                 std::size_t position,
                                 std::size_t count)
    : std::runtime_error(message)
    , code_(code)
    , value_(std::move(value))
    , position_(position)
    , count_(count)
{
}

SourceError::SourceError(std::string source, const std::string &message)
    : std::runtime_error(message)
    , source_(std::move(source))
{
}

namespace Error
{

ValidationError InterfaceNameInvalid(const std::string &name)
{
    return {Errc::InterfaceNameInvalid, With(Errc::InterfaceNameInvalid, name), name};
}

ValidationError PrivateKeyMissing()
{
    return {Errc::PrivateKeyMissing, Describe(Errc::PrivateKeyMissing)};
}

// Значение приватного ключа в сообщение не попадает.
ValidationError PrivateKeyInvalid()
{
    return {Errc::PrivateKeyInvalid, Describe(Errc::PrivateKeyInvalid)};
}

ValidationError PublicKeyMissing()
{
    return {Errc::PublicKeyMissing, Describe(Errc::PublicKeyMissing)};
}

ValidationError PublicKeyInvalid(const std::string &key)
{
    return {Errc::PublicKeyInvalid, With(Errc::PublicKeyInvalid, key), key};
}

ValidationError PreSharedKeyInvalid()
{
    return {Errc::PreSharedKeyInvalid, Describe(Errc::PreSharedKeyInvalid)};
}

ValidationError EndpointMissing()
{
    return {Errc::EndpointMissing, Describe(Errc::EndpointMissing)};
}

ValidationError EndpointIPMissing()
{
    return {Errc::EndpointIPMissing, Describe(Errc::EndpointIPMissing)};
}

ValidationError EndpointPortMissing()
{
    return {Errc::EndpointPortMissing, Describe(Errc::EndpointPortMissing)};
}

ValidationError AllowedIPsMissing()
{
    return {Errc::AllowedIPsMissing, Describe(Errc::AllowedIPsMissing)};
}

ValidationError AllowedIPIsNil(std::size_t position, std::size_t count)
{
    return {Errc::AllowedIPIsNil,
            With(Errc::AllowedIPIsNil, Position("allowed IP", position, count)),
            std::string(), position, count};
}

ValidationError AllowedIPIPIsNil(std::size_t position, std::size_t count)
{
    return {Errc::AllowedIPIPIsNil,
            With(Errc::AllowedIPIPIsNil, Position("allowed IP", position, count)),
            std::string(), position, count};
}

ValidationError AllowedIPMaskMissing(std::size_t position, std::size_t count)
{
    return {Errc::AllowedIPMaskMissing,
            With(Errc::AllowedIPMaskMissing, Position("allowed IP", position, count)),
            std::string(), position, count};
}

ValidationError AllowedIPv6NotSupported(const std::string &network)
{
    return {Errc::AllowedIPv6NotSupported,
            With(Errc::AllowedIPv6NotSupported, "for allowed IP " + network), network};
}

ValidationError AddressMissing()
{
    return {Errc::AddressMissing, Describe(Errc::AddressMissing)};
}

ValidationError AddressNil(std::size_t position, std::size_t count)
{
    return {Errc::AddressNil,
            With(Errc::AddressNil, Position("address", position, count)),
            std::string(), position, count};
}

ValidationError AddressIPMissing(std::size_t position, std::size_t count)
{
    return {Errc::AddressIPMissing,
            With(Errc::AddressIPMissing, Position("address", position, count)),
            std::string(), position, count};
}

ValidationError AddressMaskMissing(std::size_t position, std::size_t count)
{
    return {Errc::AddressMaskMissing,
            With(Errc::AddressMaskMissing, Position("address", position, count)),
            std::string(), position, count};
}

ValidationError AddressIPv6NotSupported(std::size_t position, std::size_t count)
{
    return {Errc::AddressIPv6NotSupported,
            With(Errc::AddressIPv6NotSupported, Position("address", position, count)),
            std::string(), position, count};
}

ValidationError FirewallMarkMissing()
{
    return {Errc::FirewallMarkMissing, Describe(Errc::FirewallMarkMissing)};
}

ValidationError ImplementationInvalid(const std::string &implementation)
{
    return {Errc::ImplementationInvalid,
            With(Errc::ImplementationInvalid, implementation), implementation};
}

ValidationError OpenVpnVersionInvalid(const std::string &version, const std::string &choices)
{
    return {Errc::OpenVpnVersionInvalid,
            With(Errc::OpenVpnVersionInvalid, version + " is not one of " + choices), version};
}

ValidationError OpenVpnUserEmpty()
{
    return {Errc::OpenVpnUserEmpty, Describe(Errc::OpenVpnUserEmpty)};
}

ValidationError OpenVpnPasswordEmpty()
{
    return {Errc::OpenVpnPasswordEmpty, Describe(Errc::OpenVpnPasswordEmpty)};
}

ValidationError FilepathMissing()
{
    return {Errc::FilepathMissing, Describe(Errc::FilepathMissing)};
}

ValidationError FileNotFound(const std::string &path)
{
    return {Errc::FileNotFound, With(Errc::FileNotFound, path), path};
}

ValidationError CustomConfigInvalid(const std::string &path, const std::string &reason)
{
    return {Errc::CustomConfigInvalid, With(Errc::CustomConfigInvalid, reason), path};
}

ValidationError MissingValue()
{
    return {Errc::MissingValue, Describe(Errc::MissingValue)};
}

ValidationError Base64Invalid(const std::string &reason)
{
    return {Errc::Base64Invalid, reason};
}

ValidationError OpenVpnKeyPassphraseEmpty()
{
    return {Errc::OpenVpnKeyPassphraseEmpty, Describe(Errc::OpenVpnKeyPassphraseEmpty)};
}

ValidationError OpenVpnMssFixTooHigh(std::uint16_t mssfix, std::uint16_t maximum)
{
    return {Errc::OpenVpnMssFixTooHigh,
            With(Errc::OpenVpnMssFixTooHigh,
                 std::to_string(mssfix) + " is over the maximum value of " + std::to_string(maximum)),
            std::to_string(mssfix)};
}

ValidationError OpenVpnInterfaceInvalid(const std::string &name, const std::string &regex)
{
    return {Errc::OpenVpnInterfaceInvalid,
            With(Errc::OpenVpnInterfaceInvalid,
                 "'" + name + "' does not match regex '" + regex + "'"),
            name};
}

ValidationError OpenVpnVerbosityOutOfBounds(int verbosity, int minimum, int maximum)
{
    return {Errc::OpenVpnVerbosityOutOfBounds,
            With(Errc::OpenVpnVerbosityOutOfBounds,
                 std::to_string(verbosity) + " can only be between " +
                 std::to_string(minimum) + " and " + std::to_string(maximum)),
            std::to_string(verbosity)};
}

ValidationError VpnTypeInvalid(const std::string &type, const std::string &choices)
{
    return {Errc::VpnTypeInvalid,
            With(Errc::VpnTypeInvalid, type + " is not one of " + choices), type};
}

ValidationError ProviderInvalid(const std::string &provider)
{
    return {Errc::ProviderInvalid, With(Errc::ProviderInvalid, provider), provider};
}

ValidationError WireguardNotSupported(const std::string &provider)
{
    return {Errc::WireguardNotSupported, With(Errc::WireguardNotSupported, provider), provider};
}

ValidationError ControlServerAddressInvalid(const std::string &address, const std::string &reason)
{
    return {Errc::ControlServerAddressInvalid,
            With(Errc::ControlServerAddressInvalid, address + ": " + reason), address};
}

ValidationError UpdaterPeriodTooSmall(const std::string &period, const std::string &minimum)
{
    return {Errc::UpdaterPeriodTooSmall,
            With(Errc::UpdaterPeriodTooSmall, period + " must be at least " + minimum), period};
}

ValidationError UpdaterDnsAddressInvalid(const std::string &address)
{
    return {Errc::UpdaterDnsAddressInvalid, With(Errc::UpdaterDnsAddressInvalid, address), address};
}

ValidationError Wrap(const std::string &context, const ValidationError &inner)
{
    return {inner.Code(), context + ": " + inner.what(),
            inner.Value(), inner.Position(), inner.Count()};
}

}

}
