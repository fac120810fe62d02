#pragma once
// Errors.hpp — ошибки валидации (по одному коду на инвариант) и ошибки источников.

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace TunnelConf
{

/**
 * @brief Идентичность нарушенного инварианта. Сообщение для человека
 *        форматируется отдельно, сравнивать ошибки следует по коду.
 */
enum class Errc
{
    // Wireguard
    InterfaceNameInvalid = 1,
    PrivateKeyMissing,
    PrivateKeyInvalid,
    PublicKeyMissing,
    PublicKeyInvalid,
    PreSharedKeyInvalid,
    EndpointMissing,
    EndpointIPMissing,
    EndpointPortMissing,
    AllowedIPsMissing,
    AllowedIPIsNil,
    AllowedIPIPIsNil,
    AllowedIPMaskMissing,
    AllowedIPv6NotSupported,
    AddressMissing,
    AddressNil,
    AddressIPMissing,
    AddressMaskMissing,
    AddressIPv6NotSupported,
    FirewallMarkMissing,
    ImplementationInvalid,

    // OpenVPN
    OpenVpnVersionInvalid,
    OpenVpnUserEmpty,
    OpenVpnPasswordEmpty,
    FilepathMissing,
    FileNotFound,
    CustomConfigInvalid,
    MissingValue,
    Base64Invalid,
    OpenVpnKeyPassphraseEmpty,
    OpenVpnMssFixTooHigh,
    OpenVpnInterfaceInvalid,
    OpenVpnVerbosityOutOfBounds,

    // VPN
    VpnTypeInvalid,
    ProviderInvalid,
    WireguardNotSupported,

    // Control server
    ControlServerAddressInvalid,

    // Updater
    UpdaterPeriodTooSmall,
    UpdaterDnsAddressInvalid,
};

/// @brief Категория std::error_code для Errc ("tunnelconf.settings").
const std::error_category &SettingsCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

/// @brief Базовый текст инварианта без контекста, например "endpoint port is missing".
const char *Describe(Errc e) noexcept;

/**
 * @brief Нарушение инварианта настроек.
 *
 * Несёт код, отформатированное сообщение и структурированный контекст:
 * значение-нарушитель и позицию элемента списка (1-based) с длиной списка.
 */
class ValidationError : public std::runtime_error
{
public:
    ValidationError(Errc code,
                    const std::string &message,
                    std::string value = std::string(),
                    std::size_t position = 0,
                    std::size_t count = 0);

    Errc Code() const noexcept { return code_; }
    std::error_code ErrorCode() const noexcept { return make_error_code(code_); }

    /// @brief Значение-нарушитель (пусто для секретов и когда значения нет).
    const std::string &Value() const noexcept { return value_; }
    /// @brief Позиция элемента списка, 0 если ошибка не про список.
    std::size_t Position() const noexcept { return position_; }
    std::size_t Count() const noexcept { return count_; }

private:
    Errc        code_;
    std::string value_;
    std::size_t position_;
    std::size_t count_;
};

/**
 * @brief Ошибка источника фрагмента (разбор переменных окружения, файлов).
 */
class SourceError : public std::runtime_error
{
public:
    SourceError(std::string source, const std::string &message);

    const std::string &Source() const noexcept { return source_; }

private:
    std::string source_;
};

/**
 * @brief Конструкторы ошибок, по одному на инвариант.
 */
namespace Error
{
    ValidationError InterfaceNameInvalid(const std::string &name);
    ValidationError PrivateKeyMissing();
    ValidationError PrivateKeyInvalid();
    ValidationError PublicKeyMissing();
    ValidationError PublicKeyInvalid(const std::string &key);
    ValidationError PreSharedKeyInvalid();
    ValidationError EndpointMissing();
    ValidationError EndpointIPMissing();
    ValidationError EndpointPortMissing();
    ValidationError AllowedIPsMissing();
    ValidationError AllowedIPIsNil(std::size_t position, std::size_t count);
    ValidationError AllowedIPIPIsNil(std::size_t position, std::size_t count);
    ValidationError AllowedIPMaskMissing(std::size_t position, std::size_t count);
    ValidationError AllowedIPv6NotSupported(const std::string &network);
    ValidationError AddressMissing();
    ValidationError AddressNil(std::size_t position, std::size_t count);
    ValidationError AddressIPMissing(std::size_t position, std::size_t count);
    ValidationError AddressMaskMissing(std::size_t position, std::size_t count);
    ValidationError AddressIPv6NotSupported(std::size_t position, std::size_t count);
    ValidationError FirewallMarkMissing();
    ValidationError ImplementationInvalid(const std::string &implementation);

    ValidationError OpenVpnVersionInvalid(const std::string &version, const std::string &choices);
    ValidationError OpenVpnUserEmpty();
    ValidationError OpenVpnPasswordEmpty();
    ValidationError FilepathMissing();
    ValidationError FileNotFound(const std::string &path);
    ValidationError CustomConfigInvalid(const std::string &path, const std::string &reason);
    ValidationError MissingValue();
    ValidationError Base64Invalid(const std::string &reason);
    ValidationError OpenVpnKeyPassphraseEmpty();
    ValidationError OpenVpnMssFixTooHigh(std::uint16_t mssfix, std::uint16_t maximum);
    ValidationError OpenVpnInterfaceInvalid(const std::string &name, const std::string &regex);
    ValidationError OpenVpnVerbosityOutOfBounds(int verbosity, int minimum, int maximum);

    ValidationError VpnTypeInvalid(const std::string &type, const std::string &choices);
    ValidationError ProviderInvalid(const std::string &provider);
    ValidationError WireguardNotSupported(const std::string &provider);

    ValidationError ControlServerAddressInvalid(const std::string &address, const std::string &reason);

    ValidationError UpdaterPeriodTooSmall(const std::string &period, const std::string &minimum);
    ValidationError UpdaterDnsAddressInvalid(const std::string &address);

    /// @brief Тот же код, сообщение с префиксом "context: ".
    ValidationError Wrap(const std::string &context, const ValidationError &inner);
}

}

template <>
struct std::is_error_code_enum<TunnelConf::Errc> : std::true_type
{
};
