#pragma once
// OpenVpn.hpp — настройки клиента OpenVPN.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "TunnelConf/Tree.hpp"

namespace TunnelConf
{

class Resolver;
class Vpn;

/**
 * @brief Настройки клиента OpenVPN.
 *
 * Пустая строка в user/password означает «аутентификация по паролю не нужна»,
 * в conf_file/auth/cert/key означает «не использовать». Какие из них обязательны,
 * решает таблица провайдеров (Providers.hpp).
 */
class OpenVpn
{
public:
    /// @brief "2.5" или "2.6".
    std::optional<std::string> version;
    std::optional<std::string> user;
    std::optional<std::string> password;
    /// @brief Путь к пользовательскому .ovpn (для провайдера "custom").
    std::optional<std::string> conf_file;
    std::optional<std::vector<std::string>> ciphers;
    std::optional<std::string> auth;
    /// @brief base64 DER клиентского сертификата (блок <cert>).
    std::optional<std::string> cert;
    /// @brief base64 DER клиентского ключа.
    std::optional<std::string> key;
    /// @brief base64 DER зашифрованного ключа; требует key_passphrase.
    std::optional<std::string> encrypted_key;
    std::optional<std::string> key_passphrase;
    /// @brief Пресет шифрования Private Internet Access ("strong", "normal", ...).
    std::optional<std::string> encryption_preset;
    /// @brief Значение mssfix, 0: не задавать.
    std::optional<std::uint16_t> mss_fix;
    std::optional<std::string> interface_name;
    std::optional<std::string> process_user;
    /// @brief Уровень подробности 0..6.
    std::optional<int> verbosity;
    std::optional<std::vector<std::string>> flags;

    OpenVpn Copy() const;
    void MergeWith(const OpenVpn &other);
    void OverrideWith(const OpenVpn &other);

    /**
     * @brief Проверить инварианты с учётом требований провайдера.
     * @param provider Имя VPN-провайдера, уже разрешённое.
     * @throw ValidationError
     */
    void Validate(const std::string &provider) const;

    Tree::Node ToLinesNode() const;
    std::vector<std::string> ToLines(const ToLinesSettings &style = {}) const;
    std::string String() const;

    bool operator==(const OpenVpn &) const = default;

private:
    friend class Resolver;
    friend class Vpn;

    /// @brief Пароль и пресет шифрования по умолчанию зависят от провайдера.
    void SetDefaults(const std::string &provider);
};

/// @brief Допустимые версии OpenVPN.
inline constexpr const char *kOpenVpn25 = "2.5";
inline constexpr const char *kOpenVpn26 = "2.6";

/// @brief Максимальное значение mssfix.
inline constexpr std::uint16_t kMaxMssFix = 10000;

/// @brief Границы уровня подробности (включительно).
inline constexpr int kMinVerbosity = 0;
inline constexpr int kMaxVerbosity = 6;

}
