#pragma once
// Providers.hpp — декларативная таблица требований VPN-провайдеров.

#include <string>
#include <string_view>
#include <vector>

namespace TunnelConf::Providers
{

inline constexpr std::string_view kAirvpn                = "airvpn";
inline constexpr std::string_view kCustom                = "custom";
inline constexpr std::string_view kCyberghost            = "cyberghost";
inline constexpr std::string_view kExpressvpn            = "expressvpn";
inline constexpr std::string_view kFastestvpn            = "fastestvpn";
inline constexpr std::string_view kGiganews              = "giganews";
inline constexpr std::string_view kHideMyAss             = "hidemyass";
inline constexpr std::string_view kIpvanish              = "ipvanish";
inline constexpr std::string_view kIvpn                  = "ivpn";
inline constexpr std::string_view kMullvad               = "mullvad";
inline constexpr std::string_view kNordvpn               = "nordvpn";
inline constexpr std::string_view kPerfectPrivacy        = "perfect privacy";
inline constexpr std::string_view kPrivado               = "privado";
inline constexpr std::string_view kPrivateInternetAccess = "private internet access";
inline constexpr std::string_view kPrivatevpn            = "privatevpn";
inline constexpr std::string_view kProtonvpn             = "protonvpn";
inline constexpr std::string_view kPurevpn               = "purevpn";
inline constexpr std::string_view kSlickvpn              = "slickvpn";
inline constexpr std::string_view kSurfshark             = "surfshark";
inline constexpr std::string_view kTorguard              = "torguard";
inline constexpr std::string_view kVpnSecure             = "vpn secure";
inline constexpr std::string_view kVpnUnlimited          = "vpn unlimited";
inline constexpr std::string_view kVyprvpn               = "vyprvpn";
inline constexpr std::string_view kWevpn                 = "wevpn";
inline constexpr std::string_view kWindscribe            = "windscribe";

/// @brief Предикат «пароль не нужен для такого пользователя».
using PasswordWaiver = bool (*)(const std::string &user);

/**
 * @brief Требования провайдера к настройкам OpenVPN/WireGuard и его значения по умолчанию.
 */
struct Rules
{
    std::string_view name;
    bool user_required          = true;
    bool cert_required          = false;
    bool key_required           = false;
    bool encrypted_key_required = false;
    bool custom_config_required = false;
    bool wireguard_supported    = false;
    std::string_view default_password;
    std::string_view default_encryption_preset;
    PasswordWaiver   password_waiver = nullptr;
};

/**
 * @brief Найти правила провайдера по имени (регистр важен, имена в нижнем регистре).
 * @return nullptr для неизвестного провайдера.
 */
const Rules *Find(std::string_view provider) noexcept;

/**
 * @brief Правила провайдера; для неизвестного общие правила (нужен логин и пароль).
 */
const Rules &Lookup(std::string_view provider) noexcept;

/// @brief Нужен ли пароль с учётом исключений провайдера.
bool PasswordRequired(const Rules &rules, const std::string &user);

/// @brief Имена всех известных провайдеров в порядке таблицы.
std::vector<std::string> Names();

/// @brief Учётная запись IVPN вида "i-XXXX-XXXX-XXXX" (пароль не нужен).
bool IsIvpnAccountId(const std::string &user);

}
