#pragma once
// Base64.hpp — строгое декодирование стандартного base64 (RFC 4648, с паддингом).

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace TunnelConf::Base64
{

/// @brief Длина ключа WireGuard (Curve25519) в байтах.
constexpr std::size_t kWireguardKeyLength = 32;

/**
 * @brief Декодирует base64. Символы '\r' и '\n' пропускаются.
 * @param s Закодированные данные.
 * @return Декодированные байты.
 * @throw std::invalid_argument "illegal base64 data at input byte N".
 */
std::vector<std::uint8_t> Decode(const std::string &s);

/**
 * @brief Проверяет, что строка является base64-ключом WireGuard ровно из 32 байт.
 * @throw std::invalid_argument С описанием причины.
 */
void ParseWireguardKey(const std::string &s);

/// @brief То же, что ParseWireguardKey, но без исключения.
bool IsWireguardKey(const std::string &s) noexcept;

}
