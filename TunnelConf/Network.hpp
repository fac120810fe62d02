#pragma once
// Network.hpp — адреса, CIDR-сети и endpoint'ы туннеля (Boost.Asio ip).

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>

namespace TunnelConf
{

using IpAddress = boost::asio::ip::address;

/**
 * @brief CIDR-сеть. Оба поля необязательны: фрагмент может содержать
 *        «пустую» запись, которую отвергнет валидатор.
 */
struct IpNetwork
{
    std::optional<IpAddress> ip;            ///< Адрес (не маскируется, как в wg-quick).
    std::optional<unsigned>  prefix_length; ///< Маска в виде длины префикса.

    bool operator==(const IpNetwork &) const = default;
};

/// @brief Список сетей; std::nullopt внутри означает отсутствующую запись.
using IpNetworks = std::vector<std::optional<IpNetwork>>;

/**
 * @brief Адрес пира WireGuard. Порт 0 означает «не задан».
 */
struct Endpoint
{
    std::optional<IpAddress> ip;
    std::uint16_t            port = 0;

    bool operator==(const Endpoint &) const = default;
};

/**
 * @brief Разбирает IPv4/IPv6 адрес.
 * @throw std::invalid_argument "invalid IP address: <s>".
 */
IpAddress ParseAddress(const std::string &s);

/**
 * @brief Разбирает "адрес/префикс".
 * @throw std::invalid_argument "invalid CIDR address: <s>".
 */
IpNetwork ParseCidr(const std::string &s);

/**
 * @brief Разбирает список CIDR через запятую.
 * @throw std::invalid_argument Как ParseCidr.
 */
IpNetworks ParseCidrList(const std::string &csv);

/**
 * @brief Разбирает "ip:port" или "[ip6]:port". Имена хостов не резолвятся.
 * @throw std::invalid_argument "invalid endpoint: <s>".
 */
Endpoint ParseEndpoint(const std::string &s);

/**
 * @brief Разбирает номер порта 1..65535.
 * @throw std::invalid_argument "invalid port: <s>".
 */
std::uint16_t ParsePort(const std::string &s);

bool IsIPv6(const IpAddress &ip) noexcept;

/// @brief Допустимое имя сетевого интерфейса (wg0, tun0, ...).
inline constexpr const char *kInterfaceNamePattern = "^[a-zA-Z0-9_]+$";

bool IsValidInterfaceName(const std::string &name);

IpNetwork AllIPv4();
IpNetwork AllIPv6();

std::string ToString(const IpNetwork &network);
std::string ToString(const Endpoint &endpoint);

}
