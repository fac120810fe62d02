#pragma once
// Wireguard.hpp — настройки туннеля WireGuard.

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "TunnelConf/Network.hpp"
#include "TunnelConf/Tree.hpp"

namespace TunnelConf
{

class Resolver;
class Vpn;

/**
 * @brief Настройки WireGuard.
 *
 * Каждое поле необязательно: std::nullopt означает «источник не высказался»,
 * пустое значение означает осознанный выбор источника. После Resolver все поля,
 * кроме ключей, endpoint'а и адресов, заданы.
 */
class Wireguard
{
public:
    std::optional<std::string> interface_name;
    std::optional<std::string> private_key;
    std::optional<std::string> public_key;
    std::optional<std::string> pre_shared_key;
    std::optional<Endpoint>    endpoint;
    std::optional<IpNetworks>  allowed_ips;
    std::optional<IpNetworks>  addresses;
    std::optional<std::uint32_t> firewall_mark;
    std::optional<std::uint32_t> rule_priority;
    std::optional<bool>        ipv6;
    /// @brief "auto", "kernelspace" или "userspace".
    std::optional<std::string> implementation;

    /// @brief Независимая копия (общего хранилища нет).
    Wireguard Copy() const;

    /// @brief Заполнить незаданные поля значениями из other.
    void MergeWith(const Wireguard &other);

    /// @brief Заменить поля, заданные в other.
    void OverrideWith(const Wireguard &other);

    /**
     * @brief Проверить инварианты; первая же ошибка выбрасывается.
     * @throw ValidationError
     */
    void Validate() const;

    /// @brief Узел "Wireguard settings:" для общего дерева.
    Tree::Node ToLinesNode() const;

    /// @brief Строки без заголовка, по одной на группу полей.
    std::vector<std::string> ToLines(const ToLinesSettings &style = {}) const;

    std::string String() const;

    bool operator==(const Wireguard &) const = default;

private:
    friend class Resolver;
    friend class Vpn;

    void SetDefaults();
};

}
