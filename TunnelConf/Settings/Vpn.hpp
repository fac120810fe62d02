#pragma once
// Vpn.hpp — выбор протокола и провайдера вместе с настройками обоих протоколов.

#include <optional>
#include <string>
#include <vector>

#include "TunnelConf/Settings/OpenVpn.hpp"
#include "TunnelConf/Settings/Wireguard.hpp"
#include "TunnelConf/Tree.hpp"

namespace TunnelConf
{

class Resolver;
class Settings;

inline constexpr const char *kVpnTypeOpenVpn   = "openvpn";
inline constexpr const char *kVpnTypeWireguard = "wireguard";

class Vpn
{
public:
    /// @brief "openvpn" или "wireguard".
    std::optional<std::string> type;
    /// @brief Имя провайдера в нижнем регистре, например "mullvad".
    std::optional<std::string> provider;
    OpenVpn   openvpn;
    Wireguard wireguard;

    Vpn Copy() const;
    void MergeWith(const Vpn &other);
    void OverrideWith(const Vpn &other);

    /**
     * @brief Тип, провайдер, поддержка WireGuard провайдером, затем настройки
     *        только выбранного протокола.
     * @throw ValidationError
     */
    void Validate() const;

    bool IsWireguard() const;

    Tree::Node ToLinesNode() const;
    std::vector<std::string> ToLines(const ToLinesSettings &style = {}) const;
    std::string String() const;

    bool operator==(const Vpn &) const = default;

private:
    friend class Resolver;
    friend class Settings;

    void SetDefaults();
};

}
