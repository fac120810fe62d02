#pragma once
// Settings.hpp — полный набор настроек: VPN, сервер управления, обновление серверов.

#include <string>
#include <vector>

#include "TunnelConf/Settings/ControlServer.hpp"
#include "TunnelConf/Settings/Updater.hpp"
#include "TunnelConf/Settings/Vpn.hpp"
#include "TunnelConf/Tree.hpp"

namespace TunnelConf
{

class Resolver;

/**
 * @brief Фрагмент или итоговые настройки. Все операции делегируются доменам
 *        в фиксированном порядке: vpn, control_server, updater.
 */
class Settings
{
public:
    Vpn           vpn;
    ControlServer control_server;
    Updater       updater;

    Settings Copy() const;
    void MergeWith(const Settings &other);
    void OverrideWith(const Settings &other);

    /// @throw ValidationError Первое нарушение, с префиксом домена.
    void Validate() const;

    /// @brief Ни одно поле не задано.
    bool Empty() const;

    Tree::Node ToLinesNode() const;
    std::vector<std::string> ToLines(const ToLinesSettings &style = {}) const;
    std::string String() const;

    bool operator==(const Settings &) const = default;

private:
    friend class Resolver;

    void SetDefaults();
};

}
