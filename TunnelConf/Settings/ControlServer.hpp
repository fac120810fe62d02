#pragma once
// ControlServer.hpp — настройки HTTP сервера управления.

#include <optional>
#include <string>
#include <vector>

#include "TunnelConf/Tree.hpp"

namespace TunnelConf
{

class Resolver;
class Settings;

/**
 * @brief Адрес прослушивания и логирование запросов сервера управления.
 */
class ControlServer
{
public:
    /// @brief "[host]:port", например ":8000" или "127.0.0.1:9999".
    std::optional<std::string> address;
    /// @brief Логировать каждый запрос.
    std::optional<bool>        log;

    ControlServer Copy() const;
    void MergeWith(const ControlServer &other);
    void OverrideWith(const ControlServer &other);

    /// @throw ValidationError
    void Validate() const;

    Tree::Node ToLinesNode() const;
    std::vector<std::string> ToLines(const ToLinesSettings &style = {}) const;
    std::string String() const;

    bool operator==(const ControlServer &) const = default;

private:
    friend class Resolver;
    friend class Settings;

    void SetDefaults();
};

}
