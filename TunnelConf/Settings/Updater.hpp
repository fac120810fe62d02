#pragma once
// Updater.hpp — настройки фонового обновления данных серверов.

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "TunnelConf/Tree.hpp"

namespace TunnelConf
{

class Resolver;
class Settings;

/**
 * @brief Период обновления, DNS для обновления и провайдеры, чьи списки обновляются.
 */
class Updater
{
public:
    /// @brief 0: обновление выключено; иначе не меньше kMinUpdaterPeriod.
    std::optional<std::chrono::seconds> period;
    /// @brief Открытый DNS, через который идёт обновление.
    std::optional<std::string> dns_address;

    std::optional<bool> cyberghost;
    std::optional<bool> mullvad;
    std::optional<bool> nordvpn;
    std::optional<bool> private_internet_access;
    std::optional<bool> privado;
    std::optional<bool> purevpn;
    std::optional<bool> surfshark;
    std::optional<bool> torguard;
    std::optional<bool> vyprvpn;
    std::optional<bool> windscribe;

    Updater Copy() const;
    void MergeWith(const Updater &other);
    void OverrideWith(const Updater &other);

    /// @throw ValidationError
    void Validate() const;

    /// @brief Имена провайдеров, для которых обновление включено.
    std::vector<std::string> EnabledProviders() const;

    /**
     * @brief Задать флаги провайдеров по списку: перечисленные включены, остальные выключены.
     * @return Имена из списка, которые не являются обновляемыми провайдерами.
     */
    std::vector<std::string> EnableOnly(const std::vector<std::string> &providers);

    Tree::Node ToLinesNode() const;
    std::vector<std::string> ToLines(const ToLinesSettings &style = {}) const;
    std::string String() const;

    bool operator==(const Updater &) const = default;

private:
    friend class Resolver;
    friend class Settings;

    void SetDefaults();
};

inline constexpr std::chrono::seconds kMinUpdaterPeriod{60};

/// @brief Длительность в записи вида "24h0m0s", "5m0s", "30s".
std::string FormatDuration(std::chrono::seconds d);

/**
 * @brief Разбирает "86400", "30s", "5m", "24h", "1h30m".
 * @throw std::invalid_argument "invalid duration: <s>".
 */
std::chrono::seconds ParseDuration(const std::string &s);

}
