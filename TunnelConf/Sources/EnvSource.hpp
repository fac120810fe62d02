#pragma once
// EnvSource.hpp — фрагмент настроек из переменных окружения.

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "TunnelConf/Sources/Source.hpp"

namespace TunnelConf
{

/**
 * @brief Читает снимок переменных окружения.
 *
 * Пустая переменная считается незаданной. Если источник создан через
 * FromProcess(), секретные переменные после чтения удаляются из окружения процесса.
 */
class EnvSource : public Source
{
public:
    using Environment = std::map<std::string, std::string>;

    explicit EnvSource(Environment environment);

    /// @brief Снимок environ текущего процесса.
    static EnvSource FromProcess();

    std::string Name() const override;
    Settings Read() override;

    /// @brief Переменные, значения которых являются секретами.
    static const std::vector<std::string> &SecretKeys();

private:
    EnvSource(Environment environment, bool unset_secrets);

    /// @brief Значение или пустая строка.
    std::string Get(const std::string &key) const;

    /**
     * @brief Значение по основному ключу, иначе по устаревшим.
     * @return Пара (найденный ключ, значение); ключ пуст, если ничего не задано.
     */
    std::pair<std::string, std::string> GetWithRetro(const std::string &key,
                                                     const std::vector<std::string> &retro) const;

    void ReadVpn(Settings &s) const;
    void ReadWireguard(Wireguard &w) const;
    void ReadOpenVpn(OpenVpn &o) const;
    void ReadControlServer(ControlServer &c) const;
    void ReadUpdater(Updater &u) const;

    Environment env_;
    bool        unset_secrets_;
};

}
