#pragma once
// WireguardConfSource.hpp — фрагмент настроек WireGuard из файла wg-quick.

#include <string>

#include <boost/property_tree/ptree_fwd.hpp>

#include "TunnelConf/Sources/Source.hpp"

namespace TunnelConf
{

/**
 * @brief Читает секции [Interface] и [Peer] файла в формате wg-quick.
 *
 * Отсутствующий файл даёт пустой фрагмент. Поддерживается один [Peer].
 */
class WireguardConfSource : public Source
{
public:
    explicit WireguardConfSource(std::string path);

    std::string Name() const override;
    Settings Read() override;

    /**
     * @brief Разобрать содержимое файла.
     * @throw SourceError
     */
    Wireguard Parse(const std::string &content) const;

    /// @brief Поля секции [Interface].
    static void ParseInterfaceSection(const boost::property_tree::ptree &section, Wireguard &w);

    /// @brief Поля секции [Peer].
    static void ParsePeerSection(const boost::property_tree::ptree &section, Wireguard &w);

private:
    std::string path_;
};

}
