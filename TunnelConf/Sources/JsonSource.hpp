#pragma once
// JsonSource.hpp — фрагмент настроек из JSON файла.

#include <string>

#include <boost/json/object.hpp>

#include "TunnelConf/Sources/Source.hpp"

namespace TunnelConf
{

/**
 * @brief Читает JSON вида
 * @code
 * {
 *   "vpn": { "type": "wireguard", "provider": "mullvad",
 *            "wireguard": { ... }, "openvpn": { ... } },
 *   "control_server": { "address": ":8000", "log": true },
 *   "updater": { "period": "24h", "dns_address": "1.1.1.1", "providers": ["mullvad"] }
 * }
 * @endcode
 * Отсутствующий ключ и null оставляют поле незаданным.
 */
class JsonSource : public Source
{
public:
    explicit JsonSource(std::string path);

    std::string Name() const override;
    Settings Read() override;

    /**
     * @brief Разобрать текст JSON (BOM уже снят).
     * @throw SourceError
     */
    Settings Parse(const std::string &text) const;

private:
    static void ParseVpn(const boost::json::object &o, Vpn &vpn);
    static void ParseWireguard(const boost::json::object &o, Wireguard &w);
    static void ParseOpenVpn(const boost::json::object &o, OpenVpn &ovpn);
    static void ParseControlServer(const boost::json::object &o, ControlServer &c);
    static void ParseUpdater(const boost::json::object &o, Updater &u);

    std::string path_;
};

}
