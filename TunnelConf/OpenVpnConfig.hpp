#pragma once
// OpenVpnConfig.hpp — извлечение параметров соединения из пользовательского .ovpn файла.

#include <cstdint>
#include <string>
#include <vector>

namespace TunnelConf::OpenVpnConfig
{

/**
 * @brief Параметры соединения из директив remote/proto.
 */
struct Connection
{
    std::string   host;
    std::uint16_t port     = 1194;
    std::string   protocol = "udp"; ///< "udp" или "tcp".

    bool operator==(const Connection &) const = default;
};

/**
 * @brief Разобрать строки конфигурации OpenVPN.
 *
 * Берётся первая директива remote; протокол берётся из неё или из proto.
 * Строки внутри встроенных блоков (<ca>...</ca>) и комментарии пропускаются.
 * @throw std::runtime_error Нет remote, неверный порт или протокол.
 */
Connection Extract(const std::vector<std::string> &lines);

/**
 * @brief Прочитать файл и разобрать его.
 * @throw std::runtime_error Ошибка чтения или разбора.
 */
Connection ExtractFile(const std::string &path);

}
