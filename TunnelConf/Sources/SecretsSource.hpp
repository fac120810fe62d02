#pragma once
// SecretsSource.hpp — секреты из файлов (Docker secrets).

#include <optional>
#include <string>

#include "TunnelConf/Sources/Source.hpp"

namespace TunnelConf
{

/**
 * @brief Читает секреты из каталога, по файлу на значение:
 *        openvpn_user, openvpn_password, openvpn_key_passphrase,
 *        wireguard_private_key, wireguard_preshared_key, wireguard_public_key.
 *
 * Отсутствующий файл оставляет поле незаданным. Завершающие пробелы
 * и переводы строк отбрасываются.
 */
class SecretsSource : public Source
{
public:
    explicit SecretsSource(std::string directory);

    std::string Name() const override;
    Settings Read() override;

private:
    std::optional<std::string> ReadSecret(const char *filename) const;

    std::string directory_;
};

}
