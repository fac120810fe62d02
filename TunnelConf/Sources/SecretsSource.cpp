#include "TunnelConf/Sources/SecretsSource.hpp"
#include "TunnelConf/Config.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Logger.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace TunnelConf
{

SecretsSource::SecretsSource(std::string directory)
    : directory_(std::move(directory))
{
}

std::string SecretsSource::Name() const
{
    return "secret files";
}

std::optional<std::string> SecretsSource::ReadSecret(const char *filename) const
{
    const std::string path = (std::filesystem::path(directory_) / filename).string();

    std::optional<std::string> content;
    try
    {
        content = Config::ReadTextFile(path);
    }
    catch (const std::runtime_error &e)
    {
        throw SourceError(Name(), std::string("reading secret ") + filename + ": " + e.what());
    }

    if (!content)
        return std::nullopt;

    const std::size_t end = content->find_last_not_of(" \t\r\n");
    content->erase(end == std::string::npos ? 0 : end + 1);

    LOGD("source.secrets") << "Read secret " << filename;
    return content;
}

Settings SecretsSource::Read()
{
    Settings s;
    s.vpn.openvpn.user             = ReadSecret("openvpn_user");
    s.vpn.openvpn.password         = ReadSecret("openvpn_password");
    s.vpn.openvpn.key_passphrase   = ReadSecret("openvpn_key_passphrase");
    s.vpn.wireguard.private_key    = ReadSecret("wireguard_private_key");
    s.vpn.wireguard.pre_shared_key = ReadSecret("wireguard_preshared_key");
    s.vpn.wireguard.public_key     = ReadSecret("wireguard_public_key");
    return s;
}

}
