// TunnelConf.cpp — сборка настроек туннеля из секретов, окружения и файлов.

#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Logger.hpp"
#include "TunnelConf/Resolver.hpp"
#include "TunnelConf/Sources/EnvSource.hpp"
#include "TunnelConf/Sources/JsonSource.hpp"
#include "TunnelConf/Sources/SecretsSource.hpp"
#include "TunnelConf/Sources/WireguardConfSource.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace
{

std::string GetEnv(const char *key, const char *fallback)
{
    const char *v = std::getenv(key);
    return (v && *v) ? std::string(v) : std::string(fallback);
}

}

int main(int argc, char** argv)
{
    if (argc > 2)
    {
        std::cerr << "Usage: " << (argc > 0 ? argv[0] : "tunnelconf") << " [settings.json]\n";
        return 1;
    }

    Logger::Options logging;
    try
    {
        logging.console_min_severity = Logger::ParseSeverity(GetEnv("LOG_LEVEL", "info"));
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: LOG_LEVEL: " << e.what() << "\n";
        return 1;
    }

    const std::string log_directory = GetEnv("LOG_DIRECTORY", "");
    if (!log_directory.empty())
    {
        logging.enable_file = true;
        logging.directory = log_directory;
    }

    std::optional<Logger::Guard> guard;
    try
    {
        guard.emplace(logging);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "Error: LOG_DIRECTORY: " << e.what() << "\n";
        return 1;
    }

    const std::string wireguard_conf = GetEnv("WIREGUARD_CONF_PATH", "/gluetun/wireguard/wg0.conf");
    const std::string secrets_dir    = GetEnv("SECRETS_DIR", "/run/secrets");

    // Первым идёт самый приоритетный источник.
    std::vector<std::unique_ptr<TunnelConf::Source>> sources;
    sources.push_back(std::make_unique<TunnelConf::SecretsSource>(secrets_dir));
    sources.push_back(std::make_unique<TunnelConf::EnvSource>(TunnelConf::EnvSource::FromProcess()));
    if (argc == 2)
    {
        sources.push_back(std::make_unique<TunnelConf::JsonSource>(argv[1]));
    }
    sources.push_back(std::make_unique<TunnelConf::WireguardConfSource>(wireguard_conf));

    try
    {
        TunnelConf::Resolver resolver(std::move(sources));
        const TunnelConf::Settings settings = resolver.Resolve();
        std::cout << settings.String() << "\n";
    }
    catch (const TunnelConf::SourceError &e)
    {
        LOGE("main") << "Reading " << e.Source() << ": " << e.what();
        return 1;
    }
    catch (const TunnelConf::ValidationError &e)
    {
        LOGE("main") << "Settings are not valid [" << e.ErrorCode() << "]: " << e.what();
        return 1;
    }
    catch (const std::exception &e)
    {
        LOGE("main") << e.what();
        return 1;
    }

    return 0;
}
