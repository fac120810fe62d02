#pragma once
// Helpers.hpp — общие утилиты тестов: временные каталоги и ключи.

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace TestHelpers
{

/// @brief Валидные 32-байтные ключи WireGuard.
inline const std::string kPrivateKey   = "QOlCgyA/Sn/c/+YNTIEohrjm8IZV+OZ2AUFIoX20sk8=";
inline const std::string kPreSharedKey = "YJ680VN+dGrdsWNjSFqZ6vvwuiNhbq502ZL3G7Q3o3g=";
inline const std::string kPublicKey    = "AQIDBAUGBwgJCgsMDQ4PEBESExQVFhcYGRobHB0eHyA=";

/**
 * @brief Временный каталог, удаляется в деструкторе.
 */
class TempDir
{
public:
    TempDir()
    {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("tunnelconf_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &Path() const { return path_; }

    /// @brief Записать файл и вернуть его путь.
    std::string Write(const std::string &name, const std::string &content) const
    {
        const std::filesystem::path p = path_ / name;
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p.string();
    }

private:
    std::filesystem::path path_;
};

}
