// Base64.cpp — декодер в духе wireguard-tools key_from_base64, но для произвольной длины.

#include "TunnelConf/Base64.hpp"

#include <stdexcept>
#include <utility>

namespace TunnelConf::Base64
{

namespace
{

int DecodeChar(char c) noexcept
{
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

[[noreturn]] void Illegal(std::size_t index)
{
    throw std::invalid_argument("illegal base64 data at input byte " + std::to_string(index));
}

}

std::vector<std::uint8_t> Decode(const std::string &s)
{
    // Символы без переводов строк вместе с исходными позициями для сообщений об ошибке.
    std::vector<std::pair<char, std::size_t>> in;
    in.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] != '\r' && s[i] != '\n')
        {
            in.emplace_back(s[i], i);
        }
    }

    std::vector<std::uint8_t> out;
    out.reserve(in.size() / 4 * 3);

    bool finished = false;
    for (std::size_t g = 0; g < in.size(); g += 4)
    {
        if (finished)
        {
            Illegal(in[g].second);
        }

        std::uint32_t acc = 0;
        std::size_t   data_chars = 0;
        for (std::size_t j = 0; j < 4; ++j)
        {
            if (g + j >= in.size())
            {
                Illegal(in[g].second);
            }
            const auto [c, index] = in[g + j];

            if (c == '=')
            {
                if (j < 2)
                {
                    Illegal(index);
                }
                if (j == 2)
                {
                    if (g + 3 >= in.size() || in[g + 3].first != '=')
                    {
                        Illegal(g + 3 < in.size() ? in[g + 3].second : index);
                    }
                }
                finished = true;
                break;
            }

            const int v = DecodeChar(c);
            if (v < 0)
            {
                Illegal(index);
            }
            acc |= static_cast<std::uint32_t>(v) << (18 - 6 * j);
            ++data_chars;
        }

        out.push_back(static_cast<std::uint8_t>((acc >> 16) & 0xff));
        if (data_chars >= 3) out.push_back(static_cast<std::uint8_t>((acc >> 8) & 0xff));
        if (data_chars == 4) out.push_back(static_cast<std::uint8_t>(acc & 0xff));
    }

    return out;
}

void ParseWireguardKey(const std::string &s)
{
    const std::vector<std::uint8_t> raw = Decode(s);
    if (raw.size() != kWireguardKeyLength)
    {
        throw std::invalid_argument("key is " + std::to_string(raw.size()) +
                                    " bytes instead of " + std::to_string(kWireguardKeyLength));
    }
}

bool IsWireguardKey(const std::string &s) noexcept
{
    try
    {
        ParseWireguardKey(s);
        return true;
    }
    catch (const std::invalid_argument &)
    {
        return false;
    }
}

}
