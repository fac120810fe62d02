#include "TunnelConf/Config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <boost/json.hpp>

namespace Config
{

namespace
{

const boost::json::value *Find(const boost::json::object &o, const char *key)
{
    const boost::json::value *v = o.if_contains(key);
    if (!v || v->is_null())
        return nullptr;
    return v;
}

}

std::optional<std::string> OptionalString(const boost::json::object &o, const char *key)
{
    const boost::json::value *v = Find(o, key);
    if (!v)
        return std::nullopt;
    if (v->is_string())
        return boost::json::value_to<std::string>(*v);
    throw std::runtime_error(std::string("invalid string field '") + key + "'");
}

std::optional<std::int64_t> OptionalInt(const boost::json::object &o, const char *key)
{
    const boost::json::value *v = Find(o, key);
    if (!v)
        return std::nullopt;
    if (v->is_int64())  return v->as_int64();
    if (v->is_uint64() &&
        v->as_uint64() <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    {
        return static_cast<std::int64_t>(v->as_uint64());
    }
    if (v->is_string())
    {
        const auto s = boost::json::value_to<std::string>(*v);
        std::size_t pos = 0;
        try
        {
            const long long n = std::stoll(s, &pos);
            if (pos == s.size())
                return n;
        }
        catch (const std::exception &)
        {
        }
    }
    throw std::runtime_error(std::string("invalid integer field '") + key + "'");
}

std::optional<bool> OptionalBool(const boost::json::object &o, const char *key)
{
    const boost::json::value *v = Find(o, key);
    if (!v)
        return std::nullopt;
    if (v->is_bool())
        return v->as_bool();
    if (v->is_string())
    {
        if (auto b = ParseBinary(boost::json::value_to<std::string>(*v)))
            return b;
    }
    throw std::runtime_error(std::string("invalid boolean field '") + key + "'");
}

std::optional<std::vector<std::string>> OptionalStringList(const boost::json::object &o, const char *key)
{
    const boost::json::value *v = Find(o, key);
    if (!v)
        return std::nullopt;

    if (v->is_array())
    {
        std::vector<std::string> out;
        for (const boost::json::value &x : v->as_array())
        {
            if (!x.is_string())
                throw std::runtime_error(std::string("field '") + key + "' must contain strings");
            std::string s = Trim(boost::json::value_to<std::string>(x));
            if (!s.empty()) out.emplace_back(std::move(s));
        }
        return out;
    }
    if (v->is_string())
        return Split(boost::json::value_to<std::string>(*v), ',');

    throw std::runtime_error(std::string("field '") + key +
                             "' must be either array of strings or comma-separated string");
}

const boost::json::object *OptionalObject(const boost::json::object &o, const char *key)
{
    const boost::json::value *v = Find(o, key);
    if (!v)
        return nullptr;
    if (!v->is_object())
        throw std::runtime_error(std::string("field '") + key + "' must be an object");
    return &v->as_object();
}

std::optional<bool> ParseBinary(const std::string &value)
{
    std::string s = Trim(value);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true"  || s == "yes" || s == "on")  return true;
    if (s == "0" || s == "false" || s == "no"  || s == "off") return false;
    return std::nullopt;
}

std::string Trim(const std::string &s)
{
    const std::size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const std::size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> Split(const std::string &s, char separator)
{
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size())
    {
        const std::size_t pos = s.find(separator, start);
        std::string tok = Trim(pos == std::string::npos ? s.substr(start)
                                                        : s.substr(start, pos - start));
        if (!tok.empty()) out.emplace_back(std::move(tok));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return out;
}

std::optional<std::string> ReadTextFile(const std::string &path)
{
    std::error_code ec;
    const std::filesystem::file_status st = std::filesystem::status(path, ec);
    if (st.type() == std::filesystem::file_type::not_found)
        return std::nullopt;
    if (ec)
        throw std::runtime_error("reading file: " + path + ": " + ec.message());
    if (st.type() == std::filesystem::file_type::directory)
        throw std::runtime_error("reading file: " + path + ": is a directory");

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw std::runtime_error("reading file: cannot open file: " + path);

    std::string content;

    // Резервируем размер, если он известен и вмещается в size_t.
    const auto fsz = std::filesystem::file_size(path, ec);
    if (!ec && fsz <= static_cast<std::uintmax_t>(std::numeric_limits<std::size_t>::max()))
        content.reserve(static_cast<std::size_t>(fsz));

    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad())
        throw std::runtime_error("reading file: I/O error while reading file: " + path);

    if (content.size() >= 3 &&
        static_cast<unsigned char>(content[0]) == 0xEF &&
        static_cast<unsigned char>(content[1]) == 0xBB &&
        static_cast<unsigned char>(content[2]) == 0xBF)
    {
        content.erase(0, 3);
    }
    return content;
}

}
