#include "TunnelConf/OpenVpnConfig.hpp"
#include "TunnelConf/Config.hpp"
#include "TunnelConf/Logger.hpp"
#include "TunnelConf/Network.hpp"

#include <fstream>
#include <optional>
#include <stdexcept>

namespace TunnelConf::OpenVpnConfig
{

namespace
{

std::string NormalizeProtocol(const std::string &proto)
{
    if (proto == "udp" || proto == "udp4" || proto == "udp6")
        return "udp";
    if (proto == "tcp" || proto == "tcp4" || proto == "tcp6" ||
        proto == "tcp-client" || proto == "tcp4-client" || proto == "tcp6-client")
        return "tcp";
    throw std::runtime_error("network protocol not supported: " + proto);
}

}

Connection Extract(const std::vector<std::string> &lines)
{
    std::optional<Connection> remote;
    std::optional<std::string> proto;
    bool in_block = false;

    for (const std::string &raw : lines)
    {
        const std::string line = Config::Trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == ';')
            continue;

        if (line.front() == '<')
        {
            in_block = line.size() < 2 || line[1] != '/';
            continue;
        }
        if (in_block)
            continue;

        const std::vector<std::string> fields = Config::Split(line, ' ');
        if (fields.empty())
            continue;

        if (fields[0] == "proto" && fields.size() >= 2 && !proto)
        {
            proto = NormalizeProtocol(fields[1]);
        }
        else if (fields[0] == "remote" && !remote)
        {
            if (fields.size() < 2)
                throw std::runtime_error("remote line has no host: " + line);

            Connection c;
            c.host = fields[1];
            if (fields.size() >= 3)
            {
                try
                {
                    c.port = ParsePort(fields[2]);
                }
                catch (const std::invalid_argument &)
                {
                    throw std::runtime_error("remote port is not valid: " + fields[2]);
                }
            }
            if (fields.size() >= 4)
            {
                c.protocol = NormalizeProtocol(fields[3]);
                proto = c.protocol;
            }
            remote = c;
        }
    }

    if (!remote)
        throw std::runtime_error("remote line not found");

    if (proto)
        remote->protocol = *proto;
    return *remote;
}

Connection ExtractFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("cannot open file: " + path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        lines.push_back(line);
    }
    if (in.bad())
        throw std::runtime_error("I/O error while reading file: " + path);

    Connection c = Extract(lines);
    LOGD("settings") << "custom OpenVPN configuration: remote " << c.host
                     << ":" << c.port << " " << c.protocol;
    return c;
}

}
