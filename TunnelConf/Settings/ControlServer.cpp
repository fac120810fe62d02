#include "TunnelConf/Settings/ControlServer.hpp"
#include "TunnelConf/Settings/Fields.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Network.hpp"

#include <stdexcept>

namespace TunnelConf
{

namespace
{

// Проверяет "[host]:port". Хост может быть пустым (все интерфейсы),
// IPv6 записывается в квадратных скобках.
void CheckListenAddress(const std::string &address)
{
    const std::size_t colon = address.rfind(':');
    if (colon == std::string::npos)
    {
        throw Error::ControlServerAddressInvalid(address, "missing port in address");
    }

    const std::string host = address.substr(0, colon);
    if (host.find(':') != std::string::npos &&
        (host.front() != '[' || host.back() != ']'))
    {
        throw Error::ControlServerAddressInvalid(address, "too many colons in address");
    }

    try
    {
        (void)ParsePort(address.substr(colon + 1));
    }
    catch (const std::invalid_argument &e)
    {
        throw Error::ControlServerAddressInvalid(address, e.what());
    }
}

}

ControlServer ControlServer::Copy() const
{
    return *this;
}

void ControlServer::MergeWith(const ControlServer &other)
{
    Fields::MergeWith(address, other.address);
    Fields::MergeWith(log,     other.log);
}

void ControlServer::OverrideWith(const ControlServer &other)
{
    Fields::OverrideWith(address, other.address);
    Fields::OverrideWith(log,     other.log);
}

void ControlServer::SetDefaults()
{
    Fields::Default(address, ":8000");
    Fields::Default(log, true);
}

void ControlServer::Validate() const
{
    CheckListenAddress(Fields::ValueOr(address));
}

Tree::Node ControlServer::ToLinesNode() const
{
    Tree::Node node("Control server settings:");
    node.Append("Listening address: " + Fields::ValueOr(address, std::string("not set")));
    if (log)
    {
        node.Append(std::string("Logging: ") + (*log ? "yes" : "no"));
    }
    else
    {
        node.Append("Logging: not set");
    }
    return node;
}

std::vector<std::string> ControlServer::ToLines(const ToLinesSettings &style) const
{
    return ToLinesNode().Lines(style);
}

std::string ControlServer::String() const
{
    return JoinLines(ToLines());
}

}
