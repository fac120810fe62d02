#include "TunnelConf/Settings/Settings.hpp"
#include "TunnelConf/Errors.hpp"

namespace TunnelConf
{

Settings Settings::Copy() const
{
    return *this;
}

void Settings::MergeWith(const Settings &other)
{
    vpn.MergeWith(other.vpn);
    control_server.MergeWith(other.control_server);
    updater.MergeWith(other.updater);
}

void Settings::OverrideWith(const Settings &other)
{
    vpn.OverrideWith(other.vpn);
    control_server.OverrideWith(other.control_server);
    updater.OverrideWith(other.updater);
}

void Settings::SetDefaults()
{
    vpn.SetDefaults();
    control_server.SetDefaults();
    updater.SetDefaults();
}

void Settings::Validate() const
{
    try
    {
        vpn.Validate();
    }
    catch (const ValidationError &e)
    {
        throw Error::Wrap("VPN settings", e);
    }

    try
    {
        control_server.Validate();
    }
    catch (const ValidationError &e)
    {
        throw Error::Wrap("control server settings", e);
    }

    try
    {
        updater.Validate();
    }
    catch (const ValidationError &e)
    {
        throw Error::Wrap("updater settings", e);
    }
}

bool Settings::Empty() const
{
    return *this == Settings{};
}

Tree::Node Settings::ToLinesNode() const
{
    Tree::Node node("Settings summary:");
    node.Append(vpn.ToLinesNode());
    node.Append(control_server.ToLinesNode());
    node.Append(updater.ToLinesNode());
    return node;
}

std::vector<std::string> Settings::ToLines(const ToLinesSettings &style) const
{
    return ToLinesNode().Lines(style);
}

std::string Settings::String() const
{
    return JoinLines(ToLines());
}

}
