#include "TunnelConf/Settings/Updater.hpp"
#include "TunnelConf/Settings/Fields.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Network.hpp"
#include "TunnelConf/Providers.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <utility>

namespace TunnelConf
{

namespace
{

struct ProviderFlag
{
    std::string_view provider;
    std::optional<bool> Updater::*flag;
};

constexpr std::array<ProviderFlag, 10> kProviderFlags = {{
    {Providers::kCyberghost,            &Updater::cyberghost},
    {Providers::kMullvad,               &Updater::mullvad},
    {Providers::kNordvpn,               &Updater::nordvpn},
    {Providers::kPrivateInternetAccess, &Updater::private_internet_access},
    {Providers::kPrivado,               &Updater::privado},
    {Providers::kPurevpn,               &Updater::purevpn},
    {Providers::kSurfshark,             &Updater::surfshark},
    {Providers::kTorguard,              &Updater::torguard},
    {Providers::kVyprvpn,               &Updater::vyprvpn},
    {Providers::kWindscribe,            &Updater::windscribe},
}};

}

std::string FormatDuration(std::chrono::seconds d)
{
    const long long count = d.count();
    if (count == 0)
    {
        return "0s";
    }

    std::string out;
    unsigned long long total = static_cast<unsigned long long>(count);
    if (count < 0)
    {
        out = "-";
        total = 0ull - total;
    }

    const unsigned long long hours   = total / 3600;
    const unsigned long long minutes = (total % 3600) / 60;
    const unsigned long long seconds = total % 60;

    if (hours > 0)
    {
        out += std::to_string(hours) + "h" + std::to_string(minutes) + "m";
    }
    else if (minutes > 0)
    {
        out += std::to_string(minutes) + "m";
    }
    out += std::to_string(seconds) + "s";
    return out;
}

std::chrono::seconds ParseDuration(const std::string &s)
{
    const auto fail = [&s]() { return std::invalid_argument("invalid duration: " + s); };

    if (s.empty())
    {
        throw fail();
    }

    // Голое число: секунды.
    if (std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; }))
    {
        try
        {
            return std::chrono::seconds(std::stoll(s));
        }
        catch (const std::out_of_range &)
        {
            throw fail();
        }
    }

    long long total = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        const std::size_t start = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
        {
            ++i;
        }
        if (i == start || i == s.size())
        {
            throw fail();
        }

        long long value = 0;
        try
        {
            value = std::stoll(s.substr(start, i - start));
        }
        catch (const std::out_of_range &)
        {
            throw fail();
        }

        long long unit = 0;
        switch (s[i])
        {
            case 'h': unit = 3600; break;
            case 'm': unit = 60;   break;
            case 's': unit = 1;    break;
            default:  throw fail();
        }
        if (value > (std::numeric_limits<long long>::max() - total) / unit)
        {
            throw fail();
        }
        total += value * unit;
        ++i;
    }
    return std::chrono::seconds(total);
}

Updater Updater::Copy() const
{
    return *this;
}

void Updater::MergeWith(const Updater &other)
{
    Fields::MergeWith(period,      other.period);
    Fields::MergeWith(dns_address, other.dns_address);
    for (const ProviderFlag &f : kProviderFlags)
    {
        Fields::MergeWith(this->*f.flag, other.*f.flag);
    }
}

void Updater::OverrideWith(const Updater &other)
{
    Fields::OverrideWith(period,      other.period);
    Fields::OverrideWith(dns_address, other.dns_address);
    for (const ProviderFlag &f : kProviderFlags)
    {
        Fields::OverrideWith(this->*f.flag, other.*f.flag);
    }
}

void Updater::SetDefaults()
{
    Fields::Default(period, std::chrono::seconds(0));
    Fields::Default(dns_address, "1.1.1.1");
    for (const ProviderFlag &f : kProviderFlags)
    {
        Fields::Default(this->*f.flag, true);
    }
}

void Updater::Validate() const
{
    const std::chrono::seconds p = Fields::ValueOr(period);
    if (p != std::chrono::seconds(0) && p < kMinUpdaterPeriod)
    {
        throw Error::UpdaterPeriodTooSmall(FormatDuration(p), FormatDuration(kMinUpdaterPeriod));
    }

    const std::string dns = Fields::ValueOr(dns_address);
    try
    {
        (void)ParseAddress(dns);
    }
    catch (const std::invalid_argument &)
    {
        throw Error::UpdaterDnsAddressInvalid(dns);
    }
}

std::vector<std::string> Updater::EnabledProviders() const
{
    std::vector<std::string> out;
    for (const ProviderFlag &f : kProviderFlags)
    {
        if (Fields::ValueOr(this->*f.flag))
        {
            out.emplace_back(f.provider);
        }
    }
    return out;
}

std::vector<std::string> Updater::EnableOnly(const std::vector<std::string> &providers)
{
    std::vector<std::string> unknown;
    for (const std::string &name : providers)
    {
        const bool known = std::any_of(kProviderFlags.begin(), kProviderFlags.end(),
                                       [&name](const ProviderFlag &f){ return f.provider == name; });
        if (!known)
        {
            unknown.push_back(name);
        }
    }

    for (const ProviderFlag &f : kProviderFlags)
    {
        const bool listed = std::find(providers.begin(), providers.end(), f.provider) != providers.end();
        this->*f.flag = listed;
    }
    return unknown;
}

Tree::Node Updater::ToLinesNode() const
{
    Tree::Node node("Server data updater settings:");

    if (!period)
    {
        node.Append("Update period: not set");
    }
    else if (*period == std::chrono::seconds(0))
    {
        node.Append("Update period: disabled");
    }
    else
    {
        node.Append("Update period: every " + FormatDuration(*period));
    }

    node.Append("DNS address: " + Fields::ValueOr(dns_address, std::string("not set")));

    const std::vector<std::string> enabled = EnabledProviders();
    if (enabled.empty())
    {
        node.Append("Providers to update: none");
    }
    else
    {
        Tree::Node list("Providers to update:");
        for (const std::string &name : enabled)
        {
            list.Append(name);
        }
        node.Append(std::move(list));
    }

    return node;
}

std::vector<std::string> Updater::ToLines(const ToLinesSettings &style) const
{
    return ToLinesNode().Lines(style);
}

std::string Updater::String() const
{
    return JoinLines(ToLines());
}

}
