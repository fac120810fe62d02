#include "TunnelConf/Providers.hpp"

#include <array>
#include <regex>

namespace TunnelConf::Providers
{

namespace
{

Rules Make(std::string_view name)
{
    Rules r;
    r.name = name;
    return r;
}

const std::array<Rules, 25> &Table()
{
    static const std::array<Rules, 25> table = []
    {
        std::array<Rules, 25> t{
            Make(kAirvpn),      Make(kCustom),         Make(kCyberghost),
            Make(kExpressvpn),  Make(kFastestvpn),     Make(kGiganews),
            Make(kHideMyAss),   Make(kIpvanish),       Make(kIvpn),
            Make(kMullvad),     Make(kNordvpn),        Make(kPerfectPrivacy),
            Make(kPrivado),     Make(kPrivateInternetAccess), Make(kPrivatevpn),
            Make(kProtonvpn),   Make(kPurevpn),        Make(kSlickvpn),
            Make(kSurfshark),   Make(kTorguard),       Make(kVpnSecure),
            Make(kVpnUnlimited), Make(kVyprvpn),       Make(kWevpn),
            Make(kWindscribe),
        };

        auto at = [&t](std::string_view name) -> Rules &
        {
            for (Rules &r : t)
            {
                if (r.name == name) return r;
            }
            return t.front(); // недостижимо: имена выше совпадают с константами
        };

        for (auto name : {kCustom, kAirvpn, kVpnSecure})
            at(name).user_required = false;

        for (auto name : {kAirvpn, kCyberghost, kVpnSecure, kVpnUnlimited})
            at(name).cert_required = true;

        for (auto name : {kAirvpn, kCyberghost, kVpnUnlimited, kWevpn})
            at(name).key_required = true;

        at(kVpnSecure).encrypted_key_required = true;
        at(kCustom).custom_config_required = true;

        for (auto name : {kAirvpn, kCustom, kFastestvpn, kIvpn, kMullvad,
                          kNordvpn, kProtonvpn, kSurfshark, kWindscribe})
            at(name).wireguard_supported = true;

        at(kIvpn).password_waiver = &IsIvpnAccountId;
        at(kMullvad).default_password = "m";
        at(kPrivateInternetAccess).default_encryption_preset = "strong";
        return t;
    }();
    return table;
}

}

const Rules *Find(std::string_view provider) noexcept
{
    for (const Rules &r : Table())
    {
        if (r.name == provider) return &r;
    }
    return nullptr;
}

const Rules &Lookup(std::string_view provider) noexcept
{
    static const Rules generic{};
    const Rules *r = Find(provider);
    return r ? *r : generic;
}

bool PasswordRequired(const Rules &rules, const std::string &user)
{
    if (!rules.user_required)
        return false;
    if (rules.password_waiver && rules.password_waiver(user))
        return false;
    return true;
}

std::vector<std::string> Names()
{
    std::vector<std::string> out;
    for (const Rules &r : Table())
    {
        out.emplace_back(r.name);
    }
    return out;
}

bool IsIvpnAccountId(const std::string &user)
{
    static const std::regex account_id(R"(^(i|ivpn)\-[a-zA-Z0-9]{4}\-[a-zA-Z0-9]{4}\-[a-zA-Z0-9]{4}$)");
    return std::regex_match(user, account_id);
}

}
