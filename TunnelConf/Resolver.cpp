#include "TunnelConf/Resolver.hpp"
#include "TunnelConf/Errors.hpp"
#include "TunnelConf/Logger.hpp"

#include <utility>

namespace TunnelConf
{

Resolver::Resolver(std::vector<std::unique_ptr<Source>> sources)
    : sources_(std::move(sources))
{
}

Settings Resolver::Resolve()
{
    fragments_.clear();
    fragments_.reserve(sources_.size());

    for (const std::unique_ptr<Source> &source : sources_)
    {
        Settings fragment;
        try
        {
            fragment = source->Read();
        }
        catch (const SourceError &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            throw SourceError(source->Name(), e.what());
        }

        LOGD("resolver") << "Source " << source->Name()
                         << (fragment.Empty() ? " has no settings" : " read");
        fragments_.push_back(fragment.Copy());
    }

    return Resolve(fragments_);
}

Settings Resolver::Resolve(const std::vector<Settings> &fragments,
                           const std::vector<Settings> &overrides)
{
    Settings settings = Combine(fragments, overrides);

    try
    {
        settings.Validate();
    }
    catch (const ValidationError &e)
    {
        LOGE("resolver") << "Invalid settings: " << e.what();
        throw;
    }

    for (const std::string &line : settings.ToLines())
    {
        LOGI("resolver") << line;
    }
    return settings;
}

}
