// Logger.cpp — консоль + файл, синхронные sinks, детерминированный shutdown.

#include "TunnelConf/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>

namespace
{
    namespace logging  = boost::log;
    namespace sinks    = boost::log::sinks;
    namespace expr     = boost::log::expressions;
    namespace trivial  = boost::log::trivial;
    namespace keywords = boost::log::keywords;

    using file_sink_t = sinks::synchronous_sink<sinks::text_file_backend>;
    using cout_sink_t = sinks::synchronous_sink<sinks::text_ostream_backend>;

    /// @brief Форматтер: "TS [level] message". Тэг добавляется макросом в начало message.
    logging::formatter MakeFormatter()
    {
        return expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp",
                                                                "%Y-%m-%d %H:%M:%S.%f")
            << " [" << trivial::severity << "] "
            << expr::smessage;
    }

    // Живут, пока существует Guard.
    boost::shared_ptr<file_sink_t> g_file_sink;
    boost::shared_ptr<cout_sink_t> g_cout_sink;
}

namespace Logger
{
    Guard::Guard(const Options &opts)
    {
        auto core = logging::core::get();
        core->add_global_attribute("TimeStamp", logging::attributes::local_clock());

        if (opts.enable_file)
        {
            std::error_code ec;
            std::filesystem::create_directories(opts.directory, ec);
            if (ec)
            {
                throw std::runtime_error("creating log directory " + opts.directory + ": " + ec.message());
            }

            auto backend = boost::make_shared<sinks::text_file_backend>(
                keywords::file_name     = opts.directory + "/" + opts.base_filename + "_%N.log",
                keywords::rotation_size = opts.rotation_size_bytes,
                keywords::open_mode     = std::ios_base::app
            );
            backend->auto_flush(true);

            g_file_sink = boost::make_shared<file_sink_t>(backend);
            g_file_sink->set_formatter(MakeFormatter());
            g_file_sink->set_filter(trivial::severity >= opts.file_min_severity);
            core->add_sink(g_file_sink);
        }

        if (opts.enable_console)
        {
            auto backend = boost::make_shared<sinks::text_ostream_backend>();
            auto stream  = boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter());
            backend->add_stream(stream);
            backend->auto_flush(true);

            g_cout_sink = boost::make_shared<cout_sink_t>(backend);
            g_cout_sink->set_formatter(MakeFormatter());
            g_cout_sink->set_filter(trivial::severity >= opts.console_min_severity);
            core->add_sink(g_cout_sink);
        }

        LOGD("logger") << opts.app_name << " logging initialised";
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        core->flush();

        if (g_cout_sink)
        {
            core->remove_sink(g_cout_sink);
            g_cout_sink.reset();
        }
        if (g_file_sink)
        {
            g_file_sink->flush();
            core->remove_sink(g_file_sink);
            g_file_sink.reset();
        }
    }

    severity_t ParseSeverity(const std::string &name)
    {
        std::string s = name;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

        if (s == "trace")   return trivial::trace;
        if (s == "debug")   return trivial::debug;
        if (s == "info")    return trivial::info;
        if (s == "warning" || s == "warn") return trivial::warning;
        if (s == "error")   return trivial::error;
        if (s == "fatal")   return trivial::fatal;

        throw std::invalid_argument("unknown log level '" + name + "'");
    }
}
