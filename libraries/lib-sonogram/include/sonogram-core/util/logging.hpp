#pragma once

#ifndef sonogram_log_hpp
#define sonogram_log_hpp

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

#include "sonogram-core/util/util.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sonogram
{
    typedef std::shared_ptr<spdlog::logger> spdlog_t;

    // One logger per thread of concern: audio is written from the decode callback,
    // render from the frame loop, app from startup and input handling.
    struct log : public sonogram::singleton<log>
    {
        std::vector<spdlog::sink_ptr> sinks;
        spdlog_t audio_log, render_log, app_log;

        log()
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            rebuild_loggers();
        }

        void replace_sink(spdlog::sink_ptr sink)
        {
            sinks.clear();
            sinks.push_back(sink);
            rebuild_loggers();
        }

        void set_level(spdlog::level::level_enum level)
        {
            audio_log->set_level(level);
            render_log->set_level(level);
            app_log->set_level(level);
        }

    private:

        void rebuild_loggers()
        {
            audio_log = std::make_shared<spdlog::logger>("sonogram-audio", std::begin(sinks), std::end(sinks));
            render_log = std::make_shared<spdlog::logger>("sonogram-render", std::begin(sinks), std::end(sinks));
            app_log = std::make_shared<spdlog::logger>("sonogram-app", std::begin(sinks), std::end(sinks));
        }

        friend class sonogram::singleton<log>;
    };

    // Defined in logging.cpp
    template<> log * singleton<log>::single;

    // Parses "trace", "debug", "info", "warn", "error", "critical" or "off"
    spdlog::level::level_enum parse_log_level(const std::string & name);

} // end namespace sonogram

#endif // end sonogram_log_hpp
