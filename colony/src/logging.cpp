/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <colony/logging.h>

namespace colony
{
    namespace
    {
        std::mutex logger_mutex;
        std::shared_ptr<spdlog::logger> logger_instance;

        spdlog::level::level_enum to_spdlog(level_enum level)
        {
            switch (level)
            {
            case debug:
                return spdlog::level::debug;
            case trace:
                return spdlog::level::trace;
            case info:
                return spdlog::level::info;
            case warn:
                return spdlog::level::warn;
            case err:
                return spdlog::level::err;
            case critical:
                return spdlog::level::critical;
            default:
                return spdlog::level::off;
            }
        }
    }

    std::shared_ptr<spdlog::logger> get_logger()
    {
        std::scoped_lock lock(logger_mutex);
        if (!logger_instance)
        {
            // another component may already have registered a "colony" logger
            logger_instance = spdlog::get("colony");
            if (!logger_instance)
            {
                logger_instance = spdlog::stdout_color_mt("colony");
                logger_instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
                logger_instance->set_level(spdlog::level::info);
            }
        }
        return logger_instance;
    }

    void set_logger(std::shared_ptr<spdlog::logger> logger)
    {
        std::scoped_lock lock(logger_mutex);
        logger_instance = std::move(logger);
    }

    void set_log_level(level_enum level)
    {
        get_logger()->set_level(to_spdlog(level));
    }

    bool should_log(level_enum level)
    {
        return get_logger()->should_log(to_spdlog(level));
    }

    void log(level_enum level, std::string_view message)
    {
        get_logger()->log(to_spdlog(level), "{}", message);
    }
}
