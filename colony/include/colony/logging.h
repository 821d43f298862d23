/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <string_view>

#include <fmt/format.h>

namespace spdlog
{
    class logger;
}

namespace colony
{
    enum level_enum
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    // Routes a formatted message to the colony spdlog logger
    void log(level_enum level, std::string_view message);

    bool should_log(level_enum level);

    void set_log_level(level_enum level);

    // Replaces the default colour stdout logger, e.g. with one carrying a file sink
    void set_logger(std::shared_ptr<spdlog::logger> logger);

    std::shared_ptr<spdlog::logger> get_logger();
}

#define COLONY_LOG(level, ...)                                                                                         \
    do                                                                                                                 \
    {                                                                                                                  \
        if (::colony::should_log(level))                                                                               \
            ::colony::log(level, fmt::format(__VA_ARGS__));                                                            \
    } while (0)

#define COLONY_DEBUG(...) COLONY_LOG(::colony::debug, __VA_ARGS__)
#define COLONY_TRACE(...) COLONY_LOG(::colony::trace, __VA_ARGS__)
#define COLONY_INFO(...) COLONY_LOG(::colony::info, __VA_ARGS__)
#define COLONY_WARNING(...) COLONY_LOG(::colony::warn, __VA_ARGS__)
#define COLONY_ERROR(...) COLONY_LOG(::colony::err, __VA_ARGS__)
