/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "env.hpp"
#include "platform.hpp"
#include "string.hpp"

#include <array>
#include <atomic>
#include <optional>
#include <utility>

#ifndef RIFF_ENABLE_SPDLOG
    #define RIFF_ENABLE_SPDLOG 0
#endif

namespace riff {

enum class LogLevel { off, critical, error, warning, info, debug, trace };

/**
 * Parses a log level name, ignoring case. Valid names are TRACE, DEBUG, INFO, WARN, ERROR, CRITICAL and OFF.
 * @param name The name to parse.
 * @return The level, or an empty optional for an unknown name.
 */
inline std::optional<LogLevel> parse_log_level(const std::string_view name) {
    constexpr std::array<std::pair<const char*, LogLevel>, 7> k_names {{
        {"TRACE", LogLevel::trace},
        {"DEBUG", LogLevel::debug},
        {"INFO", LogLevel::info},
        {"WARN", LogLevel::warning},
        {"ERROR", LogLevel::error},
        {"CRITICAL", LogLevel::critical},
        {"OFF", LogLevel::off},
    }};
    for (const auto& [candidate, level] : k_names) {
        if (string_compare_case_insensitive(name, candidate)) {
            return level;
        }
    }
    return std::nullopt;
}

}  // namespace riff

#if RIFF_ENABLE_SPDLOG

    #ifndef SPDLOG_ACTIVE_LEVEL
        #define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
    #endif

    #if RIFF_MACOS
        #define SPDLOG_FUNCTION __PRETTY_FUNCTION__
    #endif

    #include <spdlog/spdlog.h>

    #define RIFF_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
    #define RIFF_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
    #define RIFF_INFO(...) SPDLOG_INFO(__VA_ARGS__)
    #define RIFF_WARNING(...) SPDLOG_WARN(__VA_ARGS__)
    #define RIFF_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
    #define RIFF_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

namespace riff {

inline void apply_log_level(const LogLevel level) {
    switch (level) {
        case LogLevel::off:
            spdlog::set_level(spdlog::level::off);
            return;
        case LogLevel::critical:
            spdlog::set_level(spdlog::level::critical);
            return;
        case LogLevel::error:
            spdlog::set_level(spdlog::level::err);
            return;
        case LogLevel::warning:
            spdlog::set_level(spdlog::level::warn);
            return;
        case LogLevel::info:
            spdlog::set_level(spdlog::level::info);
            return;
        case LogLevel::debug:
            spdlog::set_level(spdlog::level::debug);
            return;
        case LogLevel::trace:
            spdlog::set_level(spdlog::level::trace);
            return;
    }
}

}  // namespace riff

#else

    #include <fmt/format.h>

namespace riff {

// Without spdlog, messages at or above this level go to stdout.
inline std::atomic log_level = LogLevel::info;

inline void apply_log_level(const LogLevel level) {
    log_level = level;
}

}  // namespace riff

    #define RIFF_LOG_AT(level, tag, ...)                                           \
        do {                                                                       \
            if (riff::log_level.load() >= (level)) {                               \
                fmt::print(stdout, "[{}] {}\n", tag, fmt::format(__VA_ARGS__));    \
            }                                                                      \
        } while (false)

    #define RIFF_TRACE(...) RIFF_LOG_AT(riff::LogLevel::trace, "trace", __VA_ARGS__)
    #define RIFF_DEBUG(...) RIFF_LOG_AT(riff::LogLevel::debug, "debug", __VA_ARGS__)
    #define RIFF_INFO(...) RIFF_LOG_AT(riff::LogLevel::info, "info", __VA_ARGS__)
    #define RIFF_WARNING(...) RIFF_LOG_AT(riff::LogLevel::warning, "warning", __VA_ARGS__)
    #define RIFF_ERROR(...) RIFF_LOG_AT(riff::LogLevel::error, "error", __VA_ARGS__)
    #define RIFF_CRITICAL(...) RIFF_LOG_AT(riff::LogLevel::critical, "critical", __VA_ARGS__)

#endif

namespace riff {

/**
 * Sets the log level by name, see parse_log_level() for the valid names. Unknown names fall back to INFO with a
 * warning.
 * @param name The level name.
 */
inline void set_log_level(const char* name) {
    if (const auto level = parse_log_level(name)) {
        apply_log_level(*level);
        return;
    }
    apply_log_level(LogLevel::info);
    RIFF_WARNING("Invalid log level: {}, using INFO", name);
}

/**
 * Sets the log level from an environment variable, or to INFO when the variable isn't set.
 * @param env_var The variable to read.
 */
inline void set_log_level_from_env(const char* env_var = "RIFF_LOG_LEVEL") {
    const auto value = get_env(env_var);
    set_log_level(value ? value->c_str() : "INFO");
}

}  // namespace riff
