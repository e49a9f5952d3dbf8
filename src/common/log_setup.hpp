//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_LOG_SETUP_HPP_INCLUDED
#define WOLBOT_COMMON_LOG_SETUP_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

namespace wolbot
{
namespace common
{
namespace detail
{

/// Splits "info,ipc=trace,engine=debug" into logger name to level name pairs
/// (empty name stands for the default logger).
///
inline std::unordered_map<std::string, std::string> extractNameLevels(const std::string& levels)
{
    std::unordered_map<std::string, std::string> name_levels;

    std::istringstream iss{levels};
    std::string        token;
    while (std::getline(iss, token, ','))
    {
        token.erase(std::remove_if(token.begin(), token.end(), [](const char ch) { return std::isspace(ch) != 0; }),
                    token.end());
        if (token.empty())
        {
            continue;
        }

        const auto eq_pos = token.find('=');
        std::string name  = (eq_pos == std::string::npos) ? "" : token.substr(0, eq_pos);
        std::string level = (eq_pos == std::string::npos) ? token : token.substr(eq_pos + 1);
        std::transform(level.begin(), level.end(), level.begin(), [](const char ch) {
            //
            return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        });
        name_levels[name] = level;
    }
    return name_levels;
}

}  // namespace detail

/// Applies flush levels (`spdlog` levels syntax, f.e. "warn,ipc=debug") to the registered loggers.
///
inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    const auto name_levels = detail::extractNameLevels(flush_levels);
    for (const auto& name_level : name_levels)
    {
        const auto& logger_name = name_level.first;
        const auto& level_name  = name_level.second;
        const auto  level       = spdlog::level::from_str(level_name);
        // Ignore unrecognized level names.
        if ((level == spdlog::level::off) && (level_name != "off"))
        {
            continue;
        }

        if (const auto logger = spdlog::get(logger_name))
        {
            logger->flush_on(level);
        }
    }

    // Apply default flush level to all other loggers (if not specified explicitly).
    //
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&name_levels, default_flush_level](const std::shared_ptr<spdlog::logger>& logger) {
        //
        if (!logger->name().empty() && (name_levels.find(logger->name()) == name_levels.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Searches for `SPDLOG_FLUSH_LEVEL=` in the args and uses it to init the flush levels.
///
inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    static const std::string flush_level_arg = "SPDLOG_FLUSH_LEVEL=";

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, flush_level_arg.size(), flush_level_arg) == 0)
        {
            loadFlushLevels(arg.substr(flush_level_arg.size()));
        }
    }
}

using LogFileSink = spdlog::sinks::rotating_file_sink_st;

/// Rotating log file shared by the programs: at most 4 files of 16 MB each.
///
inline std::shared_ptr<LogFileSink> makeLogFileSink(const std::string& path)
{
    constexpr std::size_t max_files     = 4;
    constexpr std::size_t max_file_size = 16UL * 1048576UL;

    auto sink = std::make_shared<LogFileSink>(path, max_file_size, max_files);
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");
    return sink;
}

/// Replaces all registered loggers: the default one writes to `default_sinks`,
/// while every named subsystem logger writes to `subsystem_sink` only.
///
inline void installLoggers(const std::initializer_list<spdlog::sink_ptr> default_sinks,
                           const spdlog::sink_ptr&                       subsystem_sink,
                           const std::initializer_list<const char*>      subsystems)
{
    spdlog::drop_all();

    auto default_logger = std::make_shared<spdlog::logger>("", default_sinks);
    spdlog::register_logger(default_logger);
    spdlog::set_default_logger(std::move(default_logger));

    for (const auto* const name : subsystems)
    {
        spdlog::register_logger(std::make_shared<spdlog::logger>(name, subsystem_sink));
    }
}

/// Applies log and flush levels: first the configured ones (if any), then the command line
/// `SPDLOG_LEVEL=...` and `SPDLOG_FLUSH_LEVEL=...` overrides.
///
inline void applyLogLevels(const cetl::optional<std::string>& levels,
                           const cetl::optional<std::string>& flush_levels,
                           const int                          argc,
                           const char** const                 argv)
{
    if (levels)
    {
        spdlog::cfg::helpers::load_levels(*levels);
    }
    if (flush_levels)
    {
        loadFlushLevels(*flush_levels);
    }
    spdlog::cfg::load_argv_levels(argc, argv);
    loadArgvFlushLevels(argc, argv);
}

}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_LOG_SETUP_HPP_INCLUDED
