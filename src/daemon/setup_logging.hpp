//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define WOLBOT_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "engine/config.hpp"
#include "log_setup.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <sys/syslog.h>
#include <unistd.h>

inline bool writeString(const int fd, const char* const str)
{
    const auto str_len = std::strlen(str);
    return static_cast<ssize_t>(str_len) == ::write(fd, str, str_len);
}

/// Sets up the daemon logging.
///
/// Everything goes to the log file (`logging.file`, or `wolbotd.log` under `/var/log/` or the current directory),
/// and the default logger additionally goes to syslog. A failure is reported to `report_fd` and ends the process.
///
inline void setupLogging(const int                                  report_fd,
                         const bool                                 is_daemonized,
                         const int                                  argc,
                         const char** const                         argv,
                         const wolbot::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::syslog_sink_st;

    try
    {
        std::string log_file_path = std::string{is_daemonized ? "/var/log/" : "./"} + "wolbotd.log";
        if (const auto logging_file = config->getLoggingFile())
        {
            log_file_path = *logging_file;
        }
        const auto file_sink = wolbot::common::makeLogFileSink(log_file_path);

        const auto syslog_sink = std::make_shared<syslog_sink_st>("wolbotd",
                                                                  LOG_PID,
                                                                  is_daemonized ? LOG_DAEMON : LOG_USER,
                                                                  true);
        syslog_sink->set_pattern("[%l] '%n' | %v");

        wolbot::common::installLoggers({syslog_sink, file_sink}, file_sink, {"engine", "wol", "chat", "ipc", "io"});
        wolbot::common::applyLogLevels(config->getLoggingLevel(), config->getLoggingFlushLevel(), argc, argv);

        // Separates runs in the log file; syslog doesn't need it.
        if (spdlog::default_logger()->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        writeString(report_fd, "Failed to setup logging: ");
        writeString(report_fd, ex.what());
        ::exit(EXIT_FAILURE);
    }
}

#endif  // WOLBOT_DAEMON_SETUP_LOGGING_HPP_INCLUDED
