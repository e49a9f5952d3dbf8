//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_CLI_SETUP_LOGGING_HPP_INCLUDED
#define WOLBOT_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "log_setup.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <iostream>

/// Sets up the client logging: all loggers go to `./wolbot-cli.log` only, so that the terminal
/// shows nothing but replies of the daemon.
///
inline void setupLogging(const int argc, const char** const argv)
{
    try
    {
        const auto file_sink = wolbot::common::makeLogFileSink("./wolbot-cli.log");

        wolbot::common::installLoggers({file_sink}, file_sink, {"io", "ipc"});
        wolbot::common::applyLogLevels(cetl::nullopt, cetl::nullopt, argc, argv);

        spdlog::info("--------------------------");

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

#endif  // WOLBOT_CLI_SETUP_LOGGING_HPP_INCLUDED
