//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_LOGGING_HPP_INCLUDED
#define WOLBOT_COMMON_LOGGING_HPP_INCLUDED

#include <cetl/cetl.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace wolbot
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Gets (or lazily creates) a named subsystem logger.
///
/// A new logger is cloned from the default one (so it shares its sinks), and gets its level
/// from the levels previously loaded into the registry (see `SPDLOG_LEVEL=...`).
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    // A concurrent registration under the same name only means that the clone stays unregistered.
    try
    {
        spdlog::initialize_logger(logger);

    } catch (const spdlog::spdlog_ex& ex)
    {
        default_logger->warn("Logger '{}' is not registered: {}", name, ex.what());
    }

    return logger;
}

}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_LOGGING_HPP_INCLUDED
