//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_TEST_LOG_LISTENER_HPP_INCLUDED
#define WOLBOT_TEST_LOG_LISTENER_HPP_INCLUDED

#include <spdlog/cfg/argv.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace wolbot
{

/// Mirrors the gtest progress into the test log, so that daemon log lines can be
/// attributed to the test which produced them.
///
class TestLogListener final : public testing::EmptyTestEventListener
{
public:
    /// Routes all loggers into `<log_name>.log` (truncated per run) at trace level.
    ///
    /// Levels can be narrowed with the usual `SPDLOG_LEVEL=...` argument.
    ///
    static void setupLogging(const int argc, char** const argv, const std::string& log_name)
    {
        try
        {
            spdlog::drop_all();

            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_st>(log_name + ".log", true);
            auto logger    = std::make_shared<spdlog::logger>("", std::move(file_sink));
            logger->set_pattern("%H:%M:%S.%e %-5!l [%n] %v");
            logger->flush_on(spdlog::level::warn);
            spdlog::set_default_logger(std::move(logger));

            spdlog::set_level(spdlog::level::trace);
            spdlog::cfg::load_argv_levels(argc, argv);

        } catch (const std::exception& ex)
        {
            std::cerr << "Can't set up test logging: " << ex.what() << '\n';
            std::exit(EXIT_FAILURE);
        }
    }

private:
    void OnTestStart(const testing::TestInfo& test_info) override
    {
        failed_parts_ = 0;
        spdlog::info(">>> {}.{}", test_info.test_suite_name(), test_info.name());
    }

    void OnTestPartResult(const testing::TestPartResult& result) override
    {
        if (result.failed())
        {
            ++failed_parts_;
            spdlog::error("FAILED at {}:{}\n{}",
                          (result.file_name() != nullptr) ? result.file_name() : "?",
                          result.line_number(),
                          result.summary());
        }
    }

    void OnTestEnd(const testing::TestInfo& test_info) override
    {
        spdlog::info("<<< {}.{} ({}, {} ms)",
                     test_info.test_suite_name(),
                     test_info.name(),
                     (failed_parts_ == 0) ? "ok" : "FAILED",
                     test_info.result()->elapsed_time());
        spdlog::default_logger()->flush();
    }

    void OnTestProgramEnd(const testing::UnitTest& unit_test) override
    {
        spdlog::info("=== {} passed, {} failed.", unit_test.successful_test_count(), unit_test.failed_test_count());
        spdlog::default_logger()->flush();
    }

    std::size_t failed_parts_{0};

};  // TestLogListener

}  // namespace wolbot

#endif  // WOLBOT_TEST_LOG_LISTENER_HPP_INCLUDED
