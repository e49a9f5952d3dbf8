//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED

#include "engine/config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace wolbot
{
namespace daemon
{
namespace engine
{

class ConfigMock : public Config
{
public:
    MOCK_METHOD(std::vector<std::uint64_t>, getAllowedUsers, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getWolInterface, (), (const, override));
    MOCK_METHOD(std::chrono::seconds, getWolProbeTimeout, (), (const, override));
    MOCK_METHOD(DeviceEntries, getDevices, (), (const, override));
    MOCK_METHOD(std::vector<std::string>, getIpcConnections, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getDaemonUser, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFile, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingLevel, (), (const, override));
    MOCK_METHOD(cetl::optional<std::string>, getLoggingFlushLevel, (), (const, override));

};  // ConfigMock

}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_CONFIG_MOCK_HPP_INCLUDED
