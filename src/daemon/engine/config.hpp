//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace wolbot
{
namespace daemon
{
namespace engine
{

/// Read-only daemon configuration (TOML file), loaded once at startup.
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Device name to its raw fields (hardware address, network address and optional timeout).
    using DeviceEntries = std::map<std::string, std::vector<std::string>>;

    /// Loads and parses the configuration file.
    ///
    /// @throws std::exception if the file can't be read or is not valid TOML.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getAllowedUsers() const -> std::vector<std::uint64_t>       = 0;
    CETL_NODISCARD virtual auto getWolInterface() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getWolProbeTimeout() const -> std::chrono::seconds          = 0;
    CETL_NODISCARD virtual auto getDevices() const -> DeviceEntries                         = 0;
    CETL_NODISCARD virtual auto getIpcConnections() const -> std::vector<std::string>       = 0;
    CETL_NODISCARD virtual auto getDaemonUser() const -> cetl::optional<std::string>        = 0;
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
