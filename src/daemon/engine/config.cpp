//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
    {
    }

    // Config

    auto getAllowedUsers() const -> std::vector<std::uint64_t> override
    {
        std::vector<std::uint64_t> allowed_users;
        if (!root_.contains("bot") || !root_.at("bot").is_table() || !root_.at("bot").contains("allowed_users"))
        {
            return allowed_users;
        }
        const auto& toml_users = root_.at("bot").at("allowed_users");
        if (!toml_users.is_array())
        {
            spdlog::warn("Config '{}': 'bot.allowed_users' is not an array - nobody is allowed.", file_path_);
            return allowed_users;
        }

        for (const auto& toml_user : toml_users.as_array())
        {
            if (!toml_user.is_integer() || (toml_user.as_integer() < 0))
            {
                spdlog::warn("Config '{}': skipping invalid user id in 'bot.allowed_users'.", file_path_);
                continue;
            }
            allowed_users.push_back(static_cast<std::uint64_t>(toml_user.as_integer()));
        }
        return allowed_users;
    }

    auto getWolInterface() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("wol", "interface");
    }

    auto getWolProbeTimeout() const -> std::chrono::seconds override
    {
        constexpr std::int64_t default_secs = 1;

        const auto secs = findImpl<std::int64_t>("wol", "probe_timeout").value_or(default_secs);
        return std::chrono::seconds{(secs > 0) ? secs : default_secs};
    }

    auto getDevices() const -> DeviceEntries override
    {
        DeviceEntries devices;
        if (!root_.contains("devices"))
        {
            return devices;
        }
        const auto& toml_devices = root_.at("devices");
        if (!toml_devices.is_table())
        {
            spdlog::warn("Config '{}': 'devices' is not a table - no devices.", file_path_);
            return devices;
        }

        for (const auto& name_and_value : toml_devices.as_table())
        {
            const auto& name       = name_and_value.first;
            const auto& toml_entry = name_and_value.second;

            std::vector<std::string> fields;
            bool                     is_valid = toml_entry.is_array();
            if (is_valid)
            {
                for (const auto& toml_field : toml_entry.as_array())
                {
                    if (!toml_field.is_string())
                    {
                        is_valid = false;
                        break;
                    }
                    fields.push_back(toml_field.as_string());
                }
            }
            if (!is_valid)
            {
                spdlog::warn("Config '{}': skipping device '{}' - expected an array of strings.", file_path_, name);
                continue;
            }
            devices.emplace(name, std::move(fields));
        }
        return devices;
    }

    auto getIpcConnections() const -> std::vector<std::string> override
    {
        return findImpl<std::vector<std::string>>("ipc", "connections").value_or(std::vector<std::string>{});
    }

    auto getDaemonUser() const -> cetl::optional<std::string> override
    {
        auto user = findImpl<std::string>("daemon", "user");
        if (user && user->empty())
        {
            return cetl::nullopt;
        }
        return user;
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            // Missing key, or value of a different type.
            return cetl::nullopt;
        }
    }

    const std::string file_path_;
    const TomlValue   root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
