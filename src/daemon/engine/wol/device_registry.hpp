//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_WOL_DEVICE_REGISTRY_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_WOL_DEVICE_REGISTRY_HPP_INCLUDED

#include "hardware_address.hpp"

#include <chrono>
#include <cstddef>
#include <map>
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
namespace wol
{

struct DeviceRecord final
{
    std::string          name;
    HardwareAddress      hw_address;
    std::string          net_address;
    std::chrono::seconds verify_timeout;

};  // DeviceRecord

/// Immutable name-to-device mapping, built once at startup and shared read-only afterward.
///
class DeviceRegistry final
{
public:
    using Ptr     = std::shared_ptr<const DeviceRegistry>;
    using Records = std::map<std::string, DeviceRecord>;

    /// Raw configuration fields of a device: hardware address, network address and optional timeout.
    using RawEntry   = std::vector<std::string>;
    using RawEntries = std::map<std::string, RawEntry>;

    static constexpr std::chrono::seconds DefaultVerifyTimeout{30};

    /// Builds registry from untrusted raw entries.
    ///
    /// A malformed entry (wrong number of fields, invalid hardware address) is logged and skipped -
    /// the rest of the entries still make it into the registry.
    /// Missing, unparsable or zero timeout is replaced by the `DefaultVerifyTimeout`.
    ///
    static Ptr make(const RawEntries& raw_entries);

    explicit DeviceRegistry(Records&& records)
        : records_{std::move(records)}
    {
    }

    /// Exact (case-sensitive) lookup by name.
    ///
    /// @return `nullptr` if there is no such device.
    ///
    const DeviceRecord* find(const std::string& name) const;

    /// All devices ordered by name.
    const Records& records() const noexcept
    {
        return records_;
    }

    std::size_t size() const noexcept
    {
        return records_.size();
    }

private:
    static std::chrono::seconds parseVerifyTimeout(const RawEntry& raw_entry);

    const Records records_;

};  // DeviceRegistry

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_WOL_DEVICE_REGISTRY_HPP_INCLUDED
