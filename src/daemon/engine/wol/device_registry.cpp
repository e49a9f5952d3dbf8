//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_registry.hpp"

#include "hardware_address.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <string>
#include <utility>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

constexpr std::chrono::seconds DeviceRegistry::DefaultVerifyTimeout;

DeviceRegistry::Ptr DeviceRegistry::make(const RawEntries& raw_entries)
{
    const auto logger = common::getLogger("wol");

    Records records;
    for (const auto& name_and_entry : raw_entries)
    {
        const auto& name      = name_and_entry.first;
        const auto& raw_entry = name_and_entry.second;

        if ((raw_entry.size() < 2) || (raw_entry.size() > 3))
        {
            logger->warn("Skipping malformed device '{}': expected 2 or 3 fields, got {}.", name, raw_entry.size());
            continue;
        }

        auto hw_parse_result = HardwareAddress::parse(raw_entry[0]);
        if (const auto* const failure = cetl::get_if<HardwareAddress::ParseResult::Failure>(&hw_parse_result))
        {
            logger->warn("Skipping malformed device '{}': bad hardware address '{}' ({}).",
                         name,
                         raw_entry[0],
                         failure->reason);
            continue;
        }

        DeviceRecord record{name,
                            cetl::get<HardwareAddress::ParseResult::Success>(hw_parse_result),
                            raw_entry[1],
                            parseVerifyTimeout(raw_entry)};

        logger->debug("Device '{}' (hw='{}', net='{}', timeout={}s).",
                      record.name,
                      record.hw_address.toString(),
                      record.net_address,
                      record.verify_timeout.count());

        records.emplace(name, std::move(record));
    }

    logger->info("Device registry is built ({} of {} devices).", records.size(), raw_entries.size());
    return std::make_shared<const DeviceRegistry>(std::move(records));
}

const DeviceRecord* DeviceRegistry::find(const std::string& name) const
{
    const auto name_and_record = records_.find(name);
    if (name_and_record != records_.end())
    {
        return &name_and_record->second;
    }
    return nullptr;
}

std::chrono::seconds DeviceRegistry::parseVerifyTimeout(const RawEntry& raw_entry)
{
    if (raw_entry.size() < 3)
    {
        return DefaultVerifyTimeout;
    }

    const auto& str = raw_entry[2];
    if (str.empty() || (std::isdigit(static_cast<unsigned char>(str.front())) == 0))
    {
        return DefaultVerifyTimeout;
    }

    errno            = 0;
    char* end        = nullptr;
    const auto value = std::strtoull(str.c_str(), &end, 10);
    if ((errno != 0) || (end == nullptr) || (*end != '\0') || (value == 0) ||
        (value > std::numeric_limits<std::uint32_t>::max()))
    {
        return DefaultVerifyTimeout;
    }
    return std::chrono::seconds{static_cast<std::chrono::seconds::rep>(value)};
}

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
