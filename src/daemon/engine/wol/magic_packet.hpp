//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_WOL_MAGIC_PACKET_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_WOL_MAGIC_PACKET_HPP_INCLUDED

#include "hardware_address.hpp"

#include <array>
#include <cstddef>
#include <cstdint>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

constexpr std::size_t MagicPacketSyncSize    = 6;
constexpr std::size_t MagicPacketRepetitions = 16;
constexpr std::size_t MagicPacketSize        = MagicPacketSyncSize + MagicPacketRepetitions * HardwareAddress::Size;

/// Wake-on-LAN payload: 6 bytes of 0xFF followed by 16 repetitions of the target hardware address.
using MagicPacket = std::array<std::uint8_t, MagicPacketSize>;

MagicPacket encodeMagicPacket(const HardwareAddress& hw_address) noexcept;

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_WOL_MAGIC_PACKET_HPP_INCLUDED
