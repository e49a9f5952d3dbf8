//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "magic_packet.hpp"

#include "hardware_address.hpp"

#include <algorithm>
#include <cstddef>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

MagicPacket encodeMagicPacket(const HardwareAddress& hw_address) noexcept
{
    MagicPacket packet{};

    auto out_it = std::fill_n(packet.begin(), MagicPacketSyncSize, 0xFF);
    for (std::size_t rep = 0; rep < MagicPacketRepetitions; ++rep)
    {
        out_it = std::copy(hw_address.octets().cbegin(), hw_address.octets().cend(), out_it);
    }
    return packet;
}

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
