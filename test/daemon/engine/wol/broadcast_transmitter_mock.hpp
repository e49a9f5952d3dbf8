//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_WOL_BROADCAST_TRANSMITTER_MOCK_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_WOL_BROADCAST_TRANSMITTER_MOCK_HPP_INCLUDED

#include "wol/broadcast_transmitter.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <gmock/gmock.h>

#include <cstdint>
#include <string>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

class BroadcastTransmitterMock : public IBroadcastTransmitter
{
public:
    MOCK_METHOD(int,
                send,
                (const cetl::span<const std::uint8_t> payload, const cetl::optional<std::string>& interface_hint),
                (override));

};  // BroadcastTransmitterMock

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_WOL_BROADCAST_TRANSMITTER_MOCK_HPP_INCLUDED
