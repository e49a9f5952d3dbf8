//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_WOL_BROADCAST_TRANSMITTER_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_WOL_BROADCAST_TRANSMITTER_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

/// Sends a payload as a single datagram to the local network broadcast address.
///
class IBroadcastTransmitter
{
public:
    using Ptr = std::unique_ptr<IBroadcastTransmitter>;

    IBroadcastTransmitter(const IBroadcastTransmitter&)                = delete;
    IBroadcastTransmitter(IBroadcastTransmitter&&) noexcept            = delete;
    IBroadcastTransmitter& operator=(const IBroadcastTransmitter&)     = delete;
    IBroadcastTransmitter& operator=(IBroadcastTransmitter&&) noexcept = delete;

    virtual ~IBroadcastTransmitter() = default;

    /// Sends the payload (fire-and-forget).
    ///
    /// @param payload The datagram payload.
    /// @param interface_hint Optional name of the network interface to send through.
    ///                       Failure to bind to it is not an error - the payload is sent unbound then.
    /// @return Zero if the payload was accepted by the local network stack, otherwise `errno` of the failure.
    ///
    CETL_NODISCARD virtual int send(const cetl::span<const std::uint8_t> payload,
                                    const cetl::optional<std::string>&   interface_hint) = 0;

protected:
    IBroadcastTransmitter() = default;

};  // IBroadcastTransmitter

/// IPv4 limited-broadcast transmitter over UDP (destination 255.255.255.255:9).
///
/// Every `send` opens (and closes) its own broadcast-enabled socket.
///
class UdpBroadcastTransmitter final : public IBroadcastTransmitter
{
public:
    static constexpr std::uint16_t WolPort = 9;

    UdpBroadcastTransmitter() = default;

    CETL_NODISCARD int send(const cetl::span<const std::uint8_t> payload,
                            const cetl::optional<std::string>&   interface_hint) override;

};  // UdpBroadcastTransmitter

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_WOL_BROADCAST_TRANSMITTER_HPP_INCLUDED
