//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED
#define WOLBOT_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED

#include "pipe_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Daemon side of the chat transport: accepts any number of clients and exchanges framed messages with them.
///
/// Every client gets a fresh id, which is never reused while the pipe lives.
///
class ServerPipe
{
public:
    using Ptr = std::unique_ptr<ServerPipe>;

    using ClientId = std::size_t;

    struct Event final
    {
        struct Connected final
        {
            ClientId client_id;

            /// User id of the connected peer process; `nullopt` if the connection carries no verifiable identity.
            cetl::optional<std::uint64_t> peer_user_id;
        };
        struct Disconnected final
        {
            ClientId client_id;
        };
        struct Message final
        {
            ClientId client_id;

            /// Valid only during the event handler call.
            Payload payload;

        };  // Message

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    /// Non-zero result of the handler is logged but does not affect the client connection.
    using EventHandler = std::function<int(const Event::Var&)>;

    ServerPipe(const ServerPipe&)                = delete;
    ServerPipe(ServerPipe&&) noexcept            = delete;
    ServerPipe& operator=(const ServerPipe&)     = delete;
    ServerPipe& operator=(ServerPipe&&) noexcept = delete;

    virtual ~ServerPipe() = default;

    /// Starts listening; clients are accepted (and reported) from the executor afterwards.
    ///
    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends one message (made of the given fragments) to the client. Unknown clients give `EINVAL`.
    ///
    CETL_NODISCARD virtual int send(const ClientId client_id, const Payloads payloads) = 0;

protected:
    ServerPipe() = default;

};  // ServerPipe

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED
