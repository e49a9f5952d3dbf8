//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
#define WOLBOT_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED

#include "pipe_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

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

/// Chat side of a single connection to the daemon.
///
/// A started pipe reports exactly one `Connected` (unless connecting fails), then any number of
/// `Message`s (one per reply frame), and finally at most one `Disconnected`, after which it stays idle.
///
class ClientPipe
{
public:
    using Ptr = std::unique_ptr<ClientPipe>;

    struct Event final
    {
        struct Connected final
        {};
        struct Message final
        {
            /// Valid only during the event handler call.
            Payload payload;

        };  // Message
        struct Disconnected final
        {
            /// Zero if the daemon closed the connection, otherwise `errno` of the connect/receive failure.
            int error;

        };  // Disconnected

        using Var = cetl::variant<Connected, Message, Disconnected>;

    };  // Event

    /// Non-zero result of the handler is logged but does not affect the connection.
    using EventHandler = std::function<int(const Event::Var&)>;

    ClientPipe(const ClientPipe&)                = delete;
    ClientPipe(ClientPipe&&) noexcept            = delete;
    ClientPipe& operator=(const ClientPipe&)     = delete;
    ClientPipe& operator=(ClientPipe&&) noexcept = delete;

    virtual ~ClientPipe() = default;

    /// Begins connecting; the outcome is delivered to the handler later.
    ///
    /// @return `errno` if connecting could not even begin.
    ///
    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends one message made of the given fragments. Fails with `ENOTCONN` before `Connected`.
    ///
    CETL_NODISCARD virtual int send(const Payloads payloads) = 0;

protected:
    ClientPipe() = default;

};  // ClientPipe

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
