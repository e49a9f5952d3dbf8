//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
#define WOLBOT_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED

#include "client_pipe.hpp"
#include "io/socket_address.hpp"
#include "pipe_types.hpp"
#include "socket_base.hpp"
#include "wolbot/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Unix domain stream socket client counterpart of `SocketServer`.
///
/// Events are always delivered from the executor, never from within `start`.
///
class SocketClient final : public SocketBase, public ClientPipe
{
public:
    SocketClient(libcyphal::IExecutor& executor, const io::SocketAddress& address);

    SocketClient(const SocketClient&)                = delete;
    SocketClient(SocketClient&&) noexcept            = delete;
    SocketClient& operator=(const SocketClient&)     = delete;
    SocketClient& operator=(SocketClient&&) noexcept = delete;

    ~SocketClient() override = default;

    // ClientPipe
    //
    CETL_NODISCARD int start(EventHandler event_handler) override;
    CETL_NODISCARD int send(const Payloads payloads) override;

private:
    void onWritable();
    void onReadable();
    void closeConnection(const int error);
    void notify(const Event::Var& event) const;

    const io::SocketAddress                  address_;
    platform::IPosixExecutorExtension* const posix_executor_ext_;
    IoState                                  io_state_;
    libcyphal::IExecutor::Callback::Any      fd_callback_;
    EventHandler                             event_handler_;

};  // SocketClient

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
