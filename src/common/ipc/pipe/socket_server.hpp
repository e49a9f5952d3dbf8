//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED
#define WOLBOT_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED

#include "client_context.hpp"
#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "pipe_types.hpp"
#include "server_pipe.hpp"
#include "socket_base.hpp"
#include "wolbot/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <unordered_map>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Unix domain stream socket server which frames messages with `SocketBase`.
///
/// Each accepted connection gets a unique client id, reported with the `Connected` event
/// together with the user id of the peer process.
///
class SocketServer final : public SocketBase, public ServerPipe
{
public:
    SocketServer(libcyphal::IExecutor& executor, const io::SocketAddress& address);

    SocketServer(const SocketServer&)                = delete;
    SocketServer(SocketServer&&) noexcept            = delete;
    SocketServer& operator=(const SocketServer&)     = delete;
    SocketServer& operator=(SocketServer&&) noexcept = delete;

    ~SocketServer() override = default;

    // ServerPipe
    //
    CETL_NODISCARD int start(EventHandler event_handler) override;
    CETL_NODISCARD int send(const ClientId client_id, const Payloads payloads) override;

private:
    CETL_NODISCARD int listen();
    void               acceptPendingClients();
    void               receiveFromClient(const ClientId client_id);
    void               notify(const Event::Var& event) const;

    const io::SocketAddress                          address_;
    platform::IPosixExecutorExtension* const         posix_executor_ext_;
    io::OwnFd                                        listen_fd_;
    ClientId                                         last_client_id_;
    libcyphal::IExecutor::Callback::Any              accept_callback_;
    EventHandler                                     event_handler_;
    std::unordered_map<ClientId, ClientContext::Ptr> clients_;

};  // SocketServer

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED
