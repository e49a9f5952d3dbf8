//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IPC_PIPE_CLIENT_CONTEXT_HPP_INCLUDED
#define WOLBOT_COMMON_IPC_PIPE_CLIENT_CONTEXT_HPP_INCLUDED

#include "io/io.hpp"
#include "logging.hpp"
#include "pipe_types.hpp"
#include "server_pipe.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Per-connection state of a socket server: the client socket, its rx framing progress
/// and the executor callback which awaits incoming data.
///
class ClientContext final
{
public:
    using Ptr = std::unique_ptr<ClientContext>;

    ClientContext(const ServerPipe::ClientId id, io::OwnFd&& fd, Logger& logger)
        : id_{id}
        , logger_{logger}
    {
        CETL_DEBUG_ASSERT(fd.get() != -1, "");

        logger_.trace("ClientContext(fd={}, id={}).", fd.get(), id_);
        io_state_.fd = std::move(fd);
    }

    ~ClientContext()
    {
        logger_.trace("~ClientContext(fd={}, id={}).", io_state_.fd.get(), id_);
    }

    ClientContext(const ClientContext&)                = delete;
    ClientContext(ClientContext&&) noexcept            = delete;
    ClientContext& operator=(const ClientContext&)     = delete;
    ClientContext& operator=(ClientContext&&) noexcept = delete;

    SocketBase::IoState& ioState() noexcept
    {
        return io_state_;
    }

    void setOnRxMsgPayload(std::function<int(Payload)> on_rx_msg_payload)
    {
        io_state_.on_rx_msg_payload = std::move(on_rx_msg_payload);
    }

    void setCallback(libcyphal::IExecutor::Callback::Any&& fd_callback)
    {
        fd_callback_ = std::move(fd_callback);
    }

private:
    const ServerPipe::ClientId          id_;
    Logger&                             logger_;
    SocketBase::IoState                 io_state_;
    libcyphal::IExecutor::Callback::Any fd_callback_;

};  // ClientContext

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IPC_PIPE_CLIENT_CONTEXT_HPP_INCLUDED
