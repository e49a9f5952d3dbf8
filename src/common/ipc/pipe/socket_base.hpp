//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED
#define WOLBOT_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED

#include "io/io.hpp"
#include "logging.hpp"
#include "pipe_types.hpp"

#include <cetl/cetl.hpp>

#include <cstdint>
#include <functional>
#include <vector>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Message framing over a connected stream socket, shared by the socket server and client.
///
class SocketBase
{
public:
    /// State of one connected stream.
    ///
    struct IoState final
    {
        io::OwnFd fd;

        /// Received bytes which don't make a complete frame yet.
        std::vector<std::uint8_t> rx_buffer;

        std::function<int(Payload)> on_rx_msg_payload;

    };  // IoState

    SocketBase(const SocketBase&)                = delete;
    SocketBase(SocketBase&&) noexcept            = delete;
    SocketBase& operator=(const SocketBase&)     = delete;
    SocketBase& operator=(SocketBase&&) noexcept = delete;

protected:
    SocketBase()  = default;
    ~SocketBase() = default;

    Logger& logger() const noexcept
    {
        return *logger_;
    }

    /// Sends one message (header and all payload fragments) with a single non-blocking write.
    ///
    /// @return `0` on success, otherwise errno (`EIO` if the stream could take only a part of the frame).
    ///
    CETL_NODISCARD int send(const IoState& io_state, const Payloads payloads) const;

    /// Reads all currently available data, and delivers every completed message to `on_rx_msg_payload`.
    ///
    /// @return `0` if the stream is still good, `-1` at the end of the stream, otherwise errno.
    ///
    CETL_NODISCARD int receiveData(IoState& io_state) const;

private:
    CETL_NODISCARD int deliverCompleteMessages(IoState& io_state) const;

    LoggerPtr logger_{getLogger("ipc")};

};  // SocketBase

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED
