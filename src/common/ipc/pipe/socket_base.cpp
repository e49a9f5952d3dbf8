//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_base.hpp"

#include "pipe_types.hpp"
#include "wolbot/platform/posix_utils.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/uio.h>
#include <vector>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{
namespace
{

// Peer may disconnect at any moment (f.e. before a delayed reply) - report it as an error instead of SIGPIPE.
constexpr int SendFlags = MSG_DONTWAIT | MSG_NOSIGNAL;

constexpr std::size_t RxChunkSize = 4096;

}  // namespace

int SocketBase::send(const IoState& io_state, const Payloads payloads) const
{
    std::size_t payload_size = 0;
    for (const auto payload : payloads)
    {
        payload_size += payload.size();
    }
    if ((payload_size == 0) || (payload_size > MsgPayloadMaxSize))
    {
        logger_->error("Refusing to send msg of invalid size (fd={}, size={}).", io_state.fd.get(), payload_size);
        return EINVAL;
    }

    const MsgHeader msg_header{MsgSignature, static_cast<std::uint32_t>(payload_size)};

    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<::iovec> iovecs;
    iovecs.reserve(payloads.size() + 1);
    iovecs.push_back(::iovec{const_cast<MsgHeader*>(&msg_header), sizeof(msg_header)});
    for (const auto payload : payloads)
    {
        iovecs.push_back(::iovec{const_cast<std::uint8_t*>(payload.data()), payload.size()});
    }
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::msghdr msg{};
    msg.msg_iov    = iovecs.data();
    msg.msg_iovlen = iovecs.size();

    ssize_t bytes_sent = 0;
    if (const int err = platform::posixSyscallError([&io_state, &msg, &bytes_sent] {
            //
            return bytes_sent = ::sendmsg(io_state.fd.get(), &msg, SendFlags);
        }))
    {
        logger_->warn("Failed to send msg (fd={}, size={}): {}.", io_state.fd.get(), payload_size, std::strerror(err));
        return err;
    }

    const auto frame_size = sizeof(msg_header) + payload_size;
    if (static_cast<std::size_t>(bytes_sent) != frame_size)
    {
        logger_->error("Msg is sent partially - the stream is broken (fd={}, sent={}, frame_size={}).",
                       io_state.fd.get(),
                       bytes_sent,
                       frame_size);
        return EIO;
    }
    return 0;
}

int SocketBase::receiveData(IoState& io_state) const
{
    std::array<std::uint8_t, RxChunkSize> chunk{};
    while (true)
    {
        ssize_t bytes_read = 0;
        if (const int err = platform::posixSyscallError([&io_state, &chunk, &bytes_read] {
                //
                return bytes_read = ::recv(io_state.fd.get(), chunk.data(), chunk.size(), MSG_DONTWAIT);
            }))
        {
            if ((err == EAGAIN) || (err == EWOULDBLOCK))
            {
                return 0;
            }
            logger_->warn("Failed to read from stream (fd={}): {}.", io_state.fd.get(), std::strerror(err));
            return err;
        }
        if (bytes_read == 0)
        {
            logger_->debug("End of stream (fd={}, pending_bytes={}).", io_state.fd.get(), io_state.rx_buffer.size());
            return -1;
        }

        // NOLINTNEXTLINE(*-pointer-arithmetic)
        io_state.rx_buffer.insert(io_state.rx_buffer.end(), chunk.data(), chunk.data() + bytes_read);
        if (const int err = deliverCompleteMessages(io_state))
        {
            return err;
        }
    }
}

int SocketBase::deliverCompleteMessages(IoState& io_state) const
{
    auto&       buffer = io_state.rx_buffer;
    std::size_t offset = 0;
    while ((buffer.size() - offset) >= sizeof(MsgHeader))
    {
        MsgHeader msg_header{};
        std::memcpy(&msg_header, &buffer[offset], sizeof(msg_header));

        // Zero size is invalid as well b/c a chat message is never empty.
        if ((msg_header.signature != MsgSignature) || (msg_header.payload_size == 0) ||
            (msg_header.payload_size > MsgPayloadMaxSize))
        {
            logger_->error("Invalid msg header - closing invalid stream (fd={}, signature={:#x}, payload_size={}).",
                           io_state.fd.get(),
                           msg_header.signature,
                           msg_header.payload_size);
            return EINVAL;
        }

        const auto frame_size = sizeof(msg_header) + msg_header.payload_size;
        if ((buffer.size() - offset) < frame_size)
        {
            break;
        }

        const Payload payload{&buffer[offset + sizeof(msg_header)], msg_header.payload_size};
        if (const int err = io_state.on_rx_msg_payload(payload))
        {
            logger_->warn("Msg handler has failed (fd={}, size={}): {}.",
                          io_state.fd.get(),
                          payload.size(),
                          std::strerror(err));
        }
        offset += frame_size;
    }

    using Diff = std::vector<std::uint8_t>::difference_type;
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<Diff>(offset));
    return 0;
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot
