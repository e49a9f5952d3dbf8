//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_client.hpp"

#include "io/socket_address.hpp"
#include "pipe_types.hpp"
#include "socket_base.hpp"
#include "wolbot/platform/posix_executor_extension.hpp"
#include "wolbot/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <utility>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{

SocketClient::SocketClient(libcyphal::IExecutor& executor, const io::SocketAddress& address)
    : address_{address}
    , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
{
    CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");

    io_state_.on_rx_msg_payload = [this](const Payload payload) {
        //
        return event_handler_(Event::Message{payload});
    };
}

int SocketClient::start(EventHandler event_handler)
{
    CETL_DEBUG_ASSERT(event_handler, "");
    CETL_DEBUG_ASSERT(io_state_.fd.get() == -1, "");

    event_handler_ = std::move(event_handler);

    using SocketResult = io::SocketAddress::SocketResult;

    auto maybe_fd = address_.socket();
    if (const auto* const err = cetl::get_if<SocketResult::Failure>(&maybe_fd))
    {
        return *err;
    }
    auto fd = cetl::get<SocketResult::Success>(std::move(maybe_fd));
    if (const int err = address_.connect(fd))
    {
        return err;
    }
    io_state_.fd = std::move(fd);

    // The socket becomes writable once the connection is either established or has failed.
    fd_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            onWritable();
        },
        platform::IPosixExecutorExtension::Trigger::Writable{io_state_.fd.get()});

    return 0;
}

int SocketClient::send(const Payloads payloads)
{
    if (io_state_.fd.get() == -1)
    {
        logger().warn("Can't send - not connected to '{}'.", address_.toString());
        return ENOTCONN;
    }
    return SocketBase::send(io_state_, payloads);
}

void SocketClient::onWritable()
{
    int       connect_err = 0;
    socklen_t err_len     = sizeof(connect_err);
    if (const int err = platform::posixSyscallError([this, &connect_err, &err_len] {
            //
            return ::getsockopt(io_state_.fd.get(), SOL_SOCKET, SO_ERROR, &connect_err, &err_len);
        }))
    {
        connect_err = err;
    }
    if (connect_err != 0)
    {
        logger().error("Failed to connect to '{}': {}.", address_.toString(), std::strerror(connect_err));
        closeConnection(connect_err);
        return;
    }

    logger().debug("Connected to '{}' (fd={}).", address_.toString(), io_state_.fd.get());

    // The fd may be awaited by one callback only, so the one being executed right now goes first.
    fd_callback_.reset();
    fd_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            onReadable();
        },
        platform::IPosixExecutorExtension::Trigger::Readable{io_state_.fd.get()});

    notify(Event::Connected{});
}

void SocketClient::onReadable()
{
    const int err = receiveData(io_state_);
    if (err == 0)
    {
        return;
    }
    if (err == -1)
    {
        logger().debug("Server has closed the connection.");
        closeConnection(0);
        return;
    }
    logger().warn("Dropping server connection: {}.", std::strerror(err));
    closeConnection(err);
}

void SocketClient::closeConnection(const int error)
{
    fd_callback_.reset();
    io_state_.fd.reset();
    io_state_.rx_buffer.clear();

    notify(Event::Disconnected{error});
}

void SocketClient::notify(const Event::Var& event) const
{
    if (const int err = event_handler_(event))
    {
        logger().warn("Client event handler has failed: {}.", std::strerror(err));
    }
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot
