//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_server.hpp"

#include "client_context.hpp"
#include "io/io.hpp"
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
#include <memory>
#include <string>
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
namespace
{

constexpr int ListenBacklog = 32;

}  // namespace

SocketServer::SocketServer(libcyphal::IExecutor& executor, const io::SocketAddress& address)
    : address_{address}
    , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
    , last_client_id_{0}
{
    CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");
}

int SocketServer::start(EventHandler event_handler)
{
    CETL_DEBUG_ASSERT(event_handler, "");
    CETL_DEBUG_ASSERT(listen_fd_.get() == -1, "");

    event_handler_ = std::move(event_handler);

    if (const int err = listen())
    {
        return err;
    }

    accept_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
        [this](const auto&) {
            //
            acceptPendingClients();
        },
        platform::IPosixExecutorExtension::Trigger::Readable{listen_fd_.get()});

    logger().debug("Listening on '{}' (fd={}).", address_.toString(), listen_fd_.get());
    return 0;
}

int SocketServer::listen()
{
    using SocketResult = io::SocketAddress::SocketResult;

    auto maybe_fd = address_.socket();
    if (const auto* const err = cetl::get_if<SocketResult::Failure>(&maybe_fd))
    {
        return *err;
    }
    auto fd = cetl::get<SocketResult::Success>(std::move(maybe_fd));

    if (const int err = address_.bind(fd))
    {
        return err;
    }
    if (const int err = platform::posixSyscallError([&fd] {
            //
            return ::listen(fd.get(), ListenBacklog);
        }))
    {
        logger().error("Failed to listen on '{}': {}.", address_.toString(), std::strerror(err));
        return err;
    }

    listen_fd_ = std::move(fd);
    return 0;
}

int SocketServer::send(const ClientId client_id, const Payloads payloads)
{
    const auto id_and_client = clients_.find(client_id);
    if (id_and_client == clients_.end())
    {
        logger().warn("Can't send to unknown client (id={}).", client_id);
        return EINVAL;
    }
    return SocketBase::send(id_and_client->second->ioState(), payloads);
}

void SocketServer::acceptPendingClients()
{
    while (auto client_fd = io::SocketAddress::accept(listen_fd_))
    {
        const ClientId client_id    = ++last_client_id_;
        const int      raw_fd       = client_fd->get();
        const auto     peer_user_id = io::SocketAddress::peerUserId(*client_fd);
        logger().debug("Client has connected (id={}, fd={}, uid={}).",
                       client_id,
                       raw_fd,
                       peer_user_id ? std::to_string(*peer_user_id) : "n/a");

        auto client = std::make_unique<ClientContext>(client_id, std::move(*client_fd), logger());
        client->setOnRxMsgPayload([this, client_id](const Payload payload) {
            //
            return event_handler_(Event::Message{client_id, payload});
        });
        client->setCallback(posix_executor_ext_->registerAwaitableCallback(  //
            [this, client_id](const auto&) {
                //
                receiveFromClient(client_id);
            },
            platform::IPosixExecutorExtension::Trigger::Readable{raw_fd}));
        clients_.emplace(client_id, std::move(client));

        notify(Event::Connected{client_id, peer_user_id});
    }
}

void SocketServer::receiveFromClient(const ClientId client_id)
{
    const auto id_and_client = clients_.find(client_id);
    CETL_DEBUG_ASSERT(id_and_client != clients_.end(), "");
    if (id_and_client == clients_.end())
    {
        return;
    }

    const int err = receiveData(id_and_client->second->ioState());
    if (err == 0)
    {
        return;
    }
    if (err == -1)
    {
        logger().debug("Client has disconnected (id={}).", client_id);
    }
    else
    {
        logger().warn("Dropping client connection (id={}): {}.", client_id, std::strerror(err));
    }

    // Erasing the context destroys the callback which is being executed right now,
    // so nothing below may touch the context anymore.
    clients_.erase(id_and_client);
    notify(Event::Disconnected{client_id});
}

void SocketServer::notify(const Event::Var& event) const
{
    if (const int err = event_handler_(event))
    {
        logger().warn("Server event handler has failed: {}.", std::strerror(err));
    }
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot
