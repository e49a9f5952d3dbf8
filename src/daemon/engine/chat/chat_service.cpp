//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "chat_service.hpp"

#include "chat/chat_wire.hpp"
#include "command_dispatcher.hpp"
#include "ipc/pipe/pipe_types.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace chat
{

ChatService::ChatService(ServerPipe::Ptr server_pipe, CommandDispatcher& dispatcher)
    : server_pipe_{std::move(server_pipe)}
    , dispatcher_{dispatcher}
{
    CETL_DEBUG_ASSERT(server_pipe_, "");
}

int ChatService::start()
{
    return server_pipe_->start([this](const auto& event_var) {
        //
        return cetl::visit([this](const auto& event) { return handlePipeEvent(event); }, event_var);
    });
}

int ChatService::handlePipeEvent(const ServerPipe::Event::Connected& connected)
{
    if (connected.peer_user_id)
    {
        logger_->debug("Chat client connected (client={}, uid={}).", connected.client_id, *connected.peer_user_id);
    }
    else
    {
        logger_->debug("Chat client connected (client={}, no identity).", connected.client_id);
    }

    client_id_to_caller_[connected.client_id] = connected.peer_user_id;
    return 0;
}

int ChatService::handlePipeEvent(const ServerPipe::Event::Disconnected& disconnected)
{
    logger_->debug("Chat client disconnected (client={}).", disconnected.client_id);

    client_id_to_caller_.erase(disconnected.client_id);
    return 0;
}

int ChatService::handlePipeEvent(const ServerPipe::Event::Message& message)
{
    const auto client_id     = message.client_id;
    const auto id_and_caller = client_id_to_caller_.find(client_id);
    if (id_and_caller == client_id_to_caller_.end())
    {
        logger_->warn("Message from unknown chat client (client={}).", client_id);
        return 0;
    }

    const auto text = common::chat::deserializeRequest(message.payload);
    dispatcher_.dispatch(id_and_caller->second, text, [this, client_id](const CommandDispatcher::Reply& reply) {
        //
        sendReply(client_id, reply);
    });
    return 0;
}

void ChatService::sendReply(const ClientId client_id, const CommandDispatcher::Reply& reply)
{
    // Replies may come long after the request (f.e. wake verification) - the client might be gone by then.
    if (client_id_to_caller_.find(client_id) == client_id_to_caller_.end())
    {
        logger_->warn("Dropping reply to disconnected chat client (client={}).", client_id);
        return;
    }

    const int err = common::chat::tryPerformOnSerializedReply(reply, [this, client_id](const auto payloads) {
        //
        return server_pipe_->send(client_id, payloads);
    });
    if (err != 0)
    {
        logger_->warn("Failed to send chat reply (client={}, err={}): {}.", client_id, err, std::strerror(err));
    }
}

}  // namespace chat
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
