//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_CHAT_SERVICE_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_CHAT_SERVICE_HPP_INCLUDED

#include "command_dispatcher.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <unordered_map>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace chat
{

/// Chat transport of the daemon: receives command messages from IPC clients,
/// passes them (together with the client's identity) to the dispatcher, and sends replies back.
///
class ChatService final
{
public:
    using ServerPipe = common::ipc::pipe::ServerPipe;

    ChatService(ServerPipe::Ptr server_pipe, CommandDispatcher& dispatcher);

    ChatService(const ChatService&)                = delete;
    ChatService(ChatService&&) noexcept            = delete;
    ChatService& operator=(const ChatService&)     = delete;
    ChatService& operator=(ChatService&&) noexcept = delete;

    ~ChatService() = default;

    CETL_NODISCARD int start();

    std::size_t connectedClients() const noexcept
    {
        return client_id_to_caller_.size();
    }

private:
    using ClientId = ServerPipe::ClientId;
    using CallerId = AuthorizationGate::CallerId;

    int  handlePipeEvent(const ServerPipe::Event::Connected& connected);
    int  handlePipeEvent(const ServerPipe::Event::Disconnected& disconnected);
    int  handlePipeEvent(const ServerPipe::Event::Message& message);
    void sendReply(const ClientId client_id, const CommandDispatcher::Reply& reply);

    ServerPipe::Ptr                                              server_pipe_;
    CommandDispatcher&                                           dispatcher_;
    std::unordered_map<ClientId, cetl::optional<CallerId>>       client_id_to_caller_;
    common::LoggerPtr                                            logger_{common::getLogger("chat")};

};  // ChatService

}  // namespace chat
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_CHAT_SERVICE_HPP_INCLUDED
