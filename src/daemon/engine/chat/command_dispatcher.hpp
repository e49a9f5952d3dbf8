//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_CHAT_COMMAND_DISPATCHER_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_CHAT_COMMAND_DISPATCHER_HPP_INCLUDED

#include "authorization_gate.hpp"
#include "chat/chat_wire.hpp"
#include "chat_command.hpp"
#include "logging.hpp"
#include "wol/device_registry.hpp"
#include "wol/liveness_prober.hpp"
#include "wol/wake_orchestrator.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace chat
{

/// Shared immutable state consulted by every command.
///
struct BotContext final
{
    using Ptr = std::shared_ptr<const BotContext>;

    AuthorizationGate        gate;
    wol::DeviceRegistry::Ptr registry;
    std::chrono::seconds     probe_timeout;

};  // BotContext

/// Turns inbound chat command text into replies.
///
/// Every command passes the authorization gate first - denied ones are logged and dropped without any reply.
/// Unknown commands are silently ignored as well. Replies of a command may be delivered later,
/// from the executor (f.e. liveness probe results).
///
class CommandDispatcher final
{
public:
    using Reply        = common::chat::Reply;
    using ReplyHandler = std::function<void(const Reply&)>;

    CommandDispatcher(BotContext::Ptr context, wol::WakeOrchestrator& orchestrator, wol::ILivenessProber& prober);

    CommandDispatcher(const CommandDispatcher&)                = delete;
    CommandDispatcher(CommandDispatcher&&) noexcept            = delete;
    CommandDispatcher& operator=(const CommandDispatcher&)     = delete;
    CommandDispatcher& operator=(CommandDispatcher&&) noexcept = delete;

    ~CommandDispatcher() = default;

    void dispatch(const cetl::optional<AuthorizationGate::CallerId>& caller_id,
                  const std::string&                                 text,
                  ReplyHandler                                       reply_handler);

private:
    void handleCommand(const ChatCommand::Help&, const ReplyHandler& reply_handler) const;
    void handleCommand(const ChatCommand::List&, const ReplyHandler& reply_handler) const;
    void handleCommand(const ChatCommand::StatusAll&, const ReplyHandler& reply_handler);
    void handleCommand(const ChatCommand::Status& status, const ReplyHandler& reply_handler);
    void handleCommand(const ChatCommand::Wake& wake, const ReplyHandler& reply_handler);

    const BotContext::Ptr  context_;
    wol::WakeOrchestrator& orchestrator_;
    wol::ILivenessProber&  prober_;
    common::LoggerPtr      logger_{common::getLogger("chat")};

};  // CommandDispatcher

}  // namespace chat
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_CHAT_COMMAND_DISPATCHER_HPP_INCLUDED
