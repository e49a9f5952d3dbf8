//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "command_dispatcher.hpp"

#include "authorization_gate.hpp"
#include "chat/chat_wire.hpp"
#include "chat_command.hpp"
#include "logging.hpp"
#include "wol/liveness_prober.hpp"
#include "wol/wake_orchestrator.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <cstddef>
#include <cstring>
#include <map>
#include <memory>
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
namespace
{

using common::chat::Reply;
using common::chat::ReplyKind;

Reply finalReply(std::string text)
{
    return Reply{ReplyKind::Final, std::move(text)};
}

std::string onlineText(const bool is_online)
{
    return is_online ? "online" : "offline";
}

}  // namespace

CommandDispatcher::CommandDispatcher(BotContext::Ptr        context,
                                     wol::WakeOrchestrator& orchestrator,
                                     wol::ILivenessProber&  prober)
    : context_{std::move(context)}
    , orchestrator_{orchestrator}
    , prober_{prober}
{
    CETL_DEBUG_ASSERT(context_, "");
    CETL_DEBUG_ASSERT(context_->registry, "");
}

void CommandDispatcher::dispatch(const cetl::optional<AuthorizationGate::CallerId>& caller_id,
                                 const std::string&                                 text,
                                 ReplyHandler                                       reply_handler)
{
    CETL_DEBUG_ASSERT(reply_handler, "");

    if (!context_->gate.check(caller_id))
    {
        if (caller_id)
        {
            logger_->warn("Access denied (caller={}).", *caller_id);
        }
        else
        {
            logger_->warn("Access denied (caller without identity).");
        }
        return;
    }

    const auto command = ChatCommand::parse(text);
    if (!command)
    {
        logger_->debug("Ignoring unknown command '{}' (caller={}).", text, *caller_id);
        return;
    }
    logger_->debug("Command '{}' (caller={}).", text, *caller_id);

    cetl::visit([this, &reply_handler](const auto& cmd) { handleCommand(cmd, reply_handler); }, *command);
}

void CommandDispatcher::handleCommand(const ChatCommand::Help&, const ReplyHandler& reply_handler) const
{
    reply_handler(finalReply("Wake-on-LAN bot commands:\n"
                             "/list - list configured devices\n"
                             "/status <name> - check whether a device is online\n"
                             "/status_all - check all devices\n"
                             "/wake <name> - send magic packet to a device"));
}

void CommandDispatcher::handleCommand(const ChatCommand::List&, const ReplyHandler& reply_handler) const
{
    const auto& records = context_->registry->records();
    if (records.empty())
    {
        reply_handler(finalReply("No devices are configured."));
        return;
    }

    std::string text{"Configured devices:"};
    for (const auto& name_and_record : records)
    {
        text += "\n- " + name_and_record.first;
    }
    reply_handler(finalReply(std::move(text)));
}

void CommandDispatcher::handleCommand(const ChatCommand::StatusAll&, const ReplyHandler& reply_handler)
{
    const auto& records = context_->registry->records();
    if (records.empty())
    {
        reply_handler(finalReply("No devices are configured."));
        return;
    }

    // Probes run concurrently; the combined report goes out once the last one completes.
    struct StatusAllOp final
    {
        std::size_t                 pending;
        std::map<std::string, bool> name_to_online;
        ReplyHandler                reply_handler;
    };
    auto op = std::make_shared<StatusAllOp>(StatusAllOp{records.size(), {}, reply_handler});

    for (const auto& name_and_record : records)
    {
        const auto& record = name_and_record.second;
        prober_.probe(record.net_address, context_->probe_timeout, [op, name = record.name](const bool is_online) {
            //
            op->name_to_online[name] = is_online;
            if (--op->pending > 0)
            {
                return;
            }

            std::string text{"Network status:"};
            for (const auto& name_and_online : op->name_to_online)
            {
                text += "\n- " + name_and_online.first + ": " + onlineText(name_and_online.second);
            }
            op->reply_handler(finalReply(std::move(text)));
        });
    }
}

void CommandDispatcher::handleCommand(const ChatCommand::Status& status, const ReplyHandler& reply_handler)
{
    if (!status.device_name)
    {
        reply_handler(finalReply("Usage: /status <name>"));
        return;
    }
    const auto& name = *status.device_name;

    const auto* const record = context_->registry->find(name);
    if (record == nullptr)
    {
        reply_handler(finalReply("Device '" + name + "' is not found."));
        return;
    }

    prober_.probe(record->net_address, context_->probe_timeout, [name, reply_handler](const bool is_online) {
        //
        reply_handler(finalReply("Device '" + name + "' is " + onlineText(is_online) + "."));
    });
}

void CommandDispatcher::handleCommand(const ChatCommand::Wake& wake, const ReplyHandler& reply_handler)
{
    if (!wake.device_name)
    {
        reply_handler(finalReply("Usage: /wake <name>"));
        return;
    }

    orchestrator_.wake(*wake.device_name, [reply_handler](const wol::WakeEvent::Var& event_var) {
        //
        cetl::visit(cetl::make_overloaded(
                        [&reply_handler](const wol::WakeEvent::DeviceNotFound& not_found) {
                            reply_handler(finalReply("Device '" + not_found.device_name + "' is not found."));
                        },
                        [&reply_handler](const wol::WakeEvent::TransmitFailed& failed) {
                            reply_handler(finalReply("Failed to send magic packet to '" + failed.device_name +
                                                     "': " + std::strerror(failed.error_code) + "."));
                        },
                        [&reply_handler](const wol::WakeEvent::Acknowledged& ack) {
                            reply_handler(Reply{ReplyKind::MoreFollows,
                                                "Magic packet is sent to '" + ack.device_name + "'. Verifying in " +
                                                    std::to_string(ack.verify_timeout.count()) + "s..."});
                        },
                        [&reply_handler](const wol::WakeEvent::Reported& reported) {
                            reply_handler(finalReply(reported.is_online
                                                         ? "Device '" + reported.device_name + "' is online now."
                                                         : "Device '" + reported.device_name +
                                                               "' is still not responding."));
                        }),
                    event_var);
    });
}

}  // namespace chat
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
