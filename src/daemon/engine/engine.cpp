//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "chat/authorization_gate.hpp"
#include "chat/chat_service.hpp"
#include "chat/command_dispatcher.hpp"
#include "config.hpp"
#include "io/socket_address.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "ipc/pipe/socket_server.hpp"
#include "wol/device_registry.hpp"
#include "wol/wake_orchestrator.hpp"
#include "wolbot/platform/defines.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstring>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace wolbot
{
namespace daemon
{
namespace engine
{

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Build the shared immutable context: allow-list and device registry.
    //
    const auto allowed_users = config_->getAllowedUsers();
    if (allowed_users.empty())
    {
        logger_->warn("No allowed users configured - all commands will be denied.");
    }
    chat::AuthorizationGate gate{chat::AuthorizationGate::AllowList{allowed_users.begin(), allowed_users.end()}};

    auto registry = wol::DeviceRegistry::make(config_->getDevices());

    const auto probe_timeout = config_->getWolProbeTimeout();
    auto context = std::make_shared<const chat::BotContext>(chat::BotContext{std::move(gate), registry, probe_timeout});

    // 2. Bring up the wake orchestrator and the command dispatcher.
    //
    wol::WakeOrchestrator::Params wol_params{config_->getWolInterface(), probe_timeout};
    if (wol_params.interface_hint)
    {
        logger_->debug("Magic packets go through interface '{}'.", *wol_params.interface_hint);
    }
    orchestrator_ = std::make_unique<wol::WakeOrchestrator>(executor_,
                                                            std::move(registry),
                                                            transmitter_,
                                                            prober_,
                                                            std::move(wol_params));
    dispatcher_   = std::make_unique<chat::CommandDispatcher>(std::move(context), *orchestrator_, prober_);

    // 3. Bring up the chat transport (IPC server).
    //
    common::ipc::pipe::ServerPipe::Ptr server_pipe;
    {
        using ParseResult = common::io::SocketAddress::ParseResult;

        auto ipc_connections = config_->getIpcConnections();
        if (ipc_connections.empty())
        {
            std::string msg = "No IPC connections configured.";
            logger_->error(msg);
            return msg;
        }

        const auto& ipc_connection = ipc_connections.front();
        if (ipc_connections.size() > 1)
        {
            logger_->warn("Only the first of {} IPC connections is used ('{}').",
                          ipc_connections.size(),
                          ipc_connection);
        }

        logger_->debug("Starting with IPC connection '{}'...", ipc_connection);
        auto maybe_socket_address = common::io::SocketAddress::parse(ipc_connection);
        if (const auto* const failure = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
        {
            // Callers are identified by the user id of a Unix domain peer, so nothing else may serve the chat.
            std::string msg = "Invalid IPC connection '" + ipc_connection + "' (expected '" +
                              common::io::SocketAddress::PathScheme + "<path>' or '" +
                              common::io::SocketAddress::AbstractScheme + "<name>'): " + std::strerror(*failure) +
                              ".";
            logger_->error(msg);
            return msg;
        }
        const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);
        server_pipe               = std::make_unique<common::ipc::pipe::SocketServer>(executor_, socket_address);
    }
    //
    chat_service_ = std::make_unique<chat::ChatService>(std::move(server_pipe), *dispatcher_);
    if (const auto err = chat_service_->start())
    {
        std::string msg = std::string{"Failed to start chat service: "} + std::strerror(err) + ".";
        logger_->error(msg);
        return msg;
    }

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    platform::waitPollingUntil(executor_, [&loop_predicate] { return !loop_predicate(); });

    if (orchestrator_ && (orchestrator_->pendingVerifications() > 0))
    {
        logger_->info("Stopping with {} wake verification(s) still pending.", orchestrator_->pendingVerifications());
    }
}

}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
