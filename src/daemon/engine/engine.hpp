//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_HPP_INCLUDED

#include "chat/chat_service.hpp"
#include "chat/command_dispatcher.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "wol/broadcast_transmitter.hpp"
#include "wol/liveness_prober.hpp"
#include "wol/wake_orchestrator.hpp"
#include "wolbot/platform/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <memory>
#include <string>

namespace wolbot
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    CETL_NODISCARD cetl::optional<std::string> init();
    void                                       runWhile(const std::function<bool()>& loop_predicate);

private:
    Config::Ptr                              config_;
    common::LoggerPtr                        logger_{common::getLogger("engine")};
    platform::SingleThreadedExecutor         executor_;
    wol::UdpBroadcastTransmitter             transmitter_;
    wol::PingLivenessProber                  prober_{executor_, wol::PingLivenessProber::Params{}};
    std::unique_ptr<wol::WakeOrchestrator>   orchestrator_;
    std::unique_ptr<chat::CommandDispatcher> dispatcher_;
    std::unique_ptr<chat::ChatService>       chat_service_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_HPP_INCLUDED
