//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "chat/chat_service.hpp"

#include "chat/authorization_gate.hpp"
#include "chat/chat_wire.hpp"
#include "chat/command_dispatcher.hpp"
#include "common/ipc/pipe/server_pipe_mock.hpp"
#include "daemon/engine/wol/broadcast_transmitter_mock.hpp"
#include "daemon/engine/wol/liveness_prober_mock.hpp"
#include "ipc/pipe/pipe_types.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "virtual_time_scheduler.hpp"
#include "wol/device_registry.hpp"
#include "wol/wake_orchestrator.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace wolbot::daemon::engine;  // NOLINT This our main concern here in the unit tests.

using chat::AuthorizationGate;
using chat::BotContext;
using chat::ChatService;
using chat::CommandDispatcher;
using wolbot::common::ipc::pipe::Payloads;
using wolbot::common::ipc::pipe::ServerPipe;
using wolbot::common::ipc::pipe::ServerPipeMock;

using testing::_;
using testing::ElementsAre;
using testing::Invoke;
using testing::IsEmpty;
using testing::Return;
using testing::StrictMock;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestChatService : public testing::Test
{
protected:
    using Event = ServerPipe::Event;

    void SetUp() override
    {
        auto context = std::make_shared<const BotContext>(
            BotContext{AuthorizationGate{AuthorizationGate::AllowList{1000}},
                       wol::DeviceRegistry::make({{"nas", {"00:11:22:33:44:55", "10.0.0.10", "5"}}}),
                       std::chrono::seconds{1}});

        orchestrator_ = std::make_unique<wol::WakeOrchestrator>(scheduler_,
                                                                context->registry,
                                                                transmitter_mock_,
                                                                prober_mock_,
                                                                wol::WakeOrchestrator::Params{});
        dispatcher_   = std::make_unique<CommandDispatcher>(context, *orchestrator_, prober_mock_);
    }

    std::unique_ptr<ChatService> startService()
    {
        EXPECT_CALL(server_pipe_mock_, start(_)).WillOnce(Return(0));
        EXPECT_CALL(server_pipe_mock_, deinit()).Times(1);

        auto service = std::make_unique<ChatService>(std::make_unique<ServerPipeMock::Wrapper>(server_pipe_mock_),
                                                     *dispatcher_);
        EXPECT_THAT(service->start(), 0);
        return service;
    }

    int emit(const Event::Var& event)
    {
        return server_pipe_mock_.event_handler_(event);
    }

    int emitRequest(const ServerPipe::ClientId client_id, const std::string& text)
    {
        return wolbot::common::chat::tryPerformOnSerializedRequest(text, [this, client_id](const auto payloads) {
            //
            return emit(Event::Message{client_id, payloads.front()});
        });
    }

    /// Captures what is sent to the clients as flat "client:payload" strings (kind byte as a digit).
    void captureSent()
    {
        EXPECT_CALL(server_pipe_mock_, send(_, _))
            .WillRepeatedly(Invoke([this](const ServerPipe::ClientId client_id, const Payloads payloads) {
                //
                std::string flat = std::to_string(client_id) + ":";
                for (const auto payload : payloads)
                {
                    flat.append(reinterpret_cast<const char*>(payload.data()), payload.size());  // NOLINT
                }
                // Make the leading kind byte printable.
                flat[flat.find(':') + 1] = static_cast<char>('0' + flat[flat.find(':') + 1]);
                sent_.push_back(flat);
                return 0;
            }));
    }

    // NOLINTBEGIN
    wolbot::VirtualTimeScheduler              scheduler_{};
    StrictMock<ServerPipeMock>                server_pipe_mock_;
    StrictMock<wol::BroadcastTransmitterMock> transmitter_mock_;
    StrictMock<wol::LivenessProberMock>       prober_mock_;
    std::unique_ptr<wol::WakeOrchestrator>    orchestrator_;
    std::unique_ptr<CommandDispatcher>        dispatcher_;
    std::vector<std::string>                  sent_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestChatService, start)
{
    auto service = startService();
    EXPECT_THAT(service->connectedClients(), 0U);
}

TEST_F(TestChatService, replies_go_to_requesting_client)
{
    auto service = startService();
    captureSent();

    EXPECT_THAT(emit(Event::Connected{1, 1000}), 0);
    EXPECT_THAT(emit(Event::Connected{2, 1000}), 0);
    EXPECT_THAT(service->connectedClients(), 2U);

    EXPECT_THAT(emitRequest(2, "/list"), 0);
    EXPECT_THAT(emitRequest(1, "/wake"), 0);

    EXPECT_THAT(sent_, ElementsAre("2:0Configured devices:\n- nas", "1:0Usage: /wake <name>"));
}

TEST_F(TestChatService, caller_identity_is_taken_from_connection)
{
    auto service = startService();

    // Neither unknown nor missing identity is allowed to do anything - nothing is sent (strict mock).
    EXPECT_THAT(emit(Event::Connected{1, 1001}), 0);
    EXPECT_THAT(emit(Event::Connected{2, cetl::nullopt}), 0);
    EXPECT_THAT(emitRequest(1, "/list"), 0);
    EXPECT_THAT(emitRequest(2, "/list"), 0);

    // Message from a client which has never connected.
    EXPECT_THAT(emitRequest(3, "/list"), 0);
}

TEST_F(TestChatService, wake_replies_in_two_parts)
{
    auto service = startService();
    captureSent();

    EXPECT_CALL(transmitter_mock_, send(_, _)).WillOnce(Return(0));
    EXPECT_CALL(prober_mock_, probe("10.0.0.10", _, _))  //
        .WillOnce(prober_mock_.replyLater(scheduler_, true));

    EXPECT_THAT(emit(Event::Connected{7, 1000}), 0);
    EXPECT_THAT(emitRequest(7, "/wake nas"), 0);
    EXPECT_THAT(sent_, ElementsAre("7:1Magic packet is sent to 'nas'. Verifying in 5s..."));

    scheduler_.spinFor(10s);
    EXPECT_THAT(sent_,
                ElementsAre("7:1Magic packet is sent to 'nas'. Verifying in 5s...", "7:0Device 'nas' is online now."));
}

TEST_F(TestChatService, reply_to_disconnected_client_is_dropped)
{
    auto service = startService();
    captureSent();

    EXPECT_CALL(transmitter_mock_, send(_, _)).WillOnce(Return(0));
    EXPECT_CALL(prober_mock_, probe("10.0.0.10", _, _))  //
        .WillOnce(prober_mock_.replyLater(scheduler_, false));

    EXPECT_THAT(emit(Event::Connected{7, 1000}), 0);
    EXPECT_THAT(emitRequest(7, "/wake nas"), 0);
    EXPECT_THAT(emit(Event::Disconnected{7}), 0);
    EXPECT_THAT(service->connectedClients(), 0U);

    // Verification still completes, but its report has nowhere to go.
    scheduler_.spinFor(10s);
    EXPECT_THAT(sent_, ElementsAre("7:1Magic packet is sent to 'nas'. Verifying in 5s..."));
    EXPECT_THAT(orchestrator_->pendingVerifications(), 0U);
}

TEST_F(TestChatService, send_failure_is_not_fatal)
{
    auto service = startService();

    EXPECT_CALL(server_pipe_mock_, send(1, _)).WillOnce(Return(EPIPE));

    EXPECT_THAT(emit(Event::Connected{1, 1000}), 0);
    EXPECT_THAT(emitRequest(1, "/help"), 0);
    EXPECT_THAT(service->connectedClients(), 1U);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
