//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "chat/command_dispatcher.hpp"

#include "chat/authorization_gate.hpp"
#include "chat/chat_wire.hpp"
#include "daemon/engine/wol/broadcast_transmitter_mock.hpp"
#include "daemon/engine/wol/liveness_prober_mock.hpp"
#include "virtual_time_scheduler.hpp"
#include "wol/device_registry.hpp"
#include "wol/liveness_prober.hpp"
#include "wol/wake_orchestrator.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace
{

using namespace wolbot::daemon::engine;  // NOLINT This our main concern here in the unit tests.

using chat::AuthorizationGate;
using chat::BotContext;
using chat::CommandDispatcher;
using wolbot::common::chat::Reply;
using wolbot::common::chat::ReplyKind;

using testing::_;
using testing::ElementsAre;
using testing::HasSubstr;
using testing::Invoke;
using testing::IsEmpty;
using testing::Return;
using testing::SizeIs;
using testing::StrictMock;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestCommandDispatcher : public testing::Test
{
protected:
    static constexpr AuthorizationGate::CallerId AllowedCaller = 1000;

    /// Replies in order of arrival; the final ones are prefixed with "F:", the others with "M:".
    struct RepliesTrace
    {
        std::vector<std::string> replies;

        CommandDispatcher::ReplyHandler handler()
        {
            return [this](const Reply& reply) {
                //
                replies.push_back(((reply.kind == ReplyKind::Final) ? "F:" : "M:") + reply.text);
            };
        }
    };

    void SetUp() override
    {
        makeDispatcher({
            {"nas", {"00:11:22:33:44:55", "10.0.0.10", "30"}},
            {"desktop", {"AA:BB:CC:DD:EE:FF", "10.0.0.20"}},
        });
    }

    void makeDispatcher(const wol::DeviceRegistry::RawEntries& raw_entries)
    {
        dispatcher_.reset();
        orchestrator_.reset();

        auto context = std::make_shared<const BotContext>(
            BotContext{AuthorizationGate{AuthorizationGate::AllowList{AllowedCaller}},
                       wol::DeviceRegistry::make(raw_entries),
                       std::chrono::seconds{1}});

        orchestrator_ = std::make_unique<wol::WakeOrchestrator>(scheduler_,
                                                                context->registry,
                                                                transmitter_mock_,
                                                                prober_mock_,
                                                                wol::WakeOrchestrator::Params{});
        dispatcher_   = std::make_unique<CommandDispatcher>(context, *orchestrator_, prober_mock_);
    }

    void dispatch(const cetl::optional<AuthorizationGate::CallerId> caller_id, const std::string& text)
    {
        dispatcher_->dispatch(caller_id, text, trace_.handler());
    }

    // NOLINTBEGIN
    wolbot::VirtualTimeScheduler              scheduler_{};
    StrictMock<wol::BroadcastTransmitterMock> transmitter_mock_;
    StrictMock<wol::LivenessProberMock>       prober_mock_;
    std::unique_ptr<wol::WakeOrchestrator>    orchestrator_;
    std::unique_ptr<CommandDispatcher>        dispatcher_;
    RepliesTrace                              trace_;
    // NOLINTEND
};

constexpr AuthorizationGate::CallerId TestCommandDispatcher::AllowedCaller;

// MARK: - Tests:

TEST_F(TestCommandDispatcher, unauthorized_callers_get_no_reply)
{
    // Strict mocks ensure that neither transmitter nor prober is touched.
    dispatch(cetl::nullopt, "/wake nas");
    dispatch(cetl::nullopt, "/help");
    dispatch(1001, "/wake nas");
    dispatch(1001, "/status_all");
    dispatch(0, "/list");
    scheduler_.spinFor(60s);

    EXPECT_THAT(trace_.replies, IsEmpty());
    EXPECT_THAT(orchestrator_->pendingVerifications(), 0U);
}

TEST_F(TestCommandDispatcher, unknown_commands_get_no_reply)
{
    dispatch(AllowedCaller, "");
    dispatch(AllowedCaller, "hello");
    dispatch(AllowedCaller, "/reboot nas");
    scheduler_.spinFor(1s);

    EXPECT_THAT(trace_.replies, IsEmpty());
}

TEST_F(TestCommandDispatcher, help)
{
    dispatch(AllowedCaller, "/help");
    dispatch(AllowedCaller, "/start");

    ASSERT_THAT(trace_.replies, SizeIs(2));
    EXPECT_THAT(trace_.replies[0], trace_.replies[1]);
    for (const auto* const cmd : {"/list", "/status <name>", "/status_all", "/wake <name>"})
    {
        EXPECT_THAT(trace_.replies[0], HasSubstr(cmd));
    }
}

TEST_F(TestCommandDispatcher, list)
{
    dispatch(AllowedCaller, "/list");
    EXPECT_THAT(trace_.replies, ElementsAre("F:Configured devices:\n- desktop\n- nas"));

    makeDispatcher({});
    trace_.replies.clear();
    dispatch(AllowedCaller, "/list");
    EXPECT_THAT(trace_.replies, ElementsAre("F:No devices are configured."));
}

TEST_F(TestCommandDispatcher, status)
{
    EXPECT_CALL(prober_mock_, probe("10.0.0.10", std::chrono::seconds{1}, _))  //
        .WillOnce(prober_mock_.replyLater(scheduler_, true));
    EXPECT_CALL(prober_mock_, probe("10.0.0.20", std::chrono::seconds{1}, _))  //
        .WillOnce(prober_mock_.replyLater(scheduler_, false));

    dispatch(AllowedCaller, "/status nas");
    dispatch(AllowedCaller, "/status desktop");
    dispatch(AllowedCaller, "/status printer");
    dispatch(AllowedCaller, "/status");

    // Usage and "not found" replies are immediate, probe results come from the executor.
    EXPECT_THAT(trace_.replies, ElementsAre("F:Device 'printer' is not found.", "F:Usage: /status <name>"));
    scheduler_.spinFor(1s);
    EXPECT_THAT(trace_.replies,
                ElementsAre("F:Device 'printer' is not found.",
                            "F:Usage: /status <name>",
                            "F:Device 'nas' is online.",
                            "F:Device 'desktop' is offline."));
}

TEST_F(TestCommandDispatcher, status_all)
{
    EXPECT_CALL(prober_mock_, probe("10.0.0.10", _, _)).WillOnce(prober_mock_.replyLater(scheduler_, false));
    EXPECT_CALL(prober_mock_, probe("10.0.0.20", _, _)).WillOnce(prober_mock_.replyLater(scheduler_, true));

    dispatch(AllowedCaller, "/status_all");
    EXPECT_THAT(trace_.replies, IsEmpty());

    scheduler_.spinFor(1s);
    EXPECT_THAT(trace_.replies, ElementsAre("F:Network status:\n- desktop: online\n- nas: offline"));
}

TEST_F(TestCommandDispatcher, status_all_without_devices)
{
    makeDispatcher({});

    dispatch(AllowedCaller, "/status_all");
    EXPECT_THAT(trace_.replies, ElementsAre("F:No devices are configured."));
}

TEST_F(TestCommandDispatcher, wake)
{
    EXPECT_CALL(transmitter_mock_, send(_, _)).WillOnce(Return(0));
    EXPECT_CALL(prober_mock_, probe("10.0.0.10", _, _)).WillOnce(prober_mock_.replyLater(scheduler_, true));

    dispatch(AllowedCaller, "/wake nas");
    EXPECT_THAT(trace_.replies, ElementsAre("M:Magic packet is sent to 'nas'. Verifying in 30s..."));

    scheduler_.spinFor(29s);
    EXPECT_THAT(trace_.replies, SizeIs(1));

    scheduler_.spinFor(1s);
    EXPECT_THAT(trace_.replies,
                ElementsAre("M:Magic packet is sent to 'nas'. Verifying in 30s...", "F:Device 'nas' is online now."));
}

TEST_F(TestCommandDispatcher, wake_still_not_responding)
{
    EXPECT_CALL(transmitter_mock_, send(_, _)).WillOnce(Return(0));
    EXPECT_CALL(prober_mock_, probe("10.0.0.20", _, _)).WillOnce(prober_mock_.replyLater(scheduler_, false));

    dispatch(AllowedCaller, "/wake desktop");
    scheduler_.spinFor(60s);

    EXPECT_THAT(trace_.replies,
                ElementsAre("M:Magic packet is sent to 'desktop'. Verifying in 30s...",
                            "F:Device 'desktop' is still not responding."));
}

TEST_F(TestCommandDispatcher, wake_failures)
{
    EXPECT_CALL(transmitter_mock_, send(_, _)).WillOnce(Return(ENETUNREACH));

    dispatch(AllowedCaller, "/wake");
    dispatch(AllowedCaller, "/wake printer");
    dispatch(AllowedCaller, "/wake nas");
    scheduler_.spinFor(60s);

    EXPECT_THAT(trace_.replies,
                ElementsAre("F:Usage: /wake <name>",
                            "F:Device 'printer' is not found.",
                            "F:Failed to send magic packet to 'nas': " + std::string{std::strerror(ENETUNREACH)} +
                                "."));
    EXPECT_THAT(orchestrator_->pendingVerifications(), 0U);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
