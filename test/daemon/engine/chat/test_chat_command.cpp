//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "chat/chat_command.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

namespace
{

using namespace wolbot::daemon::engine::chat;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::Eq;
using testing::Field;
using testing::Optional;
using testing::VariantWith;

class TestChatCommand : public testing::Test
{
protected:
    template <typename Command>
    static cetl::optional<std::string> deviceNameOf(const std::string& text)
    {
        const auto command = ChatCommand::parse(text);
        EXPECT_TRUE(command.has_value()) << "text='" << text << "'";
        if (!command)
        {
            return cetl::nullopt;
        }
        const auto* const cmd = cetl::get_if<Command>(&*command);
        EXPECT_TRUE(cmd != nullptr) << "text='" << text << "'";
        return (cmd != nullptr) ? cmd->device_name : cetl::nullopt;
    }
};

// MARK: - Tests:

TEST_F(TestChatCommand, parse_simple_commands)
{
    EXPECT_THAT(ChatCommand::parse("/help"), Optional(VariantWith<ChatCommand::Help>(_)));
    EXPECT_THAT(ChatCommand::parse("/start"), Optional(VariantWith<ChatCommand::Help>(_)));
    EXPECT_THAT(ChatCommand::parse("/list"), Optional(VariantWith<ChatCommand::List>(_)));
    EXPECT_THAT(ChatCommand::parse("/status_all"), Optional(VariantWith<ChatCommand::StatusAll>(_)));

    // Surrounding whitespace and extra arguments do not matter.
    EXPECT_THAT(ChatCommand::parse("  /list  "), Optional(VariantWith<ChatCommand::List>(_)));
    EXPECT_THAT(ChatCommand::parse("/help me please"), Optional(VariantWith<ChatCommand::Help>(_)));
}

TEST_F(TestChatCommand, parse_commands_with_device_name)
{
    EXPECT_THAT(deviceNameOf<ChatCommand::Wake>("/wake nas"), Optional(Eq(std::string{"nas"})));
    EXPECT_THAT(deviceNameOf<ChatCommand::Wake>("/wake\tnas extra"), Optional(Eq(std::string{"nas"})));
    EXPECT_THAT(deviceNameOf<ChatCommand::Status>("/status  desktop"), Optional(Eq(std::string{"desktop"})));

    EXPECT_FALSE(deviceNameOf<ChatCommand::Wake>("/wake").has_value());
    EXPECT_FALSE(deviceNameOf<ChatCommand::Status>("/status   ").has_value());
}

TEST_F(TestChatCommand, parse_unknown)
{
    EXPECT_FALSE(ChatCommand::parse("").has_value());
    EXPECT_FALSE(ChatCommand::parse("   ").has_value());
    EXPECT_FALSE(ChatCommand::parse("hello").has_value());
    EXPECT_FALSE(ChatCommand::parse("/reboot nas").has_value());

    // Commands are case-sensitive and must be the first word.
    EXPECT_FALSE(ChatCommand::parse("/WAKE nas").has_value());
    EXPECT_FALSE(ChatCommand::parse("please /wake nas").has_value());
    EXPECT_FALSE(ChatCommand::parse("/wakenas").has_value());
}

}  // namespace
