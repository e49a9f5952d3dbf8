//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_CHAT_COMMAND_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_CHAT_COMMAND_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace chat
{

struct ChatCommand final
{
    struct Help final
    {};
    struct List final
    {};
    struct StatusAll final
    {};
    struct Status final
    {
        cetl::optional<std::string> device_name;
    };
    struct Wake final
    {
        cetl::optional<std::string> device_name;
    };

    using Var = cetl::variant<Help, List, StatusAll, Status, Wake>;

    /// Parses whitespace separated command text, f.e. "/wake nas".
    ///
    /// @return `nullopt` for empty text or unknown command. Extra arguments are ignored.
    ///
    static cetl::optional<Var> parse(const std::string& text);

};  // ChatCommand

}  // namespace chat
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_CHAT_COMMAND_HPP_INCLUDED
