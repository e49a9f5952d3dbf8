//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "chat_command.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <sstream>
#include <string>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace chat
{

cetl::optional<ChatCommand::Var> ChatCommand::parse(const std::string& text)
{
    std::istringstream iss{text};

    std::string cmd;
    if (!(iss >> cmd))
    {
        return cetl::nullopt;
    }

    cetl::optional<std::string> device_name;
    std::string                 arg;
    if (iss >> arg)
    {
        device_name = arg;
    }

    if ((cmd == "/help") || (cmd == "/start"))
    {
        return Var{Help{}};
    }
    if (cmd == "/list")
    {
        return Var{List{}};
    }
    if (cmd == "/status_all")
    {
        return Var{StatusAll{}};
    }
    if (cmd == "/status")
    {
        return Var{Status{device_name}};
    }
    if (cmd == "/wake")
    {
        return Var{Wake{device_name}};
    }
    return cetl::nullopt;
}

}  // namespace chat
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
