//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "setup_logging.hpp"

#include "chat/chat_wire.hpp"
#include "io/socket_address.hpp"
#include "ipc/pipe/client_pipe.hpp"
#include "ipc/pipe/socket_client.hpp"

#include <wolbot/platform/defines.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <signal.h>  // NOLINT
#include <string>
#include <utility>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGINT:
    case SIGTERM:
        g_running = 0;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

/// Joins all non-logging arguments into the command text, f.e. `wolbot /wake nas` -> "/wake nas".
///
std::string makeCommandText(const int argc, const char** const argv)
{
    static const std::string spdlog_prefix = "SPDLOG_";

    std::string text;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, spdlog_prefix.size(), spdlog_prefix))
        {
            continue;
        }
        if (!text.empty())
        {
            text += ' ';
        }
        text += arg_str;
    }
    return text;
}

std::chrono::seconds getReplyTimeout()
{
    constexpr long default_secs = 300;

    if (const auto* const env_timeout_str = std::getenv("WOLBOT_TIMEOUT"))
    {
        char*      end  = nullptr;
        const auto secs = std::strtol(env_timeout_str, &end, 10);
        if ((end != env_timeout_str) && (*end == '\0') && (secs > 0))
        {
            return std::chrono::seconds{secs};
        }
        spdlog::warn("Ignoring invalid WOLBOT_TIMEOUT='{}'.", env_timeout_str);
    }
    return std::chrono::seconds{default_secs};
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using Executor    = wolbot::platform::SingleThreadedExecutor;
    using ClientPipe  = wolbot::common::ipc::pipe::ClientPipe;
    using ParseResult = wolbot::common::io::SocketAddress::ParseResult;
    namespace chat    = wolbot::common::chat;

    setupSignalHandlers();
    setupLogging(argc, argv);

    const auto command_text = makeCommandText(argc, argv);
    if (command_text.empty())
    {
        std::cerr << "Usage: wolbot <command> [<device>]\n"
                     "Try `wolbot /help` for the list of commands.\n";
        return EXIT_FAILURE;
    }

    spdlog::info("WOLBOT client started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_FAILURE;
    try
    {
        Executor executor;

        std::string ipc_connection = "unix:/var/run/wolbotd/wolbotd.sock";
        if (const auto* const env_connection_str = std::getenv("WOLBOT_CONNECTION"))
        {
            ipc_connection = env_connection_str;
        }

        auto maybe_socket_address = wolbot::common::io::SocketAddress::parse(ipc_connection);
        if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
        {
            spdlog::critical("Invalid connection '{}': {}.", ipc_connection, std::strerror(*err));
            std::cerr << "Invalid connection '" << ipc_connection << "'.\n";
            return EXIT_FAILURE;
        }
        const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);

        bool is_done        = false;
        bool got_final      = false;
        auto client_pipe    = std::make_unique<wolbot::common::ipc::pipe::SocketClient>(executor, socket_address);
        auto& client_pipe_r = *client_pipe;

        const int start_err = client_pipe->start([&](const ClientPipe::Event::Var& event_var) {
            //
            return cetl::visit(  //
                cetl::make_overloaded(
                    [&](const ClientPipe::Event::Connected&) {
                        spdlog::debug("Connected to '{}' - sending '{}'.", ipc_connection, command_text);
                        const int err = chat::tryPerformOnSerializedRequest(command_text, [&](const auto payloads) {
                            //
                            return client_pipe_r.send(payloads);
                        });
                        if (err != 0)
                        {
                            spdlog::error("Failed to send command: {}.", std::strerror(err));
                            std::cerr << "Failed to send command: " << std::strerror(err) << "\n";
                            is_done = true;
                        }
                        return err;
                    },
                    [&](const ClientPipe::Event::Message& message) {
                        const auto reply = chat::tryDeserializeReply(message.payload);
                        if (!reply)
                        {
                            spdlog::warn("Ignoring malformed reply (size={}).", message.payload.size());
                            return 0;
                        }
                        std::cout << reply->text << std::endl;
                        if (reply->kind == chat::ReplyKind::Final)
                        {
                            got_final = true;
                            is_done   = true;
                        }
                        return 0;
                    },
                    [&](const ClientPipe::Event::Disconnected& disconnected) {
                        if (disconnected.error != 0)
                        {
                            std::cerr << "Connection to '" << ipc_connection
                                      << "' has failed: " << std::strerror(disconnected.error) << "\n";
                        }
                        else if (!got_final)
                        {
                            std::cerr << "Connection to '" << ipc_connection << "' is closed.\n";
                        }
                        is_done = true;
                        return 0;
                    }),
                event_var);
        });
        if (start_err != 0)
        {
            std::cerr << "Failed to connect to '" << ipc_connection << "': " << std::strerror(start_err) << "\n";
            return EXIT_FAILURE;
        }

        const auto deadline = executor.now() + getReplyTimeout();
        wolbot::platform::waitPollingUntil(executor, [&] {
            //
            return is_done || (g_running == 0) || (executor.now() >= deadline);
        });

        if (got_final)
        {
            result = EXIT_SUCCESS;
        }
        else if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }
        else if (!is_done)
        {
            spdlog::warn("No final reply within the timeout.");
            std::cerr << "No reply from the daemon.\n";
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("WOLBOT client terminated.");

    return result;
}
