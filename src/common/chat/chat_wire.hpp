//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_CHAT_WIRE_HPP_INCLUDED
#define WOLBOT_COMMON_CHAT_WIRE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace wolbot
{
namespace common
{
namespace chat
{

/// Payload layout of chat messages exchanged over an IPC pipe.
///
/// Request (client -> daemon): UTF-8 command text, f.e. "/wake nas".
/// Reply (daemon -> client): one `ReplyKind` byte followed by UTF-8 reply text.
///
enum class ReplyKind : std::uint8_t
{
    Final       = 0,
    MoreFollows = 1,

};  // ReplyKind

struct Reply final
{
    ReplyKind   kind;
    std::string text;

};  // Reply

using Bytes = cetl::span<const std::uint8_t>;

template <typename Action>
static int tryPerformOnSerializedRequest(const std::string& command_text, Action&& action)
{
    const std::array<Bytes, 1> payloads{
        Bytes{reinterpret_cast<const std::uint8_t*>(command_text.data()),  // NOLINT(*-reinterpret-cast)
              command_text.size()}};
    return std::forward<Action>(action)(cetl::span<const Bytes>{payloads.data(), payloads.size()});
}

template <typename Action>
static int tryPerformOnSerializedReply(const Reply& reply, Action&& action)
{
    const auto kind_byte = static_cast<std::uint8_t>(reply.kind);

    // Kind and text go out as two payload parts of the same framed message - no need to concatenate them.
    const std::array<Bytes, 2> payloads{
        Bytes{&kind_byte, 1},
        Bytes{reinterpret_cast<const std::uint8_t*>(reply.text.data()),  // NOLINT(*-reinterpret-cast)
              reply.text.size()}};
    return std::forward<Action>(action)(cetl::span<const Bytes>{payloads.data(), payloads.size()});
}

inline std::string deserializeRequest(const Bytes payload)
{
    return {reinterpret_cast<const char*>(payload.data()), payload.size()};  // NOLINT(*-reinterpret-cast)
}

inline cetl::optional<Reply> tryDeserializeReply(const Bytes payload)
{
    if (payload.empty())
    {
        return cetl::nullopt;
    }

    const auto kind_byte = payload.front();
    if (kind_byte > static_cast<std::uint8_t>(ReplyKind::MoreFollows))
    {
        return cetl::nullopt;
    }

    const auto text = payload.subspan(1);
    return Reply{static_cast<ReplyKind>(kind_byte),
                 {reinterpret_cast<const char*>(text.data()), text.size()}};  // NOLINT(*-reinterpret-cast)
}

}  // namespace chat
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_CHAT_WIRE_HPP_INCLUDED
