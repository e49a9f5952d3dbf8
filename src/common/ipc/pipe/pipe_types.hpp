//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IPC_PIPE_TYPES_HPP_INCLUDED
#define WOLBOT_COMMON_IPC_PIPE_TYPES_HPP_INCLUDED

#include <cetl/pf20/cetlpf.hpp>

#include <cstddef>
#include <cstdint>

namespace wolbot
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Message payload; a message may be sent as several fragments (f.e. reply flag and reply text).
using Payload  = cetl::span<const std::uint8_t>;
using Payloads = cetl::span<const Payload>;

/// Frame header which precedes every message payload on a pipe stream.
///
/// Both ends are on the same host, so the fields are in the native byte order.
///
struct MsgHeader final
{
    std::uint32_t signature{0};
    std::uint32_t payload_size{0};

};  // MsgHeader

constexpr std::uint32_t MsgSignature      = 0x424C4F57;  // 'WOLB'
constexpr std::size_t   MsgPayloadMaxSize = 1U << 16U;   // 64 KB - plenty for a chat message

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IPC_PIPE_TYPES_HPP_INCLUDED
