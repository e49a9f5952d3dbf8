//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_CHAT_AUTHORIZATION_GATE_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_CHAT_AUTHORIZATION_GATE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <utility>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace chat
{

/// Immutable allow-list of caller identities.
///
class AuthorizationGate final
{
public:
    using CallerId  = std::uint64_t;
    using AllowList = std::unordered_set<CallerId>;

    explicit AuthorizationGate(AllowList allow_list)
        : allow_list_{std::move(allow_list)}
    {
    }

    /// Callers without identity are always denied.
    bool check(const cetl::optional<CallerId>& caller_id) const
    {
        return caller_id.has_value() && (allow_list_.count(*caller_id) > 0);
    }

    std::size_t size() const noexcept
    {
        return allow_list_.size();
    }

private:
    const AllowList allow_list_;

};  // AuthorizationGate

}  // namespace chat
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_CHAT_AUTHORIZATION_GATE_HPP_INCLUDED
