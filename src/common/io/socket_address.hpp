//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define WOLBOT_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <utility>

namespace wolbot
{
namespace common
{
namespace io
{

/// Unix domain stream socket address of the chat transport.
///
/// Two textual forms are accepted:
/// - `unix:<path>` - a socket file in the filesystem;
/// - `unix-abstract:<name>` - a name in the Linux abstract namespace (no file, vanishes with the socket).
///
/// Only Unix domain connections are supported b/c the caller identity is the peer's user id (`SO_PEERCRED`).
///
class SocketAddress final
{
public:
    static constexpr const char* PathScheme     = "unix:";
    static constexpr const char* AbstractScheme = "unix-abstract:";

    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    static ParseResult::Var parse(const std::string& str);

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    bool isAbstract() const noexcept
    {
        return (addr_len_ > sizeof(sa_family_t)) && (addr_.sun_path[0] == '\0');
    }

    std::string toString() const;

    /// Makes a new non-blocking (and close-on-exec) stream socket.
    SocketResult::Var socket() const;

    /// Binds the server socket, replacing a socket file left over by a previous run.
    int bind(const OwnFd& socket_fd) const;

    /// Starts connecting the client socket. `EAGAIN` means the server backlog is full.
    int connect(const OwnFd& socket_fd) const;

    /// Accepts a pending connection; `nullopt` if there is none (or it has failed).
    static cetl::optional<OwnFd> accept(const OwnFd& server_fd);

    /// Gets user id of the process on the other side of an accepted connection.
    static cetl::optional<std::uint64_t> peerUserId(const OwnFd& client_fd);

private:
    SocketAddress(const std::string& name, const bool is_abstract);

    sockaddr_un addr_;
    socklen_t   addr_len_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
