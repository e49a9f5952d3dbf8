//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_address.hpp"

#include "io.hpp"
#include "logging.hpp"
#include "wolbot/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

namespace wolbot
{
namespace common
{
namespace io
{
namespace
{

constexpr std::size_t SunPathOffset = offsetof(sockaddr_un, sun_path);

bool startsWith(const std::string& str, const char* const prefix)
{
    return str.compare(0, std::strlen(prefix), prefix) == 0;
}

}  // namespace

constexpr const char* SocketAddress::PathScheme;
constexpr const char* SocketAddress::AbstractScheme;

SocketAddress::SocketAddress() noexcept
    : addr_{}
    , addr_len_{0}
{
}

SocketAddress::SocketAddress(const std::string& name, const bool is_abstract)
    : addr_{}
    , addr_len_{0}
{
    // Abstract names are prefixed with a null byte, while filesystem paths are null-terminated instead.
    const std::size_t name_offset = is_abstract ? 1 : 0;

    addr_.sun_family = AF_UNIX;
    // NOLINTNEXTLINE(*-pro-bounds-constant-array-index)
    std::memcpy(&addr_.sun_path[name_offset], name.data(), name.size());
    addr_len_ = static_cast<socklen_t>(SunPathOffset + name.size() + 1);
}

SocketAddress::ParseResult::Var SocketAddress::parse(const std::string& str)
{
    bool        is_abstract = false;
    std::string name;
    if (startsWith(str, AbstractScheme))
    {
        is_abstract = true;
        name        = str.substr(std::strlen(AbstractScheme));
    }
    else if (startsWith(str, PathScheme))
    {
        name = str.substr(std::strlen(PathScheme));
    }
    else
    {
        getLogger("io")->error("Unsupported socket address '{}' (expected '{}<path>' or '{}<name>').",
                               str,
                               PathScheme,
                               AbstractScheme);
        return EAFNOSUPPORT;
    }

    if (name.empty())
    {
        getLogger("io")->error("Socket address '{}' has no name.", str);
        return EINVAL;
    }
    // Either form takes one extra byte (the terminator or the abstract prefix).
    if ((name.size() + 1) > sizeof(sockaddr_un::sun_path))
    {
        getLogger("io")->error("Socket name is too long (addr='{}', max={}).",
                               str,
                               sizeof(sockaddr_un::sun_path) - 1);
        return ENAMETOOLONG;
    }

    return SocketAddress{name, is_abstract};
}

std::pair<const sockaddr*, socklen_t> SocketAddress::getRaw() const noexcept
{
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const sockaddr*>(&addr_), addr_len_};
}

std::string SocketAddress::toString() const
{
    if (addr_len_ <= SunPathOffset)
    {
        return PathScheme;  // unnamed
    }
    if (isAbstract())
    {
        // NOLINTNEXTLINE(*-pro-bounds-pointer-arithmetic, *-array-to-pointer-decay, *-no-array-decay)
        return AbstractScheme + std::string(addr_.sun_path + 1, addr_len_ - SunPathOffset - 1);
    }
    // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay)
    return PathScheme + std::string{addr_.sun_path};
}

SocketAddress::SocketResult::Var SocketAddress::socket() const
{
    int raw_fd = -1;
    if (const auto err = platform::posixSyscallError([&raw_fd] {
            //
            return raw_fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        }))
    {
        getLogger("io")->error("Failed to create unix socket for '{}': {}.", toString(), std::strerror(err));
        return err;
    }
    return OwnFd{raw_fd};
}

int SocketAddress::bind(const OwnFd& socket_fd) const
{
    CETL_DEBUG_ASSERT(socket_fd.get() != -1, "");

    const auto logger = getLogger("io");

    if (!isAbstract() && (addr_len_ > SunPathOffset))
    {
        // NOLINTNEXTLINE(*-array-to-pointer-decay, *-no-array-decay)
        if ((::unlink(addr_.sun_path) != 0) && (errno != ENOENT))
        {
            const int err = errno;
            logger->warn("Failed to remove stale socket file of '{}': {}.", toString(), std::strerror(err));
        }
    }

    const auto raw_addr = getRaw();
    const auto err      = platform::posixSyscallError([&socket_fd, &raw_addr] {
        //
        return ::bind(socket_fd.get(), raw_addr.first, raw_addr.second);
    });
    if (err != 0)
    {
        logger->error("Failed to bind socket to '{}': {}.", toString(), std::strerror(err));
    }
    return err;
}

int SocketAddress::connect(const OwnFd& socket_fd) const
{
    CETL_DEBUG_ASSERT(socket_fd.get() != -1, "");

    const auto raw_addr = getRaw();
    const auto err      = platform::posixSyscallError([&socket_fd, &raw_addr] {
        //
        return ::connect(socket_fd.get(), raw_addr.first, raw_addr.second);
    });
    if ((err != 0) && (err != EINPROGRESS))
    {
        getLogger("io")->error("Failed to connect to '{}': {}.", toString(), std::strerror(err));
        return err;
    }
    return 0;
}

cetl::optional<OwnFd> SocketAddress::accept(const OwnFd& server_fd)
{
    CETL_DEBUG_ASSERT(server_fd.get() != -1, "");

    while (true)
    {
        const int raw_fd = ::accept4(server_fd.get(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (raw_fd >= 0)
        {
            return OwnFd{raw_fd};
        }

        const int err = errno;
        if ((err == EINTR) || (err == ECONNABORTED))
        {
            // The peer has gone before its connection was taken - try the next one.
            continue;
        }
        if ((err != EAGAIN) && (err != EWOULDBLOCK))
        {
            getLogger("io")->warn("Failed to accept connection (fd={}): {}.", server_fd.get(), std::strerror(err));
        }
        return cetl::nullopt;
    }
}

cetl::optional<std::uint64_t> SocketAddress::peerUserId(const OwnFd& client_fd)
{
    ::ucred   peer_cred{};
    socklen_t peer_cred_len = sizeof(peer_cred);
    if (const auto err = platform::posixSyscallError([&client_fd, &peer_cred, &peer_cred_len] {
            //
            return ::getsockopt(client_fd.get(), SOL_SOCKET, SO_PEERCRED, &peer_cred, &peer_cred_len);
        }))
    {
        getLogger("io")->warn("Failed to get peer credentials (fd={}): {}.", client_fd.get(), std::strerror(err));
        return cetl::nullopt;
    }
    return static_cast<std::uint64_t>(peer_cred.uid);
}

}  // namespace io
}  // namespace common
}  // namespace wolbot
