//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "broadcast_transmitter.hpp"

#include "io/io.hpp"
#include "logging.hpp"
#include "wolbot/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/pf20/cetlpf.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

constexpr std::uint16_t UdpBroadcastTransmitter::WolPort;

int UdpBroadcastTransmitter::send(const cetl::span<const std::uint8_t> payload,
                                  const cetl::optional<std::string>&   interface_hint)
{
    const auto logger = common::getLogger("wol");

    int raw_fd = -1;
    if (const auto err = platform::posixSyscallError([&raw_fd] {
            //
            return raw_fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
        }))
    {
        logger->error("Failed to create broadcast socket: {}.", std::strerror(err));
        return err;
    }
    const common::io::OwnFd socket_fd{raw_fd};

    // Without this permission the kernel rejects datagrams to a broadcast address.
    if (const auto err = platform::posixSyscallError([&socket_fd] {
            //
            constexpr int enable = 1;
            return ::setsockopt(socket_fd.get(), SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable));
        }))
    {
        logger->error("Failed to set socket SO_BROADCAST=1: {}.", std::strerror(err));
        return err;
    }

    if (interface_hint && !interface_hint->empty())
    {
        const auto& iface = *interface_hint;
        if (const auto err = platform::posixSyscallError([&socket_fd, &iface] {
                //
                return ::setsockopt(socket_fd.get(),
                                    SOL_SOCKET,
                                    SO_BINDTODEVICE,
                                    iface.c_str(),
                                    static_cast<socklen_t>(iface.size()));
            }))
        {
            logger->warn("Failed to bind broadcast socket to interface '{}' - sending unbound: {}.",
                         iface,
                         std::strerror(err));
        }
        else
        {
            logger->debug("Broadcast socket is bound to interface '{}'.", iface);
        }
    }

    ::sockaddr_in dst_addr{};
    dst_addr.sin_family      = AF_INET;
    dst_addr.sin_port        = htons(WolPort);
    dst_addr.sin_addr.s_addr = htonl(INADDR_BROADCAST);

    ssize_t sent = 0;
    if (const auto err = platform::posixSyscallError([&socket_fd, payload, &dst_addr, &sent] {
            //
            return sent = ::sendto(socket_fd.get(),
                                   payload.data(),
                                   payload.size(),
                                   0,
                                   // NOLINTNEXTLINE(*-reinterpret-cast)
                                   reinterpret_cast<const ::sockaddr*>(&dst_addr),
                                   sizeof(dst_addr));
        }))
    {
        logger->error("Failed to send broadcast datagram: {}.", std::strerror(err));
        return err;
    }
    if (static_cast<std::size_t>(sent) != payload.size())
    {
        logger->error("Broadcast datagram is truncated (sent={}, size={}).", sent, payload.size());
        return EIO;
    }

    logger->trace("Broadcast datagram is sent (size={}, port={}).", payload.size(), WolPort);
    return 0;
}

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
