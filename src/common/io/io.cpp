//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io.hpp"

#include "logging.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <utility>

namespace wolbot
{
namespace common
{
namespace io
{

void OwnFd::reset() noexcept
{
    const int old_fd = std::exchange(fd_, -1);
    if (old_fd < 0)
    {
        return;
    }

    // No retry on `EINTR` - the descriptor is released by the kernel anyway.
    if (::close(old_fd) < 0)
    {
        const int err = errno;
        getLogger("io")->warn("Failed to close fd={}: {}.", old_fd, std::strerror(err));
    }
}

OwnFd::~OwnFd()
{
    reset();
}

}  // namespace io
}  // namespace common
}  // namespace wolbot
