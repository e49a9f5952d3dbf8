//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_COMMON_IO_HPP_INCLUDED
#define WOLBOT_COMMON_IO_HPP_INCLUDED

#include <utility>

namespace wolbot
{
namespace common
{
namespace io
{

/// Sole owner of a POSIX file descriptor; closes it on destruction (or `reset`).
///
/// `-1` stands for "no descriptor".
///
class OwnFd final
{
public:
    OwnFd() = default;

    explicit OwnFd(const int fd) noexcept
        : fd_{fd}
    {
    }

    OwnFd(OwnFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)}
    {
    }

    OwnFd& operator=(OwnFd&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    OwnFd(const OwnFd&)            = delete;
    OwnFd& operator=(const OwnFd&) = delete;

    ~OwnFd();

    int get() const noexcept
    {
        return fd_;
    }

    /// Closes the owned descriptor (if any). A failed `close` is only logged.
    void reset() noexcept;

private:
    int fd_{-1};

};  // OwnFd

}  // namespace io
}  // namespace common
}  // namespace wolbot

#endif  // WOLBOT_COMMON_IO_HPP_INCLUDED
