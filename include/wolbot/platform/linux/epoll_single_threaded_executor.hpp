//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
#define WOLBOT_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED

#include "wolbot/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/platform/single_threaded_executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <sys/epoll.h>
#include <unistd.h>
#include <utility>

namespace wolbot
{
namespace platform
{
namespace Linux
{

/// Single-threaded executor which awaits file descriptors with `epoll`.
///
/// Scheduled callbacks are executed by `spinOnce`; awaitable callbacks are scheduled by
/// `pollAwaitableResourcesFor` as soon as their descriptor becomes ready.
///
class EpollSingleThreadedExecutor final : public libcyphal::platform::SingleThreadedExecutor,
                                          public IPosixExecutorExtension
{
    using Base = SingleThreadedExecutor;
    using Self = EpollSingleThreadedExecutor;

public:
    EpollSingleThreadedExecutor()
        : epollfd_{::epoll_create1(EPOLL_CLOEXEC)}
        , total_awaitables_{0}
    {
        CETL_DEBUG_ASSERT(epollfd_ >= 0, "");
    }

    EpollSingleThreadedExecutor(const EpollSingleThreadedExecutor&)                = delete;
    EpollSingleThreadedExecutor(EpollSingleThreadedExecutor&&) noexcept            = delete;
    EpollSingleThreadedExecutor& operator=(const EpollSingleThreadedExecutor&)     = delete;
    EpollSingleThreadedExecutor& operator=(EpollSingleThreadedExecutor&&) noexcept = delete;

    ~EpollSingleThreadedExecutor() override
    {
        if (epollfd_ >= 0)
        {
            ::close(epollfd_);
        }
    }

    /// Waits (at most `timeout`, or forever if `nullopt`) for any awaitable descriptor to become ready,
    /// and schedules the corresponding callbacks for immediate execution.
    ///
    /// @return `errno` of a failed `epoll_wait`; an interrupted wait is not a failure.
    ///
    CETL_NODISCARD cetl::optional<int> pollAwaitableResourcesFor(
        const cetl::optional<libcyphal::Duration> timeout) const
    {
        int timeout_ms = -1;
        if (timeout)
        {
            // Round up to the next millisecond, so that we don't wake up too early and spin without progress.
            using MillisecondsD = std::chrono::duration<double, std::milli>;
            const auto timeout_ms_d = std::ceil(std::chrono::duration_cast<MillisecondsD>(*timeout).count());
            timeout_ms              = static_cast<int>(
                std::max(0.0, std::min(timeout_ms_d, static_cast<double>(std::numeric_limits<int>::max()))));
        }

        std::array<::epoll_event, MaxEvents> evs{};
        const int epoll_result = ::epoll_wait(epollfd_, evs.data(), static_cast<int>(evs.size()), timeout_ms);
        if (epoll_result < 0)
        {
            const auto err = errno;
            if (err == EINTR)
            {
                // Normally, we would just retry a system call (`epoll_wait`),
                // but we need updated timeout (from the main loop).
                return cetl::nullopt;
            }
            return err;
        }

        const auto approx_now = now();
        for (std::size_t index = 0; index < static_cast<std::size_t>(epoll_result); ++index)
        {
            const ::epoll_event& ev = evs[index];  // NOLINT(*-pro-bounds-constant-array-index)
            if (auto* const cb_node = static_cast<AwaitableNode*>(ev.data.ptr))
            {
                const bool is_scheduled = cb_node->schedule(Callback::Schedule::Once{approx_now});
                (void) is_scheduled;
            }
        }

        return cetl::nullopt;
    }

    std::size_t totalAwaitables() const noexcept
    {
        return total_awaitables_;
    }

    // MARK: - IExecutor

    CETL_NODISCARD libcyphal::TimePoint now() const noexcept override
    {
        const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return libcyphal::TimePoint{std::chrono::duration_cast<libcyphal::Duration>(since_epoch)};
    }

protected:
    class AwaitableNode final : public CallbackNode
    {
    public:
        AwaitableNode(Self& executor, Callback::Function&& function, const int fd, const std::uint32_t events)
            : CallbackNode{executor, std::move(function)}
            , executor_{&executor}
            , fd_{fd}
            , events_{events}
        {
            CETL_DEBUG_ASSERT(fd_ >= 0, "");
            CETL_DEBUG_ASSERT(events_ != 0, "");

            ::epoll_event ev{};
            ev.events   = events_;
            ev.data.ptr = this;
            if (::epoll_ctl(executor_->epollfd_, EPOLL_CTL_ADD, fd_, &ev) == 0)
            {
                ++executor_->total_awaitables_;
            }
            else
            {
                fd_ = -1;
            }
        }

        ~AwaitableNode()
        {
            if (fd_ >= 0)
            {
                ::epoll_event ev{};
                (void) ::epoll_ctl(executor_->epollfd_, EPOLL_CTL_DEL, fd_, &ev);
                --executor_->total_awaitables_;
            }
        }

        AwaitableNode(AwaitableNode&& other) noexcept
            : CallbackNode(std::move(static_cast<CallbackNode&&>(other)))
            , executor_{other.executor_}
            , fd_{std::exchange(other.fd_, -1)}
            , events_{std::exchange(other.events_, 0)}
        {
            // The node has moved - epoll must know its new address.
            if (fd_ >= 0)
            {
                ::epoll_event ev{};
                ev.events   = events_;
                ev.data.ptr = this;
                (void) ::epoll_ctl(executor_->epollfd_, EPOLL_CTL_MOD, fd_, &ev);
            }
        }

        AwaitableNode(const AwaitableNode&)                = delete;
        AwaitableNode& operator=(const AwaitableNode&)     = delete;
        AwaitableNode& operator=(AwaitableNode&&) noexcept = delete;

        bool isRegistered() const noexcept
        {
            return fd_ >= 0;
        }

    private:
        Self*         executor_;
        int           fd_;
        std::uint32_t events_;

    };  // AwaitableNode

    // MARK: - IPosixExecutorExtension

    CETL_NODISCARD Callback::Any registerAwaitableCallback(Callback::Function&& function,
                                                           const Trigger::Variant& trigger) override
    {
        const auto fd_and_events = cetl::visit(  //
            cetl::make_overloaded(
                [](const Trigger::Readable& readable) {
                    //
                    return std::make_pair(readable.fd, static_cast<std::uint32_t>(EPOLLIN));
                },
                [](const Trigger::Writable& writable) {
                    //
                    return std::make_pair(writable.fd, static_cast<std::uint32_t>(EPOLLOUT));
                }),
            trigger);

        AwaitableNode new_cb_node{*this, std::move(function), fd_and_events.first, fd_and_events.second};
        if (!new_cb_node.isRegistered())
        {
            return {};
        }
        insertCallbackNode(new_cb_node);
        return {std::move(new_cb_node)};
    }

    // MARK: RTTI

    CETL_NODISCARD void* _cast_(const cetl::type_id& id) & noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

    CETL_NODISCARD const void* _cast_(const cetl::type_id& id) const& noexcept override
    {
        if (id == IPosixExecutorExtension::_get_type_id_())
        {
            return static_cast<const IPosixExecutorExtension*>(this);
        }
        return Base::_cast_(id);
    }

private:
    static constexpr int MaxEvents = 16;

    int         epollfd_;
    std::size_t total_awaitables_;

};  // EpollSingleThreadedExecutor

}  // namespace Linux
}  // namespace platform
}  // namespace wolbot

#endif  // WOLBOT_PLATFORM_LINUX_EPOLL_SINGLE_THREADED_EXECUTOR_HPP_INCLUDED
