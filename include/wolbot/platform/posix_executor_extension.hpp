//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
#define WOLBOT_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

namespace wolbot
{
namespace platform
{

/// Extension of the executor which can await POSIX file descriptors.
///
/// Obtained from a `libcyphal::IExecutor` via `cetl::rtti_cast`.
///
class IPosixExecutorExtension
{
    // 5C0F8E41-2B7A-4D13-9E6F-0A84D2C7B316
    using TypeIdType = cetl::
        // NOLINTNEXTLINE(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
        type_id_type<0x5C, 0x0F, 0x8E, 0x41, 0x2B, 0x7A, 0x4D, 0x13, 0x9E, 0x6F, 0x0A, 0x84, 0xD2, 0xC7, 0xB3, 0x16>;

public:
    IPosixExecutorExtension(const IPosixExecutorExtension&)                = delete;
    IPosixExecutorExtension(IPosixExecutorExtension&&) noexcept            = delete;
    IPosixExecutorExtension& operator=(const IPosixExecutorExtension&)     = delete;
    IPosixExecutorExtension& operator=(IPosixExecutorExtension&&) noexcept = delete;

    struct Trigger
    {
        struct Readable
        {
            int fd;
        };
        struct Writable
        {
            int fd;
        };

        using Variant = cetl::variant<Readable, Writable>;
    };

    /// Registers a callback which is scheduled whenever the trigger's file descriptor becomes ready.
    ///
    /// The descriptor must stay open while the returned callback handle is alive.
    ///
    CETL_NODISCARD virtual libcyphal::IExecutor::Callback::Any registerAwaitableCallback(
        libcyphal::IExecutor::Callback::Function&& function,
        const Trigger::Variant&                    trigger) = 0;

    // MARK: RTTI

    static constexpr cetl::type_id _get_type_id_() noexcept
    {
        return cetl::type_id_type_value<TypeIdType>();
    }

protected:
    IPosixExecutorExtension()  = default;
    ~IPosixExecutorExtension() = default;

};  // IPosixExecutorExtension

}  // namespace platform
}  // namespace wolbot

#endif  // WOLBOT_PLATFORM_POSIX_EXECUTOR_EXTENSION_HPP_INCLUDED
