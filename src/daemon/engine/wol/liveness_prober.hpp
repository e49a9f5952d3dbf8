//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_WOL_LIVENESS_PROBER_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_WOL_LIVENESS_PROBER_HPP_INCLUDED

#include "io/io.hpp"
#include "logging.hpp"
#include "wolbot/platform/posix_executor_extension.hpp"

#include <libcyphal/executor.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <unordered_map>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

/// Asynchronous single-attempt reachability check of a network address.
///
class ILivenessProber
{
public:
    using Ptr     = std::unique_ptr<ILivenessProber>;
    using Handler = std::function<void(const bool is_reachable)>;

    ILivenessProber(const ILivenessProber&)                = delete;
    ILivenessProber(ILivenessProber&&) noexcept            = delete;
    ILivenessProber& operator=(const ILivenessProber&)     = delete;
    ILivenessProber& operator=(ILivenessProber&&) noexcept = delete;

    virtual ~ILivenessProber() = default;

    /// Starts a probe; the result is delivered to the handler later, from the executor.
    ///
    /// The handler is never called from within `probe` itself. Failure to perform the probe
    /// is reported as unreachable. Probes still pending at destruction of the prober are abandoned
    /// (their handlers are not called).
    ///
    virtual void probe(const std::string& net_address, const std::chrono::seconds timeout, Handler handler) = 0;

protected:
    ILivenessProber() = default;

};  // ILivenessProber

/// Probes liveness with the system `ping` utility (one echo request).
///
/// The child process is awaited through its process file descriptor, so the executor is never blocked.
/// A child which outlives the probe timeout (plus some grace period) is killed and reported as unreachable.
///
class PingLivenessProber final : public ILivenessProber
{
public:
    struct Params final
    {
        std::string          program{"ping"};
        std::chrono::seconds kill_grace{2};
    };

    PingLivenessProber(libcyphal::IExecutor& executor, Params params);

    PingLivenessProber(const PingLivenessProber&)                = delete;
    PingLivenessProber(PingLivenessProber&&) noexcept            = delete;
    PingLivenessProber& operator=(const PingLivenessProber&)     = delete;
    PingLivenessProber& operator=(PingLivenessProber&&) noexcept = delete;

    ~PingLivenessProber() override;

    void probe(const std::string& net_address, const std::chrono::seconds timeout, Handler handler) override;

    std::size_t pendingProbes() const noexcept
    {
        return id_to_op_.size();
    }

private:
    using OpId = std::uint64_t;

    struct ProbeOp final
    {
        ::pid_t                             pid{-1};
        common::io::OwnFd                   pidfd;
        Handler                             handler;
        libcyphal::IExecutor::Callback::Any exit_callback;
        libcyphal::IExecutor::Callback::Any guard_callback;
    };

    CETL_NODISCARD int spawnChild(const std::string& net_address, const std::chrono::seconds timeout, ProbeOp& op);
    void               handleChildExit(const OpId op_id);
    void               handleGuardTimeout(const OpId op_id);
    void               complete(const OpId op_id, const bool is_reachable);
    static void        killAndReap(ProbeOp& op);

    libcyphal::IExecutor&                                 executor_;
    platform::IPosixExecutorExtension* const              posix_executor_ext_;
    const Params                                          params_;
    OpId                                                  next_op_id_{0};
    std::unordered_map<OpId, std::unique_ptr<ProbeOp>>    id_to_op_;
    common::LoggerPtr                                     logger_{common::getLogger("wol")};

};  // PingLivenessProber

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_WOL_LIVENESS_PROBER_HPP_INCLUDED
