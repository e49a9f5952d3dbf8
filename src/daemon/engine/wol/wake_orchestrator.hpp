//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef WOLBOT_DAEMON_ENGINE_WOL_WAKE_ORCHESTRATOR_HPP_INCLUDED
#define WOLBOT_DAEMON_ENGINE_WOL_WAKE_ORCHESTRATOR_HPP_INCLUDED

#include "broadcast_transmitter.hpp"
#include "device_registry.hpp"
#include "liveness_prober.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

/// Outcomes of a wake request, in the order they may be delivered to the requester.
///
/// A request ends either with one of the failures (`DeviceNotFound`, `TransmitFailed`),
/// or with exactly one `Acknowledged` followed (after the verification timeout) by exactly one `Reported`.
///
struct WakeEvent final
{
    struct DeviceNotFound final
    {
        std::string device_name;
    };
    struct TransmitFailed final
    {
        std::string device_name;
        int         error_code;
    };
    struct Acknowledged final
    {
        std::string          device_name;
        std::chrono::seconds verify_timeout;
    };
    struct Reported final
    {
        std::string device_name;
        bool        is_online;
    };

    using Var = cetl::variant<DeviceNotFound, TransmitFailed, Acknowledged, Reported>;

};  // WakeEvent

/// Wakes devices up and verifies (once, after the device's timeout) whether they came online.
///
/// Verification runs on the executor in the background - `wake` returns right after the acknowledgment.
/// Concurrent wake requests (even for the same device) are fully independent of each other.
///
class WakeOrchestrator final
{
public:
    using EventHandler = std::function<void(const WakeEvent::Var&)>;

    struct Params final
    {
        cetl::optional<std::string> interface_hint;
        std::chrono::seconds        probe_timeout{1};
    };

    WakeOrchestrator(libcyphal::IExecutor&  executor,
                     DeviceRegistry::Ptr    registry,
                     IBroadcastTransmitter& transmitter,
                     ILivenessProber&       prober,
                     Params                 params);

    WakeOrchestrator(const WakeOrchestrator&)                = delete;
    WakeOrchestrator(WakeOrchestrator&&) noexcept            = delete;
    WakeOrchestrator& operator=(const WakeOrchestrator&)     = delete;
    WakeOrchestrator& operator=(WakeOrchestrator&&) noexcept = delete;

    ~WakeOrchestrator();

    void wake(const std::string& device_name, EventHandler event_handler);

    std::size_t pendingVerifications() const noexcept
    {
        return id_to_task_.size();
    }

private:
    class VerificationTask;
    using TaskId  = std::uint64_t;
    using TaskPtr = std::shared_ptr<VerificationTask>;

    void releaseTaskBy(const TaskId task_id);

    libcyphal::IExecutor&                   executor_;
    const DeviceRegistry::Ptr               registry_;
    IBroadcastTransmitter&                  transmitter_;
    ILivenessProber&                        prober_;
    const Params                            params_;
    TaskId                                  next_task_id_{0};
    std::unordered_map<TaskId, TaskPtr>     id_to_task_;
    common::LoggerPtr                       logger_{common::getLogger("wol")};

};  // WakeOrchestrator

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot

#endif  // WOLBOT_DAEMON_ENGINE_WOL_WAKE_ORCHESTRATOR_HPP_INCLUDED
