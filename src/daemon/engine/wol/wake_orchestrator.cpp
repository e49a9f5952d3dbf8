//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "wake_orchestrator.hpp"

#include "broadcast_transmitter.hpp"
#include "device_registry.hpp"
#include "liveness_prober.hpp"
#include "logging.hpp"
#include "magic_packet.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <chrono>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

/// Detached sleep-then-probe-once unit of work of a single accepted wake request.
///
/// Owns private copies of everything it needs; the only way out is the event handler.
///
class WakeOrchestrator::VerificationTask final
{
public:
    VerificationTask(WakeOrchestrator&    orchestrator,
                     const TaskId         id,
                     const DeviceRecord&  record,
                     EventHandler&&       event_handler)
        : id_{id}
        , orchestrator_{orchestrator}
        , device_name_{record.name}
        , net_address_{record.net_address}
        , verify_timeout_{record.verify_timeout}
        , event_handler_{std::move(event_handler)}
    {
        logger().trace("WakeOrchestrator::VerificationTask (id={}, device='{}').", id_, device_name_);
    }

    ~VerificationTask()
    {
        logger().trace("WakeOrchestrator::~VerificationTask (id={}, device='{}').", id_, device_name_);
    }

    VerificationTask(const VerificationTask&)                = delete;
    VerificationTask(VerificationTask&&) noexcept            = delete;
    VerificationTask& operator=(const VerificationTask&)     = delete;
    VerificationTask& operator=(VerificationTask&&) noexcept = delete;

    void start()
    {
        using Callback = libcyphal::IExecutor::Callback;

        const auto deadline = orchestrator_.executor_.now() + verify_timeout_;
        logger().debug("Wake '{}' is verifying in {}s (task={}, state=Verifying).",
                       device_name_,
                       verify_timeout_.count(),
                       id_);

        sleep_callback_ = orchestrator_.executor_.registerCallback([this](const auto&) {
            //
            probe();
        });
        (void) sleep_callback_.schedule(Callback::Schedule::Once{deadline});
    }

private:
    common::Logger& logger() const
    {
        return *orchestrator_.logger_;
    }

    void probe()
    {
        logger().trace("Wake '{}' verification timeout elapsed - probing '{}' (task={}).",
                       device_name_,
                       net_address_,
                       id_);

        orchestrator_.prober_.probe(net_address_, orchestrator_.params_.probe_timeout, [this](const bool is_online) {
            //
            report(is_online);
        });
    }

    void report(const bool is_online)
    {
        logger().info("Wake '{}' verified: device is {} (task={}, state=Reported).",
                      device_name_,
                      is_online ? "online" : "offline",
                      id_);

        event_handler_(WakeEvent::Reported{device_name_, is_online});

        orchestrator_.releaseTaskBy(id_);
    }

    const TaskId                        id_;
    WakeOrchestrator&                   orchestrator_;
    const std::string                   device_name_;
    const std::string                   net_address_;
    const std::chrono::seconds          verify_timeout_;
    EventHandler                        event_handler_;
    libcyphal::IExecutor::Callback::Any sleep_callback_;

};  // VerificationTask

WakeOrchestrator::WakeOrchestrator(libcyphal::IExecutor&  executor,
                                   DeviceRegistry::Ptr    registry,
                                   IBroadcastTransmitter& transmitter,
                                   ILivenessProber&       prober,
                                   Params                 params)
    : executor_{executor}
    , registry_{std::move(registry)}
    , transmitter_{transmitter}
    , prober_{prober}
    , params_{std::move(params)}
{
    CETL_DEBUG_ASSERT(registry_, "");
}

WakeOrchestrator::~WakeOrchestrator()
{
    if (!id_to_task_.empty())
    {
        logger_->debug("Abandoning {} pending wake verification(s).", id_to_task_.size());
    }
}

void WakeOrchestrator::wake(const std::string& device_name, EventHandler event_handler)
{
    CETL_DEBUG_ASSERT(event_handler, "");

    logger_->trace("Wake '{}' is requested (state=Requested).", device_name);

    const auto* const record = registry_->find(device_name);
    if (record == nullptr)
    {
        logger_->info("Wake '{}' failed: device not found (state=Failed).", device_name);
        event_handler(WakeEvent::DeviceNotFound{device_name});
        return;
    }

    const auto packet = encodeMagicPacket(record->hw_address);
    logger_->trace("Wake '{}' packet is encoded (hw='{}', state=Encoded).", device_name, record->hw_address.toString());

    if (const auto err = transmitter_.send({packet.data(), packet.size()}, params_.interface_hint))
    {
        logger_->error("Wake '{}' failed to transmit (err={}, state=Failed): {}.",
                       device_name,
                       err,
                       std::strerror(err));
        event_handler(WakeEvent::TransmitFailed{device_name, err});
        return;
    }
    logger_->debug("Wake '{}' packet is transmitted (state=Transmitted).", device_name);

    event_handler(WakeEvent::Acknowledged{device_name, record->verify_timeout});
    logger_->trace("Wake '{}' is acknowledged (state=Acknowledged).", device_name);

    const TaskId task_id = ++next_task_id_;
    auto task = std::make_shared<VerificationTask>(*this, task_id, *record, std::move(event_handler));
    id_to_task_[task_id] = task;
    task->start();
}

void WakeOrchestrator::releaseTaskBy(const TaskId task_id)
{
    id_to_task_.erase(task_id);
}

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
