//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "liveness_prober.hpp"

#include "io/io.hpp"
#include "logging.hpp"
#include "wolbot/platform/posix_executor_extension.hpp"
#include "wolbot/platform/posix_utils.hpp"

#include <cetl/cetl.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <spawn.h>
#include <string>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char** environ;  // NOLINT(*-avoid-non-const-global-variables)

namespace wolbot
{
namespace daemon
{
namespace engine
{
namespace wol
{

PingLivenessProber::PingLivenessProber(libcyphal::IExecutor& executor, Params params)
    : executor_{executor}
    , posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
    , params_{std::move(params)}
{
    CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");
}

PingLivenessProber::~PingLivenessProber()
{
    for (auto& id_and_op : id_to_op_)
    {
        killAndReap(*id_and_op.second);
    }
}

void PingLivenessProber::probe(const std::string& net_address, const std::chrono::seconds timeout, Handler handler)
{
    using Callback = libcyphal::IExecutor::Callback;

    const OpId op_id = ++next_op_id_;

    auto op     = std::make_unique<ProbeOp>();
    op->handler = std::move(handler);

    if (const auto err = spawnChild(net_address, timeout, *op))
    {
        logger_->warn("Failed to spawn '{}' to probe '{}' (op={}): {}.",
                      params_.program,
                      net_address,
                      op_id,
                      std::strerror(err));

        // Report "unreachable" from the executor, never from within this call.
        op->guard_callback = executor_.registerCallback([this, op_id](const auto&) {
            //
            complete(op_id, false);
        });
        (void) op->guard_callback.schedule(Callback::Schedule::Once{executor_.now()});

        id_to_op_.emplace(op_id, std::move(op));
        return;
    }
    logger_->debug("Probing '{}' (op={}, pid={}, timeout={}s).", net_address, op_id, op->pid, timeout.count());

    op->exit_callback = posix_executor_ext_->registerAwaitableCallback(  //
        [this, op_id](const auto&) {
            //
            handleChildExit(op_id);
        },
        platform::IPosixExecutorExtension::Trigger::Readable{op->pidfd.get()});

    op->guard_callback = executor_.registerCallback([this, op_id](const auto&) {
        //
        handleGuardTimeout(op_id);
    });
    (void) op->guard_callback.schedule(Callback::Schedule::Once{executor_.now() + timeout + params_.kill_grace});

    id_to_op_.emplace(op_id, std::move(op));
}

int PingLivenessProber::spawnChild(const std::string& net_address, const std::chrono::seconds timeout, ProbeOp& op)
{
    ::posix_spawn_file_actions_t file_actions{};
    if (const int err = ::posix_spawn_file_actions_init(&file_actions))
    {
        return err;
    }
    // The child must not write into our (possibly closed) stdio.
    int err = ::posix_spawn_file_actions_addopen(&file_actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    err     = (err != 0) ? err : ::posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    err     = (err != 0) ? err : ::posix_spawn_file_actions_addopen(&file_actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    if (err != 0)
    {
        (void) ::posix_spawn_file_actions_destroy(&file_actions);
        return err;
    }

    const std::string count_flag{"-c"};
    const std::string count{"1"};
    const std::string wait_flag{"-W"};
    const std::string wait_secs{std::to_string(std::max<std::chrono::seconds::rep>(1, timeout.count()))};

    // NOLINTBEGIN(*-const-cast)
    std::array<char*, 7> argv{const_cast<char*>(params_.program.c_str()),
                              const_cast<char*>(count_flag.c_str()),
                              const_cast<char*>(count.c_str()),
                              const_cast<char*>(wait_flag.c_str()),
                              const_cast<char*>(wait_secs.c_str()),
                              const_cast<char*>(net_address.c_str()),
                              nullptr};
    // NOLINTEND(*-const-cast)

    ::pid_t pid = -1;
    err         = ::posix_spawnp(&pid, params_.program.c_str(), &file_actions, nullptr, argv.data(), environ);
    (void) ::posix_spawn_file_actions_destroy(&file_actions);
    if (err != 0)
    {
        return err;
    }
    op.pid = pid;

    int pidfd = -1;
    if (const auto pidfd_err = platform::posixSyscallError([pid, &pidfd] {
            //
            return pidfd = static_cast<int>(::syscall(SYS_pidfd_open, pid, 0));
        }))
    {
        logger_->error("Failed to open process descriptor (pid={}): {}.", pid, std::strerror(pidfd_err));
        killAndReap(op);
        return pidfd_err;
    }
    op.pidfd = common::io::OwnFd{pidfd};

    return 0;
}

void PingLivenessProber::handleChildExit(const OpId op_id)
{
    const auto id_and_op = id_to_op_.find(op_id);
    if (id_and_op == id_to_op_.end())
    {
        return;
    }
    auto& op = *id_and_op->second;

    int     status = 0;
    ::pid_t reaped = 0;
    if (const auto err = platform::posixSyscallError([&op, &status, &reaped] {
            //
            return reaped = ::waitpid(op.pid, &status, WNOHANG);
        }))
    {
        logger_->warn("Failed to reap probe process (op={}, pid={}): {}.", op_id, op.pid, std::strerror(err));
        op.pid = -1;
        complete(op_id, false);
        return;
    }
    if (reaped == 0)
    {
        return;  // still running
    }
    op.pid = -1;

    const bool is_reachable = WIFEXITED(status) && (WEXITSTATUS(status) == 0);
    if (WIFEXITED(status))
    {
        logger_->trace("Probe process exited (op={}, status={}).", op_id, WEXITSTATUS(status));
    }
    else
    {
        logger_->debug("Probe process terminated abnormally (op={}, raw_status={}).", op_id, status);
    }
    complete(op_id, is_reachable);
}

void PingLivenessProber::handleGuardTimeout(const OpId op_id)
{
    const auto id_and_op = id_to_op_.find(op_id);
    if (id_and_op == id_to_op_.end())
    {
        return;
    }
    auto& op = *id_and_op->second;

    logger_->warn("Probe process is still running - killing it (op={}, pid={}).", op_id, op.pid);
    if (op.pid > 0)
    {
        // Exit of the killed child is reported through its process descriptor.
        if (::kill(op.pid, SIGKILL) != 0)
        {
            const auto err = errno;
            logger_->warn("Failed to kill probe process (op={}, pid={}): {}.", op_id, op.pid, std::strerror(err));
            complete(op_id, false);
        }
    }
}

void PingLivenessProber::complete(const OpId op_id, const bool is_reachable)
{
    const auto id_and_op = id_to_op_.find(op_id);
    if (id_and_op == id_to_op_.end())
    {
        return;
    }

    auto handler = std::move(id_and_op->second->handler);
    killAndReap(*id_and_op->second);
    id_to_op_.erase(id_and_op);

    if (handler)
    {
        handler(is_reachable);
    }
}

void PingLivenessProber::killAndReap(ProbeOp& op)
{
    if (op.pid <= 0)
    {
        return;
    }

    (void) ::kill(op.pid, SIGKILL);
    int        status = 0;
    const auto err    = platform::posixSyscallError([&op, &status] {
        //
        return ::waitpid(op.pid, &status, 0);
    });
    (void) err;
    op.pid = -1;
}

}  // namespace wol
}  // namespace engine
}  // namespace daemon
}  // namespace wolbot
