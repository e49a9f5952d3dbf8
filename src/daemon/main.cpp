//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "setup_logging.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <grp.h>
#include <iostream>
#include <pwd.h>
#include <signal.h>  // NOLINT
#include <string>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace
{

constexpr const char* InitCompleteReport = "init_complete";
constexpr const char* PidFilePath        = "/var/run/wolbotd.pid";

/// `ping` is spawned through `PATH`, so an inherited one must not redirect it.
constexpr const char* SanitizedPath = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

extern "C" void onTerminationSignal(const int)
{
    g_running = 0;
}

void installSignalHandlers()
{
    struct sigaction on_term
    {};
    on_term.sa_handler = &onTerminationSignal;
    ::sigemptyset(&on_term.sa_mask);
    ::sigaction(SIGINT, &on_term, nullptr);
    ::sigaction(SIGTERM, &on_term, nullptr);
}

/// Reports `what` together with the current `errno` text, and terminates the process.
///
[[noreturn]] void failWithErrno(const int report_fd, const char* const what)
{
    const char* const err_txt = std::strerror(errno);
    writeString(report_fd, what);
    writeString(report_fd, ": ");
    writeString(report_fd, err_txt);
    ::exit(EXIT_FAILURE);
}

void closeInheritedDescriptors()
{
    rlimit files_limit{};
    if (::getrlimit(RLIMIT_NOFILE, &files_limit) != 0)
    {
        failWithErrno(STDERR_FILENO, "Failed to getrlimit(RLIMIT_NOFILE)");
    }
    for (int fd = STDERR_FILENO + 1; static_cast<rlim_t>(fd) < files_limit.rlim_cur; ++fd)
    {
        (void) ::close(fd);
    }
}

void sanitizeEnvironment(const int report_fd)
{
    if (::setenv("PATH", SanitizedPath, 1) != 0)
    {
        failWithErrno(report_fd, "Failed to set PATH");
    }
    (void) ::unsetenv("IFS");
    (void) ::unsetenv("LD_PRELOAD");
    (void) ::unsetenv("LD_LIBRARY_PATH");
}

void redirectStdioToDevNull(const int report_fd)
{
    const int null_fd = ::open("/dev/null", O_RDWR);  // NOLINT *-vararg
    if (null_fd == -1)
    {
        failWithErrno(report_fd, "Failed to open /dev/null");
    }
    for (const int std_fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO})
    {
        if (::dup2(null_fd, std_fd) == -1)
        {
            failWithErrno(report_fd, "Failed to redirect standard i/o");
        }
    }
    if (null_fd > STDERR_FILENO)
    {
        (void) ::close(null_fd);
    }
}

/// Creates and locks the PID file. The descriptor stays open (and so locked) for the daemon lifetime.
///
void writePidFile(const int report_fd)
{
    const int fd = ::open(PidFilePath, O_RDWR | O_CREAT | O_CLOEXEC, 0644);  // NOLINT *-vararg
    if (fd == -1)
    {
        failWithErrno(report_fd, "Failed to open PID file");
    }
    if (::lockf(fd, F_TLOCK, 0) == -1)
    {
        failWithErrno(report_fd, "Failed to lock PID file (is another wolbotd running?)");
    }
    if (::ftruncate(fd, 0) != 0)
    {
        failWithErrno(report_fd, "Failed to truncate PID file");
    }

    const auto pid_str = std::to_string(::getpid()) + "\n";
    if (!writeString(fd, pid_str.c_str()))
    {
        failWithErrno(report_fd, "Failed to write PID file");
    }
}

/// Blocks the original process until the daemon reports its init outcome, and exits accordingly.
///
[[noreturn]] void waitForDaemonReport(const int report_read_fd)
{
    std::string           report;
    std::array<char, 256> chunk{};  // NOLINT(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)
    while (true)
    {
        const auto res = ::read(report_read_fd, chunk.data(), chunk.size());
        if (res > 0)
        {
            report.append(chunk.data(), static_cast<std::size_t>(res));
            continue;
        }
        if ((res == -1) && (errno == EINTR))
        {
            continue;
        }
        if (res == -1)
        {
            failWithErrno(STDERR_FILENO, "Failed to read daemon report");
        }
        break;
    }
    (void) ::close(report_read_fd);

    if (report != InitCompleteReport)
    {
        std::cerr << "Daemon init failed: " << (report.empty() ? "no report" : report) << "\n";
        ::exit(EXIT_FAILURE);
    }
    ::exit(EXIT_SUCCESS);
}

/// Detaches from the terminal (double fork + new session), see `man 7 daemon`.
///
/// Returns the write end of the report pipe in the daemon process; the original process
/// never returns but exits with the outcome reported through that pipe.
///
int daemonize()
{
    closeInheritedDescriptors();
    installSignalHandlers();

    std::array<int, 2> report_pipe{-1, -1};
    if (::pipe(report_pipe.data()) == -1)
    {
        failWithErrno(STDERR_FILENO, "Failed to create report pipe");
    }
    const int report_read_fd  = report_pipe[0];
    const int report_write_fd = report_pipe[1];

    sanitizeEnvironment(STDERR_FILENO);

    const pid_t first_pid = ::fork();
    if (first_pid < 0)
    {
        failWithErrno(STDERR_FILENO, "Failed to fork");
    }
    if (first_pid > 0)
    {
        (void) ::close(report_write_fd);
        waitForDaemonReport(report_read_fd);
    }
    (void) ::close(report_read_fd);

    if (::setsid() < 0)
    {
        failWithErrno(report_write_fd, "Failed to setsid");
    }
    const pid_t second_pid = ::fork();
    if (second_pid < 0)
    {
        failWithErrno(report_write_fd, "Failed to fork again");
    }
    if (second_pid > 0)
    {
        ::_exit(EXIT_SUCCESS);
    }

    redirectStdioToDevNull(report_write_fd);
    ::umask(0);
    if (::chdir("/") != 0)
    {
        failWithErrno(report_write_fd, "Failed to chdir to /");
    }
    writePidFile(report_write_fd);

    return report_write_fd;
}

/// Switches to the given unprivileged user (its primary and supplementary groups included).
///
/// Must be called after everything that needs root (PID file, chat socket) is set up.
/// Returns a failure description, or nothing when the switch has happened (or was not possible to begin with).
///
cetl::optional<std::string> dropPrivileges(const std::string& user_name)
{
    if (::geteuid() != 0)
    {
        spdlog::warn("Not running as root - staying as uid={} instead of switching to user '{}'.",
                     ::geteuid(),
                     user_name);
        return cetl::nullopt;
    }

    errno                  = 0;
    const passwd* const pw = ::getpwnam(user_name.c_str());
    if (pw == nullptr)
    {
        const std::string reason = (errno != 0) ? std::strerror(errno) : "no such user";
        return "Unknown daemon user '" + user_name + "': " + reason + ".";
    }

    // Order matters: groups can't be changed anymore once the user id is not root.
    if (::initgroups(pw->pw_name, pw->pw_gid) != 0)
    {
        return std::string{"Failed to init groups of '"} + user_name + "': " + std::strerror(errno) + ".";
    }
    if (::setgid(pw->pw_gid) != 0)
    {
        return "Failed to set group id " + std::to_string(pw->pw_gid) + ": " + std::strerror(errno) + ".";
    }
    if (::setuid(pw->pw_uid) != 0)
    {
        return "Failed to set user id " + std::to_string(pw->pw_uid) + ": " + std::strerror(errno) + ".";
    }

    spdlog::info("Switched to user '{}' (uid={}, gid={}).", user_name, pw->pw_uid, pw->pw_gid);
    return cetl::nullopt;
}

wolbot::daemon::engine::Config::Ptr loadConfig(const int          report_fd,
                                               const bool         is_daemonized,
                                               const int          argc,
                                               const char** const argv)
{
    static const std::string config_file_arg = "CONFIG_FILE=";

    std::string config_path = std::string{is_daemonized ? "/etc/wolbotd/" : "./"} + "wolbotd.toml";
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg.compare(0, config_file_arg.size(), config_file_arg) == 0)
        {
            config_path = arg.substr(config_file_arg.size());
        }
    }

    try
    {
        return wolbot::daemon::engine::Config::make(config_path);

    } catch (const std::exception& ex)
    {
        const auto report = "Failed to load configuration file (path='" + config_path + "').\n" + ex.what();
        writeString(report_fd, report.c_str());
    }
    ::exit(EXIT_FAILURE);
}

void reportInitFailure(const int report_fd, const std::string& failure)
{
    spdlog::critical("Failed to init: {}", failure);
    writeString(report_fd, "Failed to init: ");
    writeString(report_fd, failure.c_str());
    ::exit(EXIT_FAILURE);
}

}  // namespace

int main(const int argc, const char** const argv)
{
    bool is_dev_mode = false;
    for (int i = 1; i < argc; ++i)
    {
        is_dev_mode = is_dev_mode || (::strcmp(argv[i], "--dev") == 0);  // NOLINT
    }

    // In dev mode the process stays in the foreground and reports straight to stderr.
    int report_fd = STDERR_FILENO;
    if (is_dev_mode)
    {
        installSignalHandlers();
    }
    else
    {
        report_fd = daemonize();
    }

    const auto config = loadConfig(report_fd, !is_dev_mode, argc, argv);
    setupLogging(report_fd, !is_dev_mode, argc, argv, config);

    spdlog::info("WOLBOTD started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        wolbot::daemon::engine::Engine engine{config};
        if (const auto failure = engine.init())
        {
            reportInitFailure(report_fd, *failure);
        }
        if (const auto daemon_user = config->getDaemonUser())
        {
            if (const auto failure = dropPrivileges(*daemon_user))
            {
                reportInitFailure(report_fd, *failure);
            }
        }

        if (!is_dev_mode)
        {
            // EOF right after the report lets the original process exit.
            writeString(report_fd, InitCompleteReport);
            (void) ::close(report_fd);
            report_fd = -1;
        }

        engine.runWhile([] { return g_running == 1; });

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }

    if (g_running == 0)
    {
        spdlog::debug("Received termination signal.");
    }
    spdlog::info("WOLBOTD terminated.");
    return result;
}
