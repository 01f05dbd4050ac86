/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/process_supervisor.h"

#include "Logging.h"
#include "lib/Popen.h"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/wait.h>

namespace adbcam::supervisor {
    namespace {
        constexpr std::chrono::milliseconds reap_poll_interval {10};

        enum class reap_result_t {
            still_running,
            reaped,
            gone,
        };

        /** Try to reap pid; on success stores the exit code */
        reap_result_t try_reap(pid_t pid, int & exit_code, bool block)
        {
            while (true) {
                int status = 0;
                auto const result = waitpid(pid, &status, (block ? 0 : WNOHANG));
                if (result == pid) {
                    exit_code = exit_code_from_wait_status(status);
                    return reap_result_t::reaped;
                }
                if (result == 0) {
                    return reap_result_t::still_running;
                }
                if (errno == EINTR) {
                    continue;
                }
                // ECHILD: someone else reaped it, the status is lost
                LOG_DEBUG("waitpid(%d) failed with errno=%d", pid, errno);
                return reap_result_t::gone;
            }
        }

        void signal_group(managed_process_t const & process, int signo)
        {
            // signal the whole group so that any helper the process spawned goes too
            if (kill(-process.pid, signo) == 0) {
                return;
            }
            auto const group_errno = errno;
            if ((kill(process.pid, signo) != 0) && (errno != ESRCH)) {
                LOG_WARNING("Failed to send signal %d to %s (pid %d): errno=%d",
                            signo,
                            process.name.c_str(),
                            process.pid,
                            errno);
            }
            else if (group_errno != ESRCH) {
                LOG_DEBUG("Group signal %d to %s failed with errno=%d", signo, process.name.c_str(), group_errno);
            }
        }
    }

    process_supervisor_t::~process_supervisor_t()
    {
        if (!processes.empty()) {
            (void) terminate_all(std::chrono::milliseconds::zero());
        }
    }

    bool process_supervisor_t::contains(std::string_view name) const
    {
        return std::any_of(processes.begin(), processes.end(), [name](auto const & p) { return p.name == name; });
    }

    lib::error_code_or_t<launched_process_t, launch_failure_t> process_supervisor_t::launch(
        std::string name,
        std::vector<std::string> const & argv)
    {
        if (argv.empty() || contains(name)) {
            return launch_failure_t {std::move(name),
                                     boost::system::errc::make_error_code(boost::system::errc::invalid_argument)};
        }

        auto result = lib::popen(argv);
        if (auto const * error = lib::get_error(result)) {
            LOG_ERROR("Failed to start %s (%s): %s", name.c_str(), argv.front().c_str(), error->message().c_str());
            return launch_failure_t {std::move(name), *error};
        }

        auto & popen_result = lib::get_value(result);

        LOG_INFO("Started %s (pid %d)", name.c_str(), popen_result.pid);

        processes.push_back(managed_process_t {name, popen_result.pid, process_state_t::running, 0});

        return launched_process_t {std::move(name),
                                   popen_result.pid,
                                   std::move(popen_result.out),
                                   std::move(popen_result.err)};
    }

    std::vector<exited_process_t> process_supervisor_t::poll_all()
    {
        std::vector<exited_process_t> exited {};

        for (auto it = processes.begin(); it != processes.end();) {
            int exit_code = -1;
            auto const result = try_reap(it->pid, exit_code, false);

            if (result == reap_result_t::still_running) {
                ++it;
                continue;
            }

            auto process = std::move(*it);
            it = processes.erase(it);

            if (result == reap_result_t::reaped) {
                process.state = process_state_t::exited;
                process.exit_code = exit_code;
            }
            else {
                process.state = process_state_t::unknown;
            }

            exited.push_back(exited_process_t {std::move(process), exit_code});
        }

        return exited;
    }

    termination_report_t process_supervisor_t::terminate_all(std::chrono::milliseconds grace_period)
    {
        termination_report_t report {};

        if (processes.empty()) {
            return report;
        }

        for (auto const & process : processes) {
            LOG_DEBUG("Sending SIGTERM to %s (pid %d)", process.name.c_str(), process.pid);
            signal_group(process, SIGTERM);
        }

        // one deadline shared by all processes, so the total wait is bounded by the grace period
        auto const deadline = std::chrono::steady_clock::now() + grace_period;
        auto pending = std::move(processes);
        processes.clear();

        while (true) {
            for (auto it = pending.begin(); it != pending.end();) {
                int exit_code = -1;
                if (try_reap(it->pid, exit_code, false) == reap_result_t::still_running) {
                    ++it;
                }
                else {
                    LOG_DEBUG("%s (pid %d) exited with code %d", it->name.c_str(), it->pid, exit_code);
                    report.n_graceful += 1;
                    it = pending.erase(it);
                }
            }

            if (pending.empty() || (std::chrono::steady_clock::now() >= deadline)) {
                break;
            }

            std::this_thread::sleep_for(reap_poll_interval);
        }

        for (auto const & process : pending) {
            LOG_WARNING("%s (pid %d) did not exit within the grace period; killing it",
                        process.name.c_str(),
                        process.pid);
            signal_group(process, SIGKILL);
            report.n_forced += 1;

            int exit_code = -1;
            (void) try_reap(process.pid, exit_code, true);
        }

        return report;
    }
}
