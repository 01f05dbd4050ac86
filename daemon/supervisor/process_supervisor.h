/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "lib/AutoClosingFd.h"
#include "lib/error_code_or.hpp"
#include "supervisor/managed_process.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <boost/system/error_code.hpp>

namespace adbcam::supervisor {
    /** Why a process could not be launched */
    struct launch_failure_t {
        std::string name;
        boost::system::error_code error_code;
    };

    /** A successfully launched process, with the read ends of its output streams */
    struct launched_process_t {
        std::string name;
        pid_t pid;
        lib::AutoClosingFd stdout_read;
        lib::AutoClosingFd stderr_read;
    };

    /** A tracked process that was reaped */
    struct exited_process_t {
        managed_process_t process;
        int exit_code;
    };

    /** Outcome of terminate_all */
    struct termination_report_t {
        /** processes that exited within the grace period */
        std::size_t n_graceful {0};
        /** processes that had to be sent SIGKILL */
        std::size_t n_forced {0};
    };

    /**
     * Launches external processes and tracks them in launch order until they are reaped.
     *
     * Not thread safe; used by the supervision loop and the cleanup coordinator, which never run concurrently
     * on the same instance.
     */
    class process_supervisor_t {
    public:
        process_supervisor_t() = default;
        process_supervisor_t(process_supervisor_t const &) = delete;
        process_supervisor_t & operator=(process_supervisor_t const &) = delete;
        process_supervisor_t(process_supervisor_t &&) = delete;
        process_supervisor_t & operator=(process_supervisor_t &&) = delete;

        /** Kills anything still tracked */
        ~process_supervisor_t();

        /**
         * Start a process with its stdout and stderr captured
         *
         * @param name The unique logical name
         * @param argv The program (searched on PATH) and its arguments
         */
        [[nodiscard]] lib::error_code_or_t<launched_process_t, launch_failure_t> launch(
            std::string name,
            std::vector<std::string> const & argv);

        /** Reap, without blocking, every tracked process that has exited since the last call */
        [[nodiscard]] std::vector<exited_process_t> poll_all();

        /**
         * Send SIGTERM to the group of every tracked process, wait up to grace_period for them to exit, then SIGKILL
         * the rest. The registry is empty afterwards.
         */
        termination_report_t terminate_all(std::chrono::milliseconds grace_period);

        [[nodiscard]] bool is_empty() const noexcept { return processes.empty(); }
        [[nodiscard]] std::size_t size() const noexcept { return processes.size(); }
        [[nodiscard]] bool contains(std::string_view name) const;

    private:
        std::vector<managed_process_t> processes {};
    };
}
