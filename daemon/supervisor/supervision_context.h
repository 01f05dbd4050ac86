/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "lib/Waiter.h"
#include "supervisor/cleanup_coordinator.h"
#include "supervisor/disconnection_signal.h"
#include "supervisor/host_resources.h"
#include "supervisor/line_classifier.h"
#include "supervisor/process_supervisor.h"
#include "supervisor/stream_monitor.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

namespace adbcam::supervisor {
    struct supervision_options_t {
        /** Executable name of the capture tool, terminated system wide during cleanup (empty to skip) */
        std::string capture_tool_signature {"scrcpy"};
        std::chrono::milliseconds grace_period {2000};
        /** Install the SIGINT/SIGTERM/SIGHUP handler */
        bool handle_os_signals {true};
        classifier_rules_t classifier_rules {classifier_rules_t::defaults()};
    };

    /**
     * Everything that lives for exactly one run: the I/O threads, the OS signal handler, the disconnection flag,
     * the process registry, the cleanup latch and the stream monitors.
     *
     * Destroying the context runs cleanup (if nothing else did) and then joins the I/O threads, so no monitor
     * outlives it.
     */
    class supervision_context_t {
    public:
        static constexpr std::size_t n_threads = 2;

        supervision_context_t(i_host_resources_t & host_resources, supervision_options_t options);

        supervision_context_t(supervision_context_t const &) = delete;
        supervision_context_t & operator=(supervision_context_t const &) = delete;
        supervision_context_t(supervision_context_t &&) = delete;
        supervision_context_t & operator=(supervision_context_t &&) = delete;

        ~supervision_context_t();

        /** Start one monitor for each output stream of a launched process; takes the read ends */
        void start_monitors(launched_process_t & process, line_observer_t const & observer);

        /** Record an operator interrupt and wake any wait_for */
        void request_interrupt(int signo);

        [[nodiscard]] bool is_interrupted() const noexcept { return interrupted.load(std::memory_order_acquire); }

        /** @return the signal that interrupted the run, if any */
        [[nodiscard]] std::optional<int> interrupt_signal() const;

        /**
         * Sleep for the given time, returning early if interrupted
         *
         * @return true if the full time elapsed
         */
        bool wait_for(std::chrono::milliseconds duration) const { return waiter.wait_for(duration); }

        /** Cancel the signal handler and any monitor still reading, then join the I/O threads. Idempotent. */
        void shutdown();

        /** @return true once every started monitor has finished */
        [[nodiscard]] bool all_monitors_complete() const;

        [[nodiscard]] disconnection_signal_t & disconnection_signal() noexcept { return disconnection; }
        [[nodiscard]] process_supervisor_t & supervisor() noexcept { return process_supervisor; }
        [[nodiscard]] cleanup_coordinator_t & cleanup_coordinator() noexcept { return coordinator; }
        [[nodiscard]] boost::asio::io_context & io_context() noexcept { return context; }
        [[nodiscard]] supervision_options_t const & options() const noexcept { return run_options; }

    private:
        supervision_options_t run_options;
        boost::asio::io_context context {int(n_threads)};
        std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard;
        boost::asio::signal_set signal_set {context};
        disconnection_signal_t disconnection {};
        process_supervisor_t process_supervisor {};
        cleanup_coordinator_t coordinator;
        lib::Waiter waiter {};
        std::atomic<bool> interrupted {false};
        std::atomic<int> interrupt_signo {0};
        mutable std::mutex monitors_mutex {};
        std::vector<std::shared_ptr<stream_monitor_t>> monitors {};
        boost::asio::thread_pool threads {n_threads};
        bool is_shut_down {false};

        void spawn_signal_handler();
        void run_io_context_loop(std::size_t thread_no) noexcept;
    };
}
