/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/supervision_context.h"

#include "AdbCamException.h"
#include "Logging.h"

#include <algorithm>
#include <csignal>
#include <exception>
#include <string>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <sys/prctl.h>

namespace adbcam::supervisor {
    supervision_context_t::supervision_context_t(i_host_resources_t & host_resources, supervision_options_t options)
        : run_options(std::move(options)),
          work_guard(boost::asio::make_work_guard(context)),
          coordinator(process_supervisor,
                      host_resources,
                      run_options.capture_tool_signature,
                      run_options.grace_period)
    {
        if (run_options.handle_os_signals) {
            for (int signo : {SIGINT, SIGTERM, SIGHUP}) {
                boost::system::error_code ec {};
                signal_set.add(signo, ec);
                if (ec) {
                    throw AdbCamException("Could not install the handler for signal " + std::to_string(signo) + ": "
                                          + ec.message());
                }
            }
            spawn_signal_handler();
        }

        for (std::size_t i = 0; i < n_threads; ++i) {
            boost::asio::post(threads, [this, i]() { run_io_context_loop(i); });
        }
    }

    supervision_context_t::~supervision_context_t()
    {
        try {
            coordinator.cleanup();
        }
        catch (std::exception const & ex) {
            LOG_ERROR("Cleanup failed during teardown: %s", ex.what());
        }
        shutdown();
    }

    void supervision_context_t::spawn_signal_handler()
    {
        signal_set.async_wait([this](boost::system::error_code const & ec, int signo) {
            if (ec) {
                if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR("Signal handler failed: %s", ec.message().c_str());
                }
                return;
            }

            request_interrupt(signo);

            // keep listening so that repeated Ctrl-C does not fall back to the default disposition
            spawn_signal_handler();
        });
    }

    void supervision_context_t::run_io_context_loop(std::size_t thread_no) noexcept
    {
        LOG_DEBUG("Launched worker thread %zu", thread_no);

        std::string const comm_str = "adbcam-iocx-" + std::to_string(thread_no);
        prctl(PR_SET_NAME, reinterpret_cast<unsigned long>(comm_str.c_str()), 0, 0, 0);

        // spin the io_context
        try {
            context.run();
        }
        catch (std::exception const & ex) {
            LOG_ERROR("Worker thread %zu failed: %s", thread_no, ex.what());
            request_interrupt(0);
        }
    }

    void supervision_context_t::start_monitors(launched_process_t & process, line_observer_t const & observer)
    {
        auto stdout_monitor = std::make_shared<stream_monitor_t>(context,
                                                                 process.name,
                                                                 stream_kind_t::stdout_stream,
                                                                 std::move(process.stdout_read),
                                                                 disconnection,
                                                                 run_options.classifier_rules,
                                                                 observer);
        auto stderr_monitor = std::make_shared<stream_monitor_t>(context,
                                                                 process.name,
                                                                 stream_kind_t::stderr_stream,
                                                                 std::move(process.stderr_read),
                                                                 disconnection,
                                                                 run_options.classifier_rules,
                                                                 observer);

        {
            std::lock_guard<std::mutex> lock {monitors_mutex};
            monitors.push_back(stdout_monitor);
            monitors.push_back(stderr_monitor);
        }

        stdout_monitor->start();
        stderr_monitor->start();
    }

    void supervision_context_t::request_interrupt(int signo)
    {
        interrupt_signo.store(signo, std::memory_order_release);
        if (!interrupted.exchange(true, std::memory_order_acq_rel)) {
            if (signo != 0) {
                LOG_INFO("Received signal %d, shutting down...", signo);
            }
            else {
                LOG_INFO("Shutting down...");
            }
        }
        waiter.disable();
    }

    std::optional<int> supervision_context_t::interrupt_signal() const
    {
        if (!is_interrupted()) {
            return std::nullopt;
        }
        return interrupt_signo.load(std::memory_order_acquire);
    }

    bool supervision_context_t::all_monitors_complete() const
    {
        std::lock_guard<std::mutex> lock {monitors_mutex};
        return std::all_of(monitors.begin(), monitors.end(), [](auto const & m) { return m->is_complete(); });
    }

    void supervision_context_t::shutdown()
    {
        if (is_shut_down) {
            return;
        }
        is_shut_down = true;

        LOG_DEBUG("Join requested");

        boost::system::error_code ec {};
        signal_set.cancel(ec);
        if (ec) {
            LOG_DEBUG("Cancelling the signal handler failed: %s", ec.message().c_str());
        }

        {
            std::lock_guard<std::mutex> lock {monitors_mutex};
            for (auto const & monitor : monitors) {
                monitor->cancel();
            }
        }

        // io_context.run returns once the cancelled operations drain
        work_guard.reset();
        threads.join();

        {
            std::lock_guard<std::mutex> lock {monitors_mutex};
            monitors.clear();
        }

        LOG_DEBUG("Join completed");
    }
}
