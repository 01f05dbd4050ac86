/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "ExitStatus.h"
#include "fake_host_resources.h"
#include "supervisor/supervision_context.h"
#include "supervisor/supervision_loop.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include <unistd.h>

using namespace adbcam::supervisor;
using adbcam::test::fake_host_resources_t;
using namespace std::chrono_literals;

namespace {
    std::vector<std::string> shell(std::string const & script)
    {
        return {"/bin/sh", "-c", script};
    }

    std::string const idle_script {"while :; do sleep 0.05; done"};
    std::string const graceful_script {"trap 'echo graceful-exit; exit 0' TERM; while :; do sleep 0.05; done"};

    supervision_options_t test_options()
    {
        supervision_options_t options {};
        options.capture_tool_signature = "adbcam-test-tool";
        options.grace_period = 1000ms;
        options.handle_os_signals = false;
        return options;
    }

    setup_preconditions_t all_ok()
    {
        setup_preconditions_t preconditions {};
        preconditions.device_reachable = true;
        preconditions.loopback_loaded = true;
        preconditions.audio_bridge_configured = true;
        preconditions.selection_valid = true;
        return preconditions;
    }

    capture_plan_t plan_for(std::vector<std::string> video, std::vector<std::string> audio)
    {
        capture_plan_t plan {};
        plan.video_command = std::move(video);
        plan.audio_command = std::move(audio);
        plan.settle_delay = 50ms;
        plan.poll_interval = 20ms;
        return plan;
    }

    struct line_log_t {
        std::mutex mutex {};
        std::vector<classified_line_t> lines {};

        line_observer_t observer()
        {
            return [this](classified_line_t const & line) {
                std::lock_guard<std::mutex> lock {mutex};
                lines.push_back(line);
            };
        }

        std::size_t count(std::string const & text)
        {
            std::lock_guard<std::mutex> lock {mutex};
            return std::size_t(
                std::count_if(lines.begin(), lines.end(), [&](auto const & line) { return line.text == text; }));
        }
    };

    struct started_flag_t : i_supervision_event_listener_t {
        std::atomic<int> n_started {0};
        void on_capture_started() override { n_started += 1; }
    };

    bool wait_for_monitors(supervision_context_t const & context)
    {
        auto const deadline = std::chrono::steady_clock::now() + 5s;
        while (!context.all_monitors_complete()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }
}

SCENARIO("the supervision loop shuts down when the device disconnects", "[unit][supervisor]")
{
    fake_host_resources_t host {};
    supervision_context_t context {host, test_options()};
    context.cleanup_coordinator().set_pipe_path("/tmp/adbcam_pipe");
    context.cleanup_coordinator().set_audio_module("17");

    GIVEN("a video process that reports a disconnect on stderr")
    {
        started_flag_t listener {};
        supervision_loop_t loop {
            context,
            all_ok(),
            plan_for(shell("echo 'INFO: starting'; echo 'WARN: Device disconnected' >&2; " + idle_script),
                     shell(idle_script)),
            {},
            &listener};

        WHEN("the loop runs")
        {
            auto const exit_code = loop.run();

            THEN("it shuts down cleanly because of the disconnection")
            {
                CHECK(exit_code == 0);
                CHECK(loop.state() == supervision_state_t::done);
                REQUIRE(loop.shutdown_reason().has_value());
                CHECK(*loop.shutdown_reason() == shutdown_reason_t::disconnected);
                CHECK(context.disconnection_signal().is_set());
                CHECK(listener.n_started.load() == 1);
            }

            THEN("every resource was released and both processes are gone")
            {
                CHECK(context.cleanup_coordinator().has_run());
                CHECK(host.calls()
                      == std::vector<std::string> {"unload-module 17",
                                                   "remove /tmp/adbcam_pipe",
                                                   "pkill adbcam-test-tool"});
                CHECK(context.supervisor().is_empty());
                auto const report = context.cleanup_coordinator().last_termination_report();
                CHECK(report.n_graceful + report.n_forced == 2);
            }
        }
    }
}

SCENARIO("the supervision loop handles a failed audio launch", "[unit][supervisor]")
{
    fake_host_resources_t host {};
    supervision_context_t context {host, test_options()};
    context.cleanup_coordinator().set_pipe_path("/tmp/adbcam_pipe");

    GIVEN("an audio command that cannot be executed")
    {
        supervision_loop_t loop {context,
                                 all_ok(),
                                 plan_for(shell(idle_script), {"/nonexistent/adbcam-capture-tool"})};

        WHEN("the loop runs")
        {
            auto const exit_code = loop.run();

            THEN("it fails with the launch exit code after stopping the video process")
            {
                CHECK(exit_code == LAUNCH_FAILED_EXIT_CODE);
                REQUIRE(loop.shutdown_reason().has_value());
                CHECK(*loop.shutdown_reason() == shutdown_reason_t::launch_failed);
                CHECK(context.cleanup_coordinator().has_run());
                CHECK(context.supervisor().is_empty());
                CHECK(context.cleanup_coordinator().last_termination_report().n_graceful == 1);
                CHECK(host.calls().front() == "remove /tmp/adbcam_pipe");
            }
        }
    }

    GIVEN("a video command that cannot be executed")
    {
        supervision_loop_t loop {context, all_ok(), plan_for({"/nonexistent/adbcam-capture-tool"}, shell(idle_script))};

        THEN("audio is never launched")
        {
            CHECK(loop.run() == LAUNCH_FAILED_EXIT_CODE);
            CHECK(context.cleanup_coordinator().last_termination_report().n_graceful == 0);
        }
    }
}

SCENARIO("the supervision loop stops on an operator interrupt", "[unit][supervisor]")
{
    fake_host_resources_t host {};
    supervision_context_t context {host, test_options()};
    line_log_t log {};

    GIVEN("two processes that exit gracefully on SIGTERM")
    {
        supervision_loop_t loop {context,
                                 all_ok(),
                                 plan_for(shell(graceful_script), shell(graceful_script)),
                                 log.observer()};

        WHEN("another thread interrupts the running loop")
        {
            std::thread interrupter {[&]() {
                auto const deadline = std::chrono::steady_clock::now() + 5s;
                while ((loop.state() != supervision_state_t::running)
                       && (std::chrono::steady_clock::now() < deadline)) {
                    std::this_thread::sleep_for(5ms);
                }
                // let the shells install their traps
                std::this_thread::sleep_for(200ms);
                context.request_interrupt(SIGINT);
            }};

            auto const exit_code = loop.run();
            interrupter.join();

            THEN("the loop shuts down cleanly and both processes exit within the grace period")
            {
                CHECK(exit_code == 0);
                REQUIRE(loop.shutdown_reason().has_value());
                CHECK(*loop.shutdown_reason() == shutdown_reason_t::interrupted);
                CHECK(context.interrupt_signal() == SIGINT);

                auto const report = context.cleanup_coordinator().last_termination_report();
                CHECK(report.n_graceful == 2);
                CHECK(report.n_forced == 0);

                REQUIRE(wait_for_monitors(context));
                CHECK(log.count("graceful-exit") == 2);
            }
        }
    }

    GIVEN("an interrupt that arrived during setup")
    {
        context.request_interrupt(SIGTERM);

        supervision_loop_t loop {context, all_ok(), plan_for(shell(idle_script), shell(idle_script))};

        THEN("nothing is launched and the shutdown is clean")
        {
            CHECK(loop.run() == 0);
            CHECK(*loop.shutdown_reason() == shutdown_reason_t::interrupted);
            CHECK(context.cleanup_coordinator().has_run());
            CHECK(context.cleanup_coordinator().last_termination_report().n_graceful == 0);
        }
    }
}

SCENARIO("the supervision loop stops on an operating system signal", "[unit][supervisor]")
{
    fake_host_resources_t host {};
    auto options = test_options();
    options.handle_os_signals = true;
    supervision_context_t context {host, options};

    GIVEN("two running processes")
    {
        supervision_loop_t loop {context, all_ok(), plan_for(shell(idle_script), shell(idle_script))};

        WHEN("SIGINT is raised twice while the loop is running")
        {
            std::thread sender {[&]() {
                auto const deadline = std::chrono::steady_clock::now() + 5s;
                while ((loop.state() != supervision_state_t::running)
                       && (std::chrono::steady_clock::now() < deadline)) {
                    std::this_thread::sleep_for(5ms);
                }
                ::kill(::getpid(), SIGINT);
                std::this_thread::sleep_for(50ms);
                // the handler re-arms, so the default disposition never applies
                ::kill(::getpid(), SIGINT);
            }};

            auto const exit_code = loop.run();
            sender.join();

            THEN("the loop shuts down cleanly on behalf of the signal")
            {
                CHECK(exit_code == 0);
                REQUIRE(loop.shutdown_reason().has_value());
                CHECK(*loop.shutdown_reason() == shutdown_reason_t::interrupted);
                CHECK(context.interrupt_signal() == SIGINT);
                CHECK(context.cleanup_coordinator().has_run());
                CHECK(context.supervisor().is_empty());
            }
        }
    }
}

SCENARIO("the supervision loop ends when every process has exited", "[unit][supervisor]")
{
    fake_host_resources_t host {};
    supervision_context_t context {host, test_options()};

    GIVEN("two processes that exit with code 3")
    {
        supervision_loop_t loop {context, all_ok(), plan_for(shell("exit 3"), shell("sleep 0.1; exit 3"))};

        WHEN("the loop runs")
        {
            auto const exit_code = loop.run();

            THEN("each exit is reported with its code and the loop stops")
            {
                CHECK(exit_code == 0);
                CHECK(*loop.shutdown_reason() == shutdown_reason_t::all_processes_exited);
                REQUIRE(loop.unexpected_exits().size() == 2);
                for (auto const & exited : loop.unexpected_exits()) {
                    CHECK(exited.exit_code == 3);
                }
                CHECK(context.cleanup_coordinator().has_run());
            }
        }
    }
}

SCENARIO("the supervision loop refuses to start without its preconditions", "[unit][supervisor]")
{
    fake_host_resources_t host {};
    supervision_context_t context {host, test_options()};

    auto preconditions = all_ok();
    auto const which = GENERATE(0, 1, 2, 3);
    switch (which) {
        case 0:
            preconditions.device_reachable = false;
            break;
        case 1:
            preconditions.loopback_loaded = false;
            break;
        case 2:
            preconditions.audio_bridge_configured = false;
            break;
        default:
            preconditions.selection_valid = false;
            break;
    }

    GIVEN("a missing precondition")
    {
        supervision_loop_t loop {context, preconditions, plan_for(shell(idle_script), shell(idle_script))};

        THEN("it fails without launching anything but still cleans up")
        {
            CHECK(loop.run() == PRECONDITION_FAILED_EXIT_CODE);
            CHECK(loop.state() == supervision_state_t::done);
            CHECK(*loop.shutdown_reason() == shutdown_reason_t::precondition_failed);
            CHECK(context.cleanup_coordinator().has_run());
            CHECK(context.cleanup_coordinator().last_termination_report().n_graceful == 0);
            CHECK(context.supervisor().is_empty());
        }
    }
}
