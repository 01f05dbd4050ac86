/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/process_supervisor.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <boost/system/error_code.hpp>
#include <catch2/catch.hpp>

#include <csignal>

using namespace adbcam::supervisor;
using namespace std::chrono_literals;

namespace {
    std::vector<std::string> shell(std::string const & script)
    {
        return {"/bin/sh", "-c", script};
    }

    /** Ignores SIGTERM (as do the sleeps it spawns) so only SIGKILL stops it */
    std::string const stubborn_script {"trap '' TERM; while :; do sleep 0.05; done"};

    std::vector<exited_process_t> poll_until_exited(process_supervisor_t & supervisor, std::size_t count)
    {
        std::vector<exited_process_t> result {};
        auto const deadline = std::chrono::steady_clock::now() + 5s;
        while ((result.size() < count) && (std::chrono::steady_clock::now() < deadline)) {
            for (auto & exited : supervisor.poll_all()) {
                result.push_back(std::move(exited));
            }
            std::this_thread::sleep_for(10ms);
        }
        return result;
    }
}

TEST_CASE("exit_code_from_wait_status", "[unit][supervisor]")
{
    CHECK(exit_code_from_wait_status(0) == 0);
    CHECK(exit_code_from_wait_status(3 << 8) == 3);
    CHECK(exit_code_from_wait_status(SIGKILL) == 128 + SIGKILL);
}

SCENARIO("process_supervisor_t launches and tracks processes", "[unit][supervisor]")
{
    process_supervisor_t supervisor {};

    GIVEN("a program that does not exist")
    {
        auto result = supervisor.launch("video", {"/nonexistent/adbcam-test-tool"});

        THEN("the launch fails synchronously with the exec error")
        {
            auto const * failure = lib::get_error(result);
            REQUIRE(failure != nullptr);
            CHECK(failure->name == "video");
            CHECK(failure->error_code == boost::system::errc::no_such_file_or_directory);
            CHECK(supervisor.is_empty());
        }
    }

    GIVEN("an empty command")
    {
        auto result = supervisor.launch("video", {});

        THEN("it is rejected")
        {
            auto const * failure = lib::get_error(result);
            REQUIRE(failure != nullptr);
            CHECK(failure->error_code == boost::system::errc::invalid_argument);
        }
    }

    GIVEN("a running process")
    {
        auto first = supervisor.launch("video", shell(stubborn_script));
        REQUIRE(lib::get_error(first) == nullptr);

        THEN("it is tracked by name")
        {
            CHECK(supervisor.size() == 1);
            CHECK(supervisor.contains("video"));
            CHECK_FALSE(supervisor.contains("audio"));
            CHECK(bool(lib::get_value(first).stdout_read));
            CHECK(bool(lib::get_value(first).stderr_read));
        }

        WHEN("a second process with the same name is launched")
        {
            auto second = supervisor.launch("video", shell("exit 0"));

            THEN("it is rejected and the registry is unchanged")
            {
                REQUIRE(lib::get_error(second) != nullptr);
                CHECK(supervisor.size() == 1);
            }
        }

        WHEN("it is polled")
        {
            auto const exited = supervisor.poll_all();

            THEN("nothing is reported")
            {
                CHECK(exited.empty());
                CHECK(supervisor.size() == 1);
            }
        }

        (void) supervisor.terminate_all(0ms);
    }

    GIVEN("processes that exit on their own")
    {
        REQUIRE(lib::get_error(supervisor.launch("video", shell("exit 3"))) == nullptr);
        REQUIRE(lib::get_error(supervisor.launch("audio", shell("kill -9 $$"))) == nullptr);

        WHEN("they are polled until both have gone")
        {
            auto const exited = poll_until_exited(supervisor, 2);

            THEN("each is reported once with its exit code and the registry empties")
            {
                REQUIRE(exited.size() == 2);
                for (auto const & e : exited) {
                    CHECK(e.process.state == process_state_t::exited);
                    if (e.process.name == "video") {
                        CHECK(e.exit_code == 3);
                    }
                    else {
                        CHECK(e.process.name == "audio");
                        CHECK(e.exit_code == 128 + SIGKILL);
                    }
                }
                CHECK(supervisor.is_empty());
                CHECK(supervisor.poll_all().empty());
            }
        }
    }
}

SCENARIO("process_supervisor_t terminates everything it tracks", "[unit][supervisor]")
{
    process_supervisor_t supervisor {};

    GIVEN("an empty registry")
    {
        THEN("terminate_all is a no-op")
        {
            auto const report = supervisor.terminate_all(100ms);
            CHECK(report.n_graceful == 0);
            CHECK(report.n_forced == 0);
        }
    }

    GIVEN("K processes of which J ignore SIGTERM")
    {
        REQUIRE(lib::get_error(supervisor.launch("p1", shell("sleep 30"))) == nullptr);
        REQUIRE(lib::get_error(supervisor.launch("p2", shell(stubborn_script))) == nullptr);
        REQUIRE(lib::get_error(supervisor.launch("p3", shell("sleep 30"))) == nullptr);
        REQUIRE(lib::get_error(supervisor.launch("p4", shell(stubborn_script))) == nullptr);

        // let the shells install their traps
        std::this_thread::sleep_for(200ms);

        WHEN("they are terminated with a grace period")
        {
            auto const started = std::chrono::steady_clock::now();
            auto const report = supervisor.terminate_all(300ms);
            auto const elapsed = std::chrono::steady_clock::now() - started;

            THEN("exactly J are force killed and the registry is empty")
            {
                CHECK(report.n_graceful == 2);
                CHECK(report.n_forced == 2);
                CHECK(supervisor.is_empty());
            }

            THEN("the wait is bounded by one grace period, not one per process")
            {
                CHECK(elapsed < 2s);
            }
        }
    }

    GIVEN("a process that already exited but was not polled")
    {
        REQUIRE(lib::get_error(supervisor.launch("video", shell("exit 0"))) == nullptr);
        std::this_thread::sleep_for(200ms);

        THEN("it counts as a graceful exit")
        {
            auto const report = supervisor.terminate_all(300ms);
            CHECK(report.n_graceful == 1);
            CHECK(report.n_forced == 0);
        }
    }
}
