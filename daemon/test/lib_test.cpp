/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "lib/AutoClosingFd.h"
#include "lib/Popen.h"
#include "lib/Waiter.h"

#include <array>
#include <chrono>
#include <string>
#include <thread>

#include <boost/system/error_code.hpp>
#include <catch2/catch.hpp>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {
    std::string read_all(lib::AutoClosingFd const & fd)
    {
        std::string result {};
        std::array<char, 256> buffer {};
        ssize_t n;
        while ((n = ::read(fd.get(), buffer.data(), buffer.size())) > 0) {
            result.append(buffer.data(), std::size_t(n));
        }
        return result;
    }
}

TEST_CASE("lib::AutoClosingFd", "[unit][lib]")
{
    std::array<int, 2> fds {-1, -1};
    REQUIRE(::pipe2(fds.data(), O_CLOEXEC) == 0);

    lib::AutoClosingFd read_end {fds[0]};
    lib::AutoClosingFd write_end {fds[1]};

    SECTION("moving transfers ownership")
    {
        lib::AutoClosingFd moved {std::move(read_end)};
        CHECK_FALSE(bool(read_end));
        CHECK(moved.get() == fds[0]);
    }

    SECTION("closing the write end gives the reader EOF")
    {
        write_end.close();
        CHECK_FALSE(bool(write_end));
        CHECK(read_all(read_end).empty());
    }

    SECTION("release gives up ownership")
    {
        int const fd = write_end.release();
        CHECK(fd == fds[1]);
        CHECK_FALSE(bool(write_end));
        CHECK(::close(fd) == 0);
    }
}

TEST_CASE("lib::popen", "[unit][lib]")
{
    SECTION("output is captured on separate pipes")
    {
        auto result = lib::popen({"/bin/sh", "-c", "echo to-out; echo to-err >&2"});
        REQUIRE(lib::get_error(result) == nullptr);

        auto & process = lib::get_value(result);
        CHECK(read_all(process.out) == "to-out\n");
        CHECK(read_all(process.err) == "to-err\n");

        int status = 0;
        REQUIRE(::waitpid(process.pid, &status, 0) == process.pid);
        CHECK(WIFEXITED(status));
        CHECK(WEXITSTATUS(status) == 0);
    }

    SECTION("the child leads its own process group and has no stdin")
    {
        auto result = lib::popen({"/bin/sh", "-c", "cut -d' ' -f5 /proc/$$/stat; cat; echo done"});
        REQUIRE(lib::get_error(result) == nullptr);

        auto & process = lib::get_value(result);
        auto const out = read_all(process.out);
        CHECK(out == std::to_string(process.pid) + "\ndone\n");

        int status = 0;
        REQUIRE(::waitpid(process.pid, &status, 0) == process.pid);
    }

    SECTION("an exec failure is reported synchronously")
    {
        auto result = lib::popen({"/nonexistent/program"});
        auto const * error = lib::get_error(result);
        REQUIRE(error != nullptr);
        CHECK(*error == boost::system::errc::no_such_file_or_directory);
    }
}

TEST_CASE("lib::Waiter", "[unit][lib]")
{
    lib::Waiter waiter {};

    SECTION("waits the full time while enabled")
    {
        CHECK(waiter.wait_for(10ms));
        CHECK(waiter.is_enabled());
    }

    SECTION("disabling from another thread cuts a wait short")
    {
        std::thread disabler {[&]() {
            std::this_thread::sleep_for(50ms);
            waiter.disable();
        }};

        auto const started = std::chrono::steady_clock::now();
        CHECK_FALSE(waiter.wait_for(10s));
        CHECK(std::chrono::steady_clock::now() - started < 5s);

        disabler.join();

        AND_THEN("it stays disabled")
        {
            CHECK_FALSE(waiter.is_enabled());
            CHECK_FALSE(waiter.wait_for(10s));
            CHECK_FALSE(waiter.disable());
        }
    }
}
