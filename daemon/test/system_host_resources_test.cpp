/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/system_host_resources.h"

#include <string>

#include <boost/regex.hpp>
#include <catch2/catch.hpp>

using namespace adbcam::host;

namespace {
    /** pkill compiles its pattern as a POSIX extended regex and searches the full command line */
    bool pkill_matches(std::string const & pattern, std::string const & command_line)
    {
        boost::regex const regex {pattern, boost::regex::extended};
        return boost::regex_search(command_line, regex);
    }
}

TEST_CASE("capture_tool_pattern", "[unit][host]")
{
    auto const pattern = capture_tool_pattern("scrcpy");

    SECTION("matches the tool as the first word of the command line")
    {
        CHECK(pkill_matches(pattern, "scrcpy --video-source=camera --camera-id=0"));
        CHECK(pkill_matches(pattern, "/usr/local/bin/scrcpy --no-video"));
        CHECK(pkill_matches(pattern, "scrcpy"));
    }

    SECTION("does not match the tool named as an argument")
    {
        CHECK_FALSE(pkill_matches(pattern, "adbcamd --capture-tool scrcpy"));
        CHECK_FALSE(pkill_matches(pattern, "adbcamd --capture-tool /usr/bin/scrcpy"));
    }

    SECTION("does not match a longer name")
    {
        CHECK_FALSE(pkill_matches(pattern, "scrcpy-server --version"));
        CHECK_FALSE(pkill_matches(pattern, "/usr/bin/myscrcpy"));
    }

    SECTION("matches a name longer than the kernel comm limit")
    {
        auto const long_pattern = capture_tool_pattern("adbcam-capture-tool-wrapper");
        CHECK(pkill_matches(long_pattern, "/opt/adbcam/adbcam-capture-tool-wrapper --no-audio"));
    }

    SECTION("escapes regex metacharacters")
    {
        auto const dotted = capture_tool_pattern("scrcpy.bin");
        CHECK(dotted == "^([^ ]*/)?scrcpy\\.bin( |$)");
        CHECK(pkill_matches(dotted, "scrcpy.bin -f"));
        CHECK_FALSE(pkill_matches(dotted, "scrcpyxbin -f"));
    }
}
