/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/line_classifier.h"

#include <catch2/catch.hpp>

using namespace adbcam::supervisor;

TEST_CASE("classify_line", "[unit][supervisor]")
{
    auto const rules = classifier_rules_t::defaults();

    SECTION("disconnect needs the warning marker alongside the disconnect marker")
    {
        CHECK(classify_line("WARN: Device disconnected", rules) == line_category_t::disconnect);
        CHECK(classify_line("[server] WARN: Device disconnected (usb)", rules) == line_category_t::disconnect);
        CHECK(classify_line("Device disconnected", rules) == line_category_t::info);
    }

    SECTION("the unreachable marker is a disconnect on its own")
    {
        CHECK(classify_line("ERROR: Could not find any ADB device", rules) == line_category_t::disconnect);
        CHECK(classify_line("Could not find any ADB device", rules) == line_category_t::disconnect);
    }

    SECTION("fatal markers")
    {
        CHECK(classify_line("ERROR: something broke", rules) == line_category_t::fatal_error);
        CHECK(classify_line("FATAL: out of memory", rules) == line_category_t::fatal_error);
        CHECK(classify_line("Failed to open camera", rules) == line_category_t::fatal_error);
        CHECK(classify_line("Demuxer Error", rules) == line_category_t::fatal_error);
        CHECK(classify_line("Cannot connect to server", rules) == line_category_t::fatal_error);
    }

    SECTION("fatal takes priority over warning")
    {
        CHECK(classify_line("WARN: Failed to set option", rules) == line_category_t::fatal_error);
    }

    SECTION("warnings and everything else")
    {
        CHECK(classify_line("WARN: frame dropped", rules) == line_category_t::warning);
        CHECK(classify_line("INFO: Renderer: opengl", rules) == line_category_t::info);
        CHECK(classify_line("scrcpy 2.4 <https://github.com/Genymobile/scrcpy>", rules) == line_category_t::info);
    }

    SECTION("matching is case sensitive")
    {
        CHECK(classify_line("warn: device disconnected", rules) == line_category_t::info);
        CHECK(classify_line("cannot do that", rules) == line_category_t::info);
    }
}

TEST_CASE("classify_line with custom markers", "[unit][supervisor]")
{
    classifier_rules_t const rules {"gone", "nobody home", "W:", {"E:"}};

    CHECK(classify_line("W: gone", rules) == line_category_t::disconnect);
    CHECK(classify_line("nobody home", rules) == line_category_t::disconnect);
    CHECK(classify_line("E: bad", rules) == line_category_t::fatal_error);
    CHECK(classify_line("W: meh", rules) == line_category_t::warning);
    CHECK(classify_line("ERROR: not a marker here", rules) == line_category_t::info);
}

TEST_CASE("trim_line", "[unit][supervisor]")
{
    CHECK(trim_line("hello\r\n") == "hello");
    CHECK(trim_line("  hello \t ") == "  hello");
    CHECK(trim_line("\r\n").empty());
    CHECK(trim_line("").empty());
}
