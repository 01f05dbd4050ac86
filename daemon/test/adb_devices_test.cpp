/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/adb_devices.h"

#include <string>
#include <vector>

#include <catch2/catch.hpp>

using adbcam::host::parse_adb_devices;

TEST_CASE("parse_adb_devices", "[unit][host]")
{
    SECTION("only devices in the 'device' state are returned")
    {
        auto const serials = parse_adb_devices("* daemon not running; starting now at tcp:5037\n"
                                               "* daemon started successfully\n"
                                               "List of devices attached\n"
                                               "R58M1234567\tdevice\n"
                                               "emulator-5554\toffline\n"
                                               "0123456789ABCDEF\tunauthorized\n"
                                               "192.168.1.20:5555\tdevice\n"
                                               "\n");

        CHECK(serials == std::vector<std::string> {"R58M1234567", "192.168.1.20:5555"});
    }

    SECTION("no devices")
    {
        CHECK(parse_adb_devices("List of devices attached\n\n").empty());
        CHECK(parse_adb_devices("").empty());
    }
}
