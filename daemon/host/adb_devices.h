/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "lib/error_code_or.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace adbcam::host {
    /** Extract the serials of the attached devices in the 'device' state from the output of `adb devices` */
    [[nodiscard]] std::vector<std::string> parse_adb_devices(std::string_view output);

    /** Run `adb devices` and return the serials of the usable devices */
    [[nodiscard]] lib::error_code_or_t<std::vector<std::string>> list_adb_devices(
        std::chrono::milliseconds timeout = std::chrono::seconds {10});
}
