/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <boost/system/error_code.hpp>

namespace adbcam::host {
    struct v4l2_loopback_options_t {
        std::string video_device {"/dev/video0"};
        std::string card_label {"AdbCam"};
        std::string modules_path {"/proc/modules"};
    };

    /** @return true if the contents of /proc/modules list the named module */
    [[nodiscard]] bool is_module_listed(std::string_view proc_modules, std::string_view module_name);

    /** @return the N of /dev/videoN */
    [[nodiscard]] std::optional<std::string> video_device_number(std::string_view video_device);

    /** Load v4l2loopback (through sudo modprobe) unless it is already loaded */
    [[nodiscard]] boost::system::error_code ensure_v4l2_loopback(v4l2_loopback_options_t const & options);
}
