/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "supervisor/cleanup_coordinator.h"

#include <string>

#include <boost/system/error_code.hpp>

namespace adbcam::host {
    struct virtual_mic_options_t {
        std::string source_name {"AdbCam"};
        std::string pipe_path {"/tmp/adbcam_pipe"};
    };

    /** @return true if the text is a plausible audio-server module id */
    [[nodiscard]] bool is_module_id(std::string const & text);

    /**
     * Create the named pipe and load an audio-server pipe source reading from it. Each acquired resource is
     * registered with the coordinator as soon as it exists, so a later failure still releases it.
     */
    [[nodiscard]] boost::system::error_code setup_virtual_mic(virtual_mic_options_t const & options,
                                                              supervisor::cleanup_coordinator_t & coordinator);
}
