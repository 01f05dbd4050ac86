/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "supervisor/host_resources.h"

#include <string>

namespace adbcam::host {
    /**
     * Builds the extended regex given to `pkill -f` for a capture tool.
     * It matches a command line whose first word is the tool, bare or with any directory prefix.
     */
    [[nodiscard]] std::string capture_tool_pattern(std::string const & signature);

    /** Releases resources through pactl, the filesystem and pkill */
    class system_host_resources_t : public supervisor::i_host_resources_t {
    public:
        [[nodiscard]] boost::system::error_code release_audio_module(std::string const & module_id) override;
        [[nodiscard]] boost::system::error_code remove_pipe(std::string const & path) override;
        [[nodiscard]] boost::system::error_code terminate_capture_tool_processes(
            std::string const & signature) override;
    };
}
