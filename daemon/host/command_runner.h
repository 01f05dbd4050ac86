/* Copyright (C) 2021-2025 by Arm Limited (or its affiliates). All rights reserved. */

#pragma once

#include "lib/error_code_or.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace adbcam::host {
    /** The captured result of a one-shot command */
    struct command_output_t {
        int exit_code {0};
        std::string out {};
        std::string err {};
    };

    /**
     * Run a command to completion, capturing its output
     *
     * @param command_and_args The program (searched on PATH) and its arguments
     * @param timeout The maximum time to wait; the child is killed after this
     * @return the exit code and output, or no_such_file_or_directory / timed_out / the spawn error
     */
    [[nodiscard]] lib::error_code_or_t<command_output_t> run_command(std::vector<std::string> const & command_and_args,
                                                                     std::chrono::milliseconds timeout);
}
