/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include <string>

#include <sys/types.h>
#include <sys/wait.h>

namespace adbcam::supervisor {
    /** Last observed termination status of a managed process */
    enum class process_state_t {
        running,
        exited,
        unknown,
    };

    /** One external process tracked by the supervisor */
    struct managed_process_t {
        std::string name;
        pid_t pid {0};
        process_state_t state {process_state_t::running};
        /** valid when state == exited */
        int exit_code {0};
    };

    /** Convert a waitpid status into a shell-style exit code (128 + signal for a signalled process) */
    constexpr int exit_code_from_wait_status(int status)
    {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }
}
