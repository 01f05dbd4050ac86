/* Copyright (C) 2018-2025 by Arm Limited. All rights reserved. */

#ifndef INCLUDE_LIB_POPEN_H
#define INCLUDE_LIB_POPEN_H

#include "lib/AutoClosingFd.h"
#include "lib/error_code_or.hpp"

#include <string>
#include <vector>

#include <sys/types.h>

namespace lib {
    struct PopenResult {
        /** Process pid */
        pid_t pid;
        /** Read end of the child's stdout */
        AutoClosingFd out;
        /** Read end of the child's stderr */
        AutoClosingFd err;
    };

    /**
     * Opens a command with execvp, capturing stdout and stderr through pipes. The child's stdin is /dev/null.
     *
     * The child is made the leader of a new process group, so that signalling -pid reaches anything it spawns,
     * and it receives SIGKILL if the calling thread's process dies.
     *
     * Unlike popen(3) this does not go through a shell, and an exec failure is reported synchronously: the call
     * only returns a pid once the child has successfully exec'd.
     *
     * @param command_and_args program + args (must not be empty)
     * @return the pid and file descriptors, or the errno of the failed pipe/fork/exec
     */
    error_code_or_t<PopenResult> popen(std::vector<std::string> const & command_and_args);
}

#endif // INCLUDE_LIB_POPEN_H
