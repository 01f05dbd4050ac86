/* Copyright (C) 2018-2025 by Arm Limited. All rights reserved. */

#include "lib/Popen.h"

#include "Logging.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lib {
    namespace {
        struct pipe_pair_t {
            AutoClosingFd read;
            AutoClosingFd write;
        };

        error_code_or_t<pipe_pair_t> make_pipe()
        {
            std::array<int, 2> fds {-1, -1};
            // all ends are CLOEXEC; dup2 in the child clears the flag on the copies that become 0/1/2
            if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
                return error_code_from_errno(errno);
            }
            return pipe_pair_t {AutoClosingFd {fds[0]}, AutoClosingFd {fds[1]}};
        }

        [[noreturn]] void child_exec(char * const * args, int out_write, int err_write, int exec_error_write)
        {
            // restore the default dispositions; an ignored SIGPIPE would otherwise survive the exec
            ::signal(SIGINT, SIG_DFL);
            ::signal(SIGTERM, SIG_DFL);
            ::signal(SIGHUP, SIG_DFL);
            ::signal(SIGPIPE, SIG_DFL);
            ::signal(SIGCHLD, SIG_DFL);

            sigset_t empty_mask;
            ::sigemptyset(&empty_mask);
            ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

            // own process group so that the whole tree can be signalled at once
            ::setpgid(0, 0);

            // get sigkill if parent exits
            ::prctl(PR_SET_PDEATHSIG, SIGKILL);

            int const dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if ((dev_null < 0) || (::dup2(dev_null, STDIN_FILENO) < 0) || (::dup2(out_write, STDOUT_FILENO) < 0)
                || (::dup2(err_write, STDERR_FILENO) < 0)) {
                int const error = errno;
                const ssize_t num = ::write(exec_error_write, &error, sizeof(error));
                (void) num;
                ::_exit(127);
            }

            ::execvp(args[0], args);

            int const error = errno;
            // try and send the errno, but ignore it if it fails
            const ssize_t num = ::write(exec_error_write, &error, sizeof(error));
            (void) num;
            ::_exit(127);
        }
    }

    error_code_or_t<PopenResult> popen(std::vector<std::string> const & command_and_args)
    {
        if (command_and_args.empty()) {
            return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
        }

        auto exec_error_or_error = make_pipe();
        if (auto const * error = get_error(exec_error_or_error)) {
            return *error;
        }
        auto out_or_error = make_pipe();
        if (auto const * error = get_error(out_or_error)) {
            return *error;
        }
        auto err_or_error = make_pipe();
        if (auto const * error = get_error(err_or_error)) {
            return *error;
        }

        auto exec_error = get_value(std::move(exec_error_or_error));
        auto out = get_value(std::move(out_or_error));
        auto err = get_value(std::move(err_or_error));

        // create null terminated args vector (before fork to avoid allocating in child in multithreaded environment)
        std::vector<char *> args_null_term {};
        args_null_term.reserve(command_and_args.size() + 1);
        for (auto const & arg : command_and_args) {
            args_null_term.push_back(const_cast<char *>(arg.c_str()));
        }
        args_null_term.push_back(nullptr);

        pid_t const pid = ::fork();
        if (pid < 0) {
            return error_code_from_errno(errno);
        }

        if (pid == 0) {
            child_exec(args_null_term.data(), out.write.get(), err.write.get(), exec_error.write.get());
        }

        // parent
        exec_error.write.close();
        out.write.close();
        err.write.close();

        // blocks until the exec succeeds (the CLOEXEC end closes, read returns 0) or the child reports errno
        int error = 0;
        ssize_t n;
        while (((n = ::read(exec_error.read.get(), &error, sizeof(error))) < 0) && (errno == EINTR)) {
        }

        if (n > 0) {
            LOG_DEBUG("exec of '%s' failed with errno %d", command_and_args.front().c_str(), error);
            while ((::waitpid(pid, nullptr, 0) == -1) && (errno == EINTR)) {
            }
            return error_code_from_errno(error);
        }

        LOG_DEBUG("Forked child process for '%s' has pid %d", command_and_args.front().c_str(), pid);

        return PopenResult {pid, std::move(out.read), std::move(err.read)};
    }
}
