/* Copyright (C) 2018-2025 by Arm Limited. All rights reserved. */

#ifndef INCLUDE_LIB_AUTO_CLOSING_FD_H
#define INCLUDE_LIB_AUTO_CLOSING_FD_H

#include <utility>

#include <unistd.h>

namespace lib {
    /**
     * Owns a file descriptor and closes it on destruction.
     *
     * Pipe ends handed between the supervisor, the launched process and the stream monitors
     * travel as AutoClosingFd so that exactly one owner closes each end.
     */
    class AutoClosingFd {
    public:
        constexpr AutoClosingFd() = default;
        explicit constexpr AutoClosingFd(int fd) : fd(fd) {}

        AutoClosingFd(AutoClosingFd && that) noexcept : fd(std::exchange(that.fd, -1)) {}

        AutoClosingFd & operator=(AutoClosingFd && that) noexcept
        {
            if (this != &that) {
                reset(std::exchange(that.fd, -1));
            }
            return *this;
        }

        AutoClosingFd(const AutoClosingFd &) = delete;
        AutoClosingFd & operator=(const AutoClosingFd &) = delete;

        ~AutoClosingFd() { close(); }

        /** Explicitly close the fd (a no-op when empty) */
        void close() noexcept
        {
            int const old = std::exchange(fd, -1);
            if (old != -1) {
                (void) ::close(old);
            }
        }

        /** Take ownership of a new fd, closing the old one */
        void reset(int new_fd) noexcept
        {
            int const old = std::exchange(fd, new_fd);
            if ((old != -1) && (old != new_fd)) {
                (void) ::close(old);
            }
        }

        /** Give up ownership without closing */
        [[nodiscard]] int release() noexcept { return std::exchange(fd, -1); }

        [[nodiscard]] int get() const noexcept { return fd; }
        [[nodiscard]] int operator*() const noexcept { return fd; }

        [[nodiscard]] explicit operator bool() const noexcept { return fd != -1; }

    private:
        int fd {-1};
    };
}

#endif /* INCLUDE_LIB_AUTO_CLOSING_FD_H */
