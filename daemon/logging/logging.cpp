/* Copyright (C) 2010-2025 by Arm Limited. All rights reserved. */

#include "Logging.h"

#include "logging/configuration.h"
#include "logging/logger_t.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <utility>

#include <sys/syscall.h>
#include <unistd.h>

namespace logging {
    namespace {
        std::shared_ptr<logger_t> current_logger {};

        std::shared_ptr<logger_t> load_logger()
        {
            return std::atomic_load(&current_logger);
        }
    }

    namespace detail {
        //NOLINTNEXTLINE(cert-dcl50-cpp)
        void do_log_item(log_level_t level, source_loc_t const & location, const char * format, ...)
        {
            // format the string
            va_list varargs;
            va_start(varargs, format);
            char * buffer_ptr = nullptr;
            auto n = vasprintf(&buffer_ptr, format, varargs);
            va_end(varargs);

            if (n < 0) {
                return;
            }

            // make sure it is safely freed
            //NOLINTNEXTLINE(modernize-avoid-c-arrays)
            std::unique_ptr<char[], void (*)(void *)> buffer {buffer_ptr, std::free};

            // write it out
            log_item(level, location, std::string_view(buffer.get(), n));
        }

        void do_log_item(log_level_t level, source_loc_t const & location, std::string_view msg)
        {
            log_item(level, location, msg);
        }
    }

    void log_item(log_level_t level, source_loc_t const & location, std::string_view message)
    {
        std::shared_ptr<logger_t> sink = load_logger();

        if (sink != nullptr) {
            struct timespec t;
            clock_gettime(CLOCK_MONOTONIC, &t);

            sink->log_item(thread_id_t(syscall(SYS_gettid)), level, {t.tv_sec, t.tv_nsec}, location, message);
        }
    }

    void log_item(thread_id_t tid,
                  log_level_t level,
                  log_timestamp_t timestamp,
                  source_loc_t const & location,
                  std::string_view message)
    {
        std::shared_ptr<logger_t> sink = load_logger();

        if (sink != nullptr) {
            sink->log_item(tid, level, timestamp, location, message);
        }
    }

    void set_logger(std::shared_ptr<logger_t> logger)
    {
        std::atomic_store(&current_logger, std::move(logger));
    }
}
