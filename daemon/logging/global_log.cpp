/* Copyright (C) 2021-2025 by Arm Limited. All rights reserved. */

#include "logging/global_log.h"

#include "logging/parameters.h"

#include <array>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace {
    constexpr auto log_level_string =
        std::array<std::string_view, 7> {"DEBUG", "SETUP", "FINE", "INFO", "WARN", "ERROR", "FATAL"};
}

namespace logging {

    global_logger_t::global_logger_t()
    {
        // disable buffering of output
        (void) ::setvbuf(stdout, nullptr, _IONBF, 0);
        (void) ::setvbuf(stderr, nullptr, _IONBF, 0);
        // make sure that everything goes to output immediately
        std::cout << std::unitbuf;
        std::cerr << std::unitbuf;
    }

    void global_logger_t::log_item(thread_id_t tid,
                                   log_level_t level,
                                   log_timestamp_t const & timestamp,
                                   source_loc_t const & location,
                                   std::string_view message)
    {
        // writing to the log must be serialized in a multithreaded environment
        const std::lock_guard lock {mutex};

        switch (level) {
            case log_level_t::debug:
            case log_level_t::setup:
            case log_level_t::fine:
                if (output_debug) {
                    output_item(true, level, tid, timestamp, location, message);
                }
                break;
            case log_level_t::info:
            case log_level_t::warning:
                output_item(output_debug, level, tid, timestamp, location, message);
                break;
            case log_level_t::error:
            case log_level_t::fatal:
                last_error = std::string(message);
                output_item(output_debug, level, tid, timestamp, location, message);
                break;
        }
    }

    void global_logger_t::output_item(bool verbose,
                                      log_level_t level,
                                      thread_id_t tid,
                                      log_timestamp_t const & timestamp,
                                      source_loc_t const & location,
                                      std::string_view message)
    {
        constexpr double to_ns = 1e-9;
        constexpr int pref_precision = 7;

        if (!verbose) {
            if (level == log_level_t::info) {
                for (auto & sink : sinks) {
                    sink->write_log(level, message);
                }
                return;
            }

            format_buffer.str({});
            format_buffer << log_level_string[static_cast<int>(level)] << ": " << message;
        }
        else {
            auto now_ns = double(timestamp.seconds) + (to_ns * double(timestamp.nanos));
            format_buffer.str({});

            format_buffer << std::fixed << std::setprecision(pref_precision) << "[" << now_ns << "] "
                          << log_level_string[static_cast<int>(level)] << ": #" << pid_t(tid) << " ("
                          << location.file_name() << ":" << location.line_no() << "): " << message;
        }

        auto str = format_buffer.str();
        for (auto & sink : sinks) {
            sink->write_log(level, str);
        }
    }
}
