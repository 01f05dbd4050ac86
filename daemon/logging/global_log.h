/* Copyright (C) 2010-2025 by Arm Limited. All rights reserved. */

#pragma once

#include "logging/log_sink_t.h"
#include "logging/logger_t.h"

#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace logging {

    /** Default logger, formats each item and hands it to the sinks */
    class global_logger_t : public logger_t {
    public:
        global_logger_t();

        /** Toggle whether DEBUG/SETUP/FINE messages are output to the console */
        void set_debug_enabled(bool enabled) override
        {
            const std::lock_guard<std::mutex> lock {mutex};
            output_debug = enabled;
        }

        /** Store some log item to the log */
        void log_item(thread_id_t tid,
                      log_level_t level,
                      log_timestamp_t const & timestamp,
                      source_loc_t const & location,
                      std::string_view message) override;

        /** Access the last sent error log item */
        [[nodiscard]] std::string get_last_log_error() const
        {
            const std::lock_guard<std::mutex> lock {mutex};
            return last_error;
        }

        template<typename Sink, typename... Args>
        void add_sink(Args &&... args)
        {
            const std::lock_guard<std::mutex> lock {mutex};
            sinks.push_back(std::make_unique<Sink>(std::forward<Args>(args)...));
        }

    private:
        /** To protect against concurrect modifications */
        mutable std::mutex mutex {};

        /** The last seen error message */
        std::string last_error {};

        /** Is debug (and setup / fine) level enabled for output */
        bool output_debug = false;

        /** The buffer used to format a log message before sending to the sinks */
        std::stringstream format_buffer {};

        /** The list of sinks to send formatted log messages to */
        std::vector<std::unique_ptr<log_sink_t>> sinks {};

        /** Formats a message and sends it to the sinks */
        void output_item(bool verbose,
                         log_level_t level,
                         thread_id_t tid,
                         log_timestamp_t const & timestamp,
                         source_loc_t const & location,
                         std::string_view message);
    };
}
