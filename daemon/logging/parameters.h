/* Copyright (C) 2023-2025 by Arm Limited. All rights reserved. */

#pragma once
#include "lib/source_location.h"

#include <cstdint>

#include <sys/types.h>

// Arguments to the logging functions, shared by the callers of the LOG_xxx macros and the logger / sink
// implementations.

namespace logging {
    /** Possible logging levels */
    enum class log_level_t : uint8_t {
        debug,
        setup,
        fine,
        info,
        warning,
        error,
        fatal,
    };

    // the source location
    using source_loc_t = lib::source_loc_t;

    /** Timestamp (effectively just what comes from clockgettime) */
    struct log_timestamp_t {
        std::int64_t seconds;
        std::int64_t nanos;
    };

    /** Identifies the source thread */
    enum class thread_id_t : pid_t;

    /** @return true for the levels that belong on the warning/error channel rather than the operator channel */
    constexpr bool is_diagnostic_channel(log_level_t level)
    {
        return (level == log_level_t::warning) || (level == log_level_t::error) || (level == log_level_t::fatal);
    }
}
