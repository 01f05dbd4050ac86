/* Copyright (C) 2023-2025 by Arm Limited. All rights reserved. */

#pragma once

#include "logging/log_sink_t.h"

#include <iostream>

namespace logging {

    /** Operator messages go to stdout, warnings and errors to stderr */
    class std_log_sink_t : public log_sink_t {
    public:
        void write_log(log_level_t level, std::string_view log_item) override
        {
            if (is_diagnostic_channel(level)) {
                std::cerr << log_item << std::endl;
            }
            else {
                std::cout << log_item << std::endl;
            }
        }
    };
}
