/* Copyright (C) 2023-2025 by Arm Limited. All rights reserved. */

#pragma once

#include "logging/logger_t.h"

#include <memory>

namespace logging {
    /**
     * Set the logger object, which is the consumer of log messages
     *
     * @param logger Some logger object (may be null to clear the sink)
     */
    void set_logger(std::shared_ptr<logger_t> logger);
}
