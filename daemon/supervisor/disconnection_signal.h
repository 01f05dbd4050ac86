/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include <atomic>

namespace adbcam::supervisor {
    /**
     * Set-once flag shared by all stream monitors and the supervision loop of one run.
     * There is no reset; a new run gets a new instance.
     */
    class disconnection_signal_t {
    public:
        /** @return true if this call was the one that set the flag */
        bool set() noexcept { return !flag.exchange(true, std::memory_order_acq_rel); }

        [[nodiscard]] bool is_set() const noexcept { return flag.load(std::memory_order_acquire); }

    private:
        std::atomic<bool> flag {false};
    };
}
