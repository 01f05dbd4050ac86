/* Copyright (c) 2018-2025 by Arm Limited. All rights reserved. */

#ifndef INCLUDE_LIB_WAITER_H
#define INCLUDE_LIB_WAITER_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lib {
    /**
     * A sleep that can be cut short from another thread.
     *
     * Once disabled, every current and future wait returns immediately; it is never re-armed.
     */
    class Waiter {
    public:
        /**
         * Waits for a specific time or until this is disabled
         *
         * @return true if waited for the full duration, false if disabled
         */
        template<class Rep, class Period>
        bool wait_for(const std::chrono::duration<Rep, Period> & timeout_duration) const
        {
            std::unique_lock<std::mutex> lock {mutex};
            return !cv.wait_for(lock, timeout_duration, [&] { return !enabled; });
        }

        [[nodiscard]] bool is_enabled() const
        {
            std::lock_guard<std::mutex> guard {mutex};
            return enabled;
        }

        /**
         * Disables waiting, causing all wait* calls to return
         *
         * @return true if it was enabled beforehand
         */
        bool disable()
        {
            bool prev;
            {
                std::lock_guard<std::mutex> guard {mutex};
                prev = enabled;
                enabled = false;
            }
            cv.notify_all();
            return prev;
        }

    private:
        bool enabled {true};
        mutable std::mutex mutex {};
        mutable std::condition_variable cv {};
    };
}

#endif // INCLUDE_LIB_WAITER_H
