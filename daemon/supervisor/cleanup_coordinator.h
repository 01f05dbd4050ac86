/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "supervisor/host_resources.h"
#include "supervisor/process_supervisor.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace adbcam::supervisor {
    /** The external resources acquired during setup */
    struct external_resource_handles_t {
        std::optional<std::string> audio_module_id {};
        std::optional<std::string> pipe_path {};
    };

    /**
     * Tears down everything acquired for a run, at most once, from whichever trigger gets there first.
     *
     * Each step is attempted even if an earlier one failed.
     */
    class cleanup_coordinator_t {
    public:
        cleanup_coordinator_t(process_supervisor_t & supervisor,
                              i_host_resources_t & host_resources,
                              std::string capture_tool_signature,
                              std::chrono::milliseconds grace_period);

        void set_audio_module(std::string module_id);
        void set_pipe_path(std::string path);

        [[nodiscard]] external_resource_handles_t handles() const;

        /**
         * Run the teardown sequence
         *
         * @return true if this call performed it, false if it had already been performed (or is being performed)
         */
        bool cleanup();

        [[nodiscard]] bool has_run() const noexcept { return started.load(std::memory_order_acquire); }

        /** @return the result of terminating the supervised processes, valid once cleanup() returned true */
        [[nodiscard]] termination_report_t last_termination_report() const;

    private:
        process_supervisor_t & supervisor;
        i_host_resources_t & host_resources;
        std::string capture_tool_signature;
        std::chrono::milliseconds grace_period;

        mutable std::mutex mutex {};
        external_resource_handles_t resource_handles {};
        termination_report_t termination_report {};

        std::atomic<bool> started {false};
    };
}
