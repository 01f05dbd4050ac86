/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "supervisor/process_supervisor.h"
#include "supervisor/stream_monitor.h"
#include "supervisor/supervision_context.h"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace adbcam::supervisor {
    enum class supervision_state_t {
        init,
        launching,
        running,
        shutting_down,
        done,
    };

    /** Why the loop entered shutting_down */
    enum class shutdown_reason_t {
        precondition_failed,
        launch_failed,
        disconnected,
        all_processes_exited,
        interrupted,
        internal_error,
    };

    [[nodiscard]] const char * to_string(supervision_state_t state);
    [[nodiscard]] const char * to_string(shutdown_reason_t reason);

    /** What the setup collaborators achieved before the loop was started */
    struct setup_preconditions_t {
        bool device_reachable {false};
        bool loopback_loaded {false};
        bool audio_bridge_configured {false};
        bool selection_valid {true};
    };

    /** The two processes to launch and the loop timing */
    struct capture_plan_t {
        std::vector<std::string> video_command;
        std::vector<std::string> audio_command;
        std::chrono::milliseconds settle_delay {2000};
        std::chrono::milliseconds poll_interval {300};
    };

    /** Notified of significant transitions of the loop */
    class i_supervision_event_listener_t {
    public:
        virtual ~i_supervision_event_listener_t() = default;

        /** Both processes were launched and are being monitored */
        virtual void on_capture_started() = 0;
    };

    /**
     * The top level state machine: check preconditions, launch video then audio, watch for disconnection or exit,
     * then clean up exactly once.
     */
    class supervision_loop_t {
    public:
        supervision_loop_t(supervision_context_t & context,
                           setup_preconditions_t preconditions,
                           capture_plan_t plan,
                           line_observer_t observer = {},
                           i_supervision_event_listener_t * listener = nullptr);

        /**
         * Run to completion
         *
         * @return 0 for a clean shutdown, otherwise one of the failure exit codes
         */
        int run();

        [[nodiscard]] supervision_state_t state() const noexcept { return current_state.load(); }
        [[nodiscard]] std::optional<shutdown_reason_t> shutdown_reason() const noexcept { return reason; }
        [[nodiscard]] std::vector<exited_process_t> const & unexpected_exits() const noexcept { return exits; }

    private:
        supervision_context_t & context;
        setup_preconditions_t preconditions;
        capture_plan_t plan;
        line_observer_t observer;
        i_supervision_event_listener_t * listener;
        std::atomic<supervision_state_t> current_state {supervision_state_t::init};
        std::optional<shutdown_reason_t> reason {};
        std::vector<exited_process_t> exits {};

        supervision_state_t do_init();
        supervision_state_t do_launching();
        supervision_state_t do_running();
        void do_shutting_down();

        bool launch(std::string const & name, std::vector<std::string> const & argv);
        supervision_state_t begin_shutdown(shutdown_reason_t why);
    };
}
