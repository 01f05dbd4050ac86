/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/supervision_loop.h"

#include "ExitStatus.h"
#include "Logging.h"

#include <exception>
#include <utility>

namespace adbcam::supervisor {
    const char * to_string(supervision_state_t state)
    {
        switch (state) {
            case supervision_state_t::init:
                return "INIT";
            case supervision_state_t::launching:
                return "LAUNCHING";
            case supervision_state_t::running:
                return "RUNNING";
            case supervision_state_t::shutting_down:
                return "SHUTTING_DOWN";
            case supervision_state_t::done:
                return "DONE";
        }
        return "?";
    }

    const char * to_string(shutdown_reason_t reason)
    {
        switch (reason) {
            case shutdown_reason_t::precondition_failed:
                return "precondition failed";
            case shutdown_reason_t::launch_failed:
                return "launch failed";
            case shutdown_reason_t::disconnected:
                return "device disconnected";
            case shutdown_reason_t::all_processes_exited:
                return "all processes exited";
            case shutdown_reason_t::interrupted:
                return "interrupted";
            case shutdown_reason_t::internal_error:
                return "internal error";
        }
        return "?";
    }

    supervision_loop_t::supervision_loop_t(supervision_context_t & context,
                                           setup_preconditions_t preconditions,
                                           capture_plan_t plan,
                                           line_observer_t observer,
                                           i_supervision_event_listener_t * listener)
        : context(context),
          preconditions(preconditions),
          plan(std::move(plan)),
          observer(std::move(observer)),
          listener(listener)
    {
    }

    int supervision_loop_t::run()
    {
        auto state = current_state.load();

        while (state != supervision_state_t::done) {
            try {
                switch (state) {
                    case supervision_state_t::init:
                        state = do_init();
                        break;
                    case supervision_state_t::launching:
                        state = do_launching();
                        break;
                    case supervision_state_t::running:
                        state = do_running();
                        break;
                    case supervision_state_t::shutting_down:
                        do_shutting_down();
                        state = supervision_state_t::done;
                        break;
                    case supervision_state_t::done:
                        break;
                }
            }
            catch (std::exception const & ex) {
                LOG_ERROR("Unexpected error in state %s: %s", to_string(state), ex.what());
                if (state == supervision_state_t::shutting_down) {
                    // cleanup itself threw past its own handlers; nothing more to do
                    state = supervision_state_t::done;
                }
                else {
                    state = begin_shutdown(shutdown_reason_t::internal_error);
                }
            }

            LOG_DEBUG("Supervision state is now %s", to_string(state));
            current_state.store(state);
        }

        if (!reason) {
            return 0;
        }

        switch (*reason) {
            case shutdown_reason_t::precondition_failed:
                return PRECONDITION_FAILED_EXIT_CODE;
            case shutdown_reason_t::launch_failed:
                return LAUNCH_FAILED_EXIT_CODE;
            case shutdown_reason_t::internal_error:
                return EXCEPTION_EXIT_CODE;
            case shutdown_reason_t::disconnected:
            case shutdown_reason_t::all_processes_exited:
            case shutdown_reason_t::interrupted:
                return 0;
        }

        return 0;
    }

    supervision_state_t supervision_loop_t::begin_shutdown(shutdown_reason_t why)
    {
        if (!reason) {
            reason = why;
            LOG_DEBUG("Shutting down: %s", to_string(why));
        }
        return supervision_state_t::shutting_down;
    }

    supervision_state_t supervision_loop_t::do_init()
    {
        // an interrupt during setup explains any step that did not complete
        if (context.is_interrupted()) {
            return begin_shutdown(shutdown_reason_t::interrupted);
        }

        bool ok = true;

        if (!preconditions.device_reachable) {
            LOG_ERROR("No device available");
            ok = false;
        }
        if (!preconditions.loopback_loaded) {
            LOG_ERROR("The video loopback device is not available");
            ok = false;
        }
        if (!preconditions.audio_bridge_configured) {
            LOG_ERROR("The virtual microphone could not be configured");
            ok = false;
        }
        if (!preconditions.selection_valid) {
            LOG_ERROR("The requested capture settings are not supported by the device");
            ok = false;
        }

        if (!ok) {
            return begin_shutdown(shutdown_reason_t::precondition_failed);
        }

        return supervision_state_t::launching;
    }

    bool supervision_loop_t::launch(std::string const & name, std::vector<std::string> const & argv)
    {
        auto result = context.supervisor().launch(name, argv);

        if (auto const * failure = lib::get_error(result)) {
            LOG_ERROR("Could not start the %s process: %s", failure->name.c_str(), failure->error_code.message().c_str());
            return false;
        }

        context.start_monitors(lib::get_value(result), observer);
        return true;
    }

    supervision_state_t supervision_loop_t::do_launching()
    {
        LOG_INFO("Starting video capture...");
        if (!launch("video", plan.video_command)) {
            return begin_shutdown(shutdown_reason_t::launch_failed);
        }

        // give the video bridge time to claim its port before the audio bridge starts
        if (!context.wait_for(plan.settle_delay)) {
            return begin_shutdown(shutdown_reason_t::interrupted);
        }

        LOG_INFO("Starting audio capture...");
        if (!launch("audio", plan.audio_command)) {
            return begin_shutdown(shutdown_reason_t::launch_failed);
        }

        LOG_INFO("Virtual camera and microphone are running. Press Ctrl+C to stop.");

        if (listener != nullptr) {
            listener->on_capture_started();
        }

        return supervision_state_t::running;
    }

    supervision_state_t supervision_loop_t::do_running()
    {
        while (true) {
            if (context.is_interrupted()) {
                return begin_shutdown(shutdown_reason_t::interrupted);
            }

            if (context.disconnection_signal().is_set()) {
                LOG_ERROR("Device disconnected, stopping capture");
                return begin_shutdown(shutdown_reason_t::disconnected);
            }

            for (auto & exited : context.supervisor().poll_all()) {
                LOG_WARNING("The %s process terminated unexpectedly (exit code: %d)",
                            exited.process.name.c_str(),
                            exited.exit_code);
                exits.push_back(std::move(exited));
            }

            if (context.supervisor().is_empty()) {
                LOG_ERROR("All capture processes have exited");
                return begin_shutdown(shutdown_reason_t::all_processes_exited);
            }

            (void) context.wait_for(plan.poll_interval);
        }
    }

    void supervision_loop_t::do_shutting_down()
    {
        if (!reason) {
            reason = shutdown_reason_t::internal_error;
        }

        LOG_INFO("Stopping (%s)", to_string(*reason));

        context.cleanup_coordinator().cleanup();
    }
}
