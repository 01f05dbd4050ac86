/* Copyright (C) 2010-2025 by Arm Limited. All rights reserved. */

#include "AdbCamMain.h"

#include "AdbCamCLIParser.h"
#include "AdbCamException.h"
#include "ExitStatus.h"
#include "Logging.h"
#include "host/adb_devices.h"
#include "host/camera_capabilities.h"
#include "host/capture_commands.h"
#include "host/system_host_resources.h"
#include "host/v4l2_loopback.h"
#include "host/virtual_mic.h"
#include "logging/configuration.h"
#include "logging/global_log.h"
#include "logging/std_log_sink.h"
#include "supervisor/supervision_context.h"
#include "supervisor/supervision_loop.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <sys/prctl.h>

namespace {
    constexpr const char * VERSION_STRING = "adbcamd version 1.0.0";

    using adbcam::host::capture_selection_t;
    using adbcam::host::camera_info_t;

    void print_cameras(std::vector<camera_info_t> const & cameras)
    {
        if (cameras.empty()) {
            std::cout << "No cameras found on the device\n";
            return;
        }

        std::cout << "Available cameras:\n";
        for (auto const & camera : cameras) {
            std::cout << "  " << camera.id << ": " << camera.facing << " camera (default: "
                      << camera.default_resolution << ", fps: [";
            for (std::size_t i = 0; i < camera.frame_rates.size(); ++i) {
                std::cout << (i > 0 ? ", " : "") << camera.frame_rates[i];
            }
            std::cout << "])\n";
            for (auto const & resolution : camera.resolutions) {
                std::cout << "      - " << resolution << "\n";
            }
        }
    }

    bool has_device()
    {
        auto devices = adbcam::host::list_adb_devices();
        if (auto const * error = lib::get_error(devices)) {
            LOG_ERROR("Could not list ADB devices: %s", error->message().c_str());
            return false;
        }

        auto const & serials = lib::get_value(devices);
        if (serials.empty()) {
            LOG_ERROR("No ADB devices found. Ensure the device is connected over USB, USB debugging is enabled and "
                      "this computer is authorized. Try running 'adb devices' manually to troubleshoot.");
            return false;
        }

        for (auto const & serial : serials) {
            LOG_INFO("Found ADB device: %s", serial.c_str());
        }
        return true;
    }

    int list_cameras(ParserResult const & result)
    {
        if (!has_device()) {
            return COMMAND_FAILED_EXIT_CODE;
        }

        auto cameras = adbcam::host::query_cameras(result.capture_tool);
        if (lib::get_error(cameras) != nullptr) {
            return COMMAND_FAILED_EXIT_CODE;
        }

        print_cameras(lib::get_value(cameras));
        return 0;
    }

    /** Prints the summary once both capture processes are up */
    class capture_banner_t : public adbcam::supervisor::i_supervision_event_listener_t {
    public:
        explicit capture_banner_t(ParserResult const & result) : result(result) {}

        void on_capture_started() override
        {
            LOG_INFO("Setup complete!");
            LOG_INFO("Camera is available at %s (select '%s' in video apps)",
                     result.video_device.c_str(),
                     result.card_label.c_str());
            LOG_INFO("Android mic is available as '%s' (select as microphone in apps)", result.source_name.c_str());
            LOG_INFO("Monitoring for device disconnection...");
        }

    private:
        ParserResult const & result;
    };

    /**
     * Run each setup step in turn, stopping at the first failure (or interrupt), and report what was achieved.
     * Resources acquired along the way are registered with the context's cleanup coordinator.
     */
    adbcam::supervisor::setup_preconditions_t prepare_host(ParserResult const & result,
                                                           adbcam::supervisor::supervision_context_t & context,
                                                           std::optional<capture_selection_t> & selection)
    {
        adbcam::supervisor::setup_preconditions_t preconditions {};

        preconditions.device_reachable = has_device();
        if ((!preconditions.device_reachable) || context.is_interrupted()) {
            return preconditions;
        }

        auto cameras = adbcam::host::query_cameras(result.capture_tool);
        if (auto const * error = lib::get_error(cameras)) {
            if (*error == boost::system::errc::no_such_device) {
                preconditions.device_reachable = false;
            }
            else {
                preconditions.selection_valid = false;
            }
            return preconditions;
        }

        auto resolved = adbcam::host::resolve_capture_selection(
            lib::get_value(cameras),
            adbcam::host::capture_request_t {result.camera_id, result.camera_size, result.camera_fps});
        if (auto const * message = lib::get_error(resolved)) {
            LOG_ERROR("%s", message->c_str());
            preconditions.selection_valid = false;
            return preconditions;
        }
        selection = lib::get_value(resolved);

        LOG_INFO("Configuration selected:");
        LOG_INFO("    Camera ID: %s", selection->camera_id.c_str());
        LOG_INFO("    Resolution: %s", selection->resolution.c_str());
        LOG_INFO("    FPS: %d", selection->frame_rate);
        LOG_INFO("    Microphone: %s", result.mic_source.c_str());
        LOG_INFO("    V4L2 Device: %s", result.video_device.c_str());

        if (context.is_interrupted()) {
            return preconditions;
        }

        auto const loopback_ec = adbcam::host::ensure_v4l2_loopback(
            adbcam::host::v4l2_loopback_options_t {result.video_device, result.card_label, "/proc/modules"});
        preconditions.loopback_loaded = !loopback_ec;
        if ((!preconditions.loopback_loaded) || context.is_interrupted()) {
            return preconditions;
        }

        auto const mic_ec = adbcam::host::setup_virtual_mic(
            adbcam::host::virtual_mic_options_t {result.source_name, result.pipe_path},
            context.cleanup_coordinator());
        preconditions.audio_bridge_configured = !mic_ec;

        return preconditions;
    }

    int run_capture(ParserResult const & result)
    {
        adbcam::host::system_host_resources_t host_resources {};

        adbcam::supervisor::supervision_options_t options {};
        options.capture_tool_signature = boost::filesystem::path(result.capture_tool).filename().string();
        options.grace_period = result.grace_period;
        options.handle_os_signals = true;

        // the context owns the signal handler, so an interrupt during setup still reaches the cleanup
        adbcam::supervisor::supervision_context_t context {host_resources, options};

        std::optional<capture_selection_t> selection {};
        auto const preconditions = prepare_host(result, context, selection);

        adbcam::supervisor::capture_plan_t plan {};
        if (selection) {
            plan.video_command =
                adbcam::host::build_video_command(result.capture_tool, *selection, result.video_device);
        }
        plan.audio_command = adbcam::host::build_audio_command(result.capture_tool, result.mic_source, result.pipe_path);
        plan.settle_delay = result.settle_delay;
        plan.poll_interval = result.poll_interval;

        capture_banner_t banner {result};
        adbcam::supervisor::supervision_loop_t loop {context, preconditions, std::move(plan), {}, &banner};

        return loop.run();
    }
}

int adbcam_main(int argc, char ** argv)
{
    // Set up global thread-safe logging
    auto global_logging = std::make_shared<logging::global_logger_t>();
    global_logging->add_sink<logging::std_log_sink_t>();
    logging::set_logger(global_logging);

    // and enable debug mode
    global_logging->set_debug_enabled(AdbCamCLIParser::hasDebugFlag(argc, argv));

    // a capture process closing its end must not kill us
    (void) signal(SIGPIPE, SIG_IGN);

    prctl(PR_SET_NAME, reinterpret_cast<unsigned long>(&"adbcamd-main"), 0, 0, 0);

    // Parse the command line parameters
    AdbCamCLIParser parser;
    parser.parseCLIArguments(argc, argv);
    ParserResult const & result = parser.result;

    for (const auto & message : result.error_messages) {
        LOG_ERROR("%s", message.c_str());
    }

    switch (result.mode) {
        case ParserResult::ExecutionMode::EXIT:
            return PARSE_FAILED_EXIT_CODE;
        case ParserResult::ExecutionMode::USAGE:
            std::cout << VERSION_STRING << "\n" << AdbCamCLIParser::USAGE_MESSAGE;
            return 0;
        case ParserResult::ExecutionMode::VERSION:
            std::cout << VERSION_STRING << "\n";
            return 0;
        case ParserResult::ExecutionMode::LIST_CAMERAS:
        case ParserResult::ExecutionMode::CAPTURE:
            break;
    }

    try {
        if (result.mode == ParserResult::ExecutionMode::LIST_CAMERAS) {
            return list_cameras(result);
        }

        LOG_INFO("%s", VERSION_STRING);
        return run_capture(result);
    }
    catch (AdbCamException const & ex) {
        LOG_FATAL("%s", ex.what());
    }
    catch (std::exception const & ex) {
        LOG_FATAL("Unexpected error: %s", ex.what());
    }

    return EXCEPTION_EXIT_CODE;
}
