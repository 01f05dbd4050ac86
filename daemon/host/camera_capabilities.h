/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "lib/error_code_or.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adbcam::host {
    /** One camera as reported by the capture tool */
    struct camera_info_t {
        std::string id;
        /** e.g. "back", "front" */
        std::string facing;
        std::string default_resolution;
        std::vector<std::string> resolutions;
        std::vector<int> frame_rates;
    };

    /** What the operator asked for on the command line; unset fields take the defaults */
    struct capture_request_t {
        std::optional<std::string> camera_id {};
        std::optional<std::string> resolution {};
        std::optional<int> frame_rate {};
    };

    /** The resolved capture settings */
    struct capture_selection_t {
        std::string camera_id;
        std::string resolution;
        int frame_rate;
    };

    static constexpr std::string_view default_camera_id {"0"};
    static constexpr std::string_view preferred_resolution {"1920x1080"};
    static constexpr int default_frame_rate = 60;

    /** Parse the output of `<tool> --list-camera-sizes`, cameras in order of first appearance */
    [[nodiscard]] std::vector<camera_info_t> parse_camera_list(std::string_view text);

    /**
     * Run the capture tool's camera listing
     *
     * @return the cameras, or no_such_device if the tool could not reach a device
     */
    [[nodiscard]] lib::error_code_or_t<std::vector<camera_info_t>> query_cameras(
        std::string const & tool,
        std::chrono::milliseconds timeout = std::chrono::seconds {30});

    /**
     * Pick the camera, resolution and frame rate, applying the defaults for anything not requested
     *
     * @return the selection, or a message describing why the request cannot be satisfied
     */
    [[nodiscard]] lib::error_code_or_t<capture_selection_t, std::string> resolve_capture_selection(
        std::vector<camera_info_t> const & cameras,
        capture_request_t const & request);
}
