/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/camera_capabilities.h"

#include "Logging.h"
#include "host/command_runner.h"

#include <algorithm>
#include <sstream>
#include <string>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

namespace adbcam::host {
    namespace {
        const boost::regex camera_line_regex {R"(--camera-id=(\d+)\s+\(([^,]+),\s*(\d+x\d+),\s*fps=\[([^\]]+)\]\))"};
        const boost::regex resolution_line_regex {R"(^\s*-\s*(\d+x\d+)\s*$)"};

        constexpr std::string_view unreachable_marker {"Could not find any ADB device"};

        std::vector<int> parse_frame_rates(std::string const & list)
        {
            std::vector<int> result {};
            std::istringstream items {list};
            std::string item;
            while (std::getline(items, item, ',')) {
                boost::algorithm::trim(item);
                try {
                    result.push_back(boost::lexical_cast<int>(item));
                }
                catch (boost::bad_lexical_cast const &) {
                    LOG_DEBUG("Ignoring unparseable frame rate '%s'", item.c_str());
                }
            }
            return result;
        }

        template<typename T>
        bool contains(std::vector<T> const & values, T const & value)
        {
            return std::find(values.begin(), values.end(), value) != values.end();
        }
    }

    std::vector<camera_info_t> parse_camera_list(std::string_view text)
    {
        std::vector<camera_info_t> cameras {};
        std::istringstream lines {std::string(text)};
        std::string line;

        while (std::getline(lines, line)) {
            boost::algorithm::trim(line);

            boost::smatch match;
            if (boost::regex_search(line, match, camera_line_regex)) {
                cameras.push_back(camera_info_t {match[1].str(),
                                                 match[2].str(),
                                                 match[3].str(),
                                                 {},
                                                 parse_frame_rates(match[4].str())});
            }
            else if ((!cameras.empty()) && boost::regex_match(line, match, resolution_line_regex)) {
                cameras.back().resolutions.push_back(match[1].str());
            }
        }

        return cameras;
    }

    lib::error_code_or_t<std::vector<camera_info_t>> query_cameras(std::string const & tool,
                                                                   std::chrono::milliseconds timeout)
    {
        LOG_INFO("Getting camera information...");

        auto result = run_command({tool, "--list-camera-sizes"}, timeout);
        if (auto const * error = lib::get_error(result)) {
            LOG_ERROR("Failed to get camera information: %s", error->message().c_str());
            return *error;
        }

        auto const & output = lib::get_value(result);

        if (output.err.find(unreachable_marker) != std::string::npos) {
            LOG_ERROR("No ADB device found - cannot list cameras");
            return boost::system::errc::make_error_code(boost::system::errc::no_such_device);
        }

        if (output.exit_code != 0) {
            LOG_ERROR("Failed to get camera information (exit code %d): %s",
                      output.exit_code,
                      boost::algorithm::trim_copy(output.err).c_str());
            return boost::system::errc::make_error_code(boost::system::errc::io_error);
        }

        return parse_camera_list(output.out);
    }

    lib::error_code_or_t<capture_selection_t, std::string> resolve_capture_selection(
        std::vector<camera_info_t> const & cameras,
        capture_request_t const & request)
    {
        if (cameras.empty()) {
            LOG_WARNING("No cameras found on the device, using defaults");
            return capture_selection_t {request.camera_id.value_or(std::string(default_camera_id)),
                                        request.resolution.value_or(std::string(preferred_resolution)),
                                        request.frame_rate.value_or(default_frame_rate)};
        }

        auto const camera_id = request.camera_id.value_or(std::string(default_camera_id));
        auto const camera = std::find_if(cameras.begin(), cameras.end(), [&](auto const & c) {
            return c.id == camera_id;
        });
        if (camera == cameras.end()) {
            std::string available {};
            for (auto const & c : cameras) {
                available += (available.empty() ? "" : ", ") + c.id;
            }
            return "Invalid camera ID " + camera_id + ". Available: " + available;
        }

        std::string resolution {};
        if (request.resolution) {
            if ((!camera->resolutions.empty()) && !contains(camera->resolutions, *request.resolution)) {
                return "Resolution " + *request.resolution + " is not supported by camera " + camera_id;
            }
            resolution = *request.resolution;
        }
        else if (contains(camera->resolutions, std::string(preferred_resolution)) || camera->resolutions.empty()) {
            resolution = std::string(preferred_resolution);
        }
        else {
            resolution = camera->resolutions.front();
        }

        int frame_rate = default_frame_rate;
        if (request.frame_rate) {
            if ((!camera->frame_rates.empty()) && !contains(camera->frame_rates, *request.frame_rate)) {
                return "Frame rate " + std::to_string(*request.frame_rate) + " is not supported by camera "
                     + camera_id;
            }
            frame_rate = *request.frame_rate;
        }
        else if (!camera->frame_rates.empty()) {
            frame_rate = *std::max_element(camera->frame_rates.begin(), camera->frame_rates.end());
        }

        return capture_selection_t {camera_id, resolution, frame_rate};
    }
}
