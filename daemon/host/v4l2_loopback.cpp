/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/v4l2_loopback.h"

#include "Logging.h"
#include "host/command_runner.h"

#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>

namespace adbcam::host {
    namespace {
        constexpr std::string_view module_name {"v4l2loopback"};
        constexpr std::chrono::seconds modprobe_timeout {60};

        const boost::regex video_device_regex {R"(video(\d+)$)"};
    }

    bool is_module_listed(std::string_view proc_modules, std::string_view name)
    {
        std::istringstream lines {std::string(proc_modules)};
        std::string line;
        while (std::getline(lines, line)) {
            // "<name> <size> <refcount> ..."
            auto const end = line.find(' ');
            if (std::string_view(line).substr(0, end) == name) {
                return true;
            }
        }
        return false;
    }

    std::optional<std::string> video_device_number(std::string_view video_device)
    {
        boost::match_results<std::string_view::const_iterator> match;
        if (!boost::regex_search(video_device.begin(), video_device.end(), match, video_device_regex)) {
            return std::nullopt;
        }
        return match[1].str();
    }

    boost::system::error_code ensure_v4l2_loopback(v4l2_loopback_options_t const & options)
    {
        std::ifstream modules {options.modules_path};
        if (!modules) {
            LOG_ERROR("Could not read %s", options.modules_path.c_str());
            return boost::system::errc::make_error_code(boost::system::errc::no_such_file_or_directory);
        }

        std::string const contents {std::istreambuf_iterator<char>(modules), std::istreambuf_iterator<char>()};
        if (is_module_listed(contents, module_name)) {
            LOG_INFO("v4l2loopback already loaded.");
            return {};
        }

        auto const video_nr = video_device_number(options.video_device);
        if (!video_nr) {
            LOG_ERROR("'%s' is not a /dev/videoN device path", options.video_device.c_str());
            return boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
        }

        LOG_INFO("Loading v4l2loopback module...");

        auto result = run_command({"sudo",
                                   "modprobe",
                                   std::string(module_name),
                                   "devices=1",
                                   "video_nr=" + *video_nr,
                                   "card_label=" + options.card_label,
                                   "exclusive_caps=1"},
                                  modprobe_timeout);

        if (auto const * error = lib::get_error(result)) {
            LOG_ERROR("Failed to load v4l2loopback module: %s", error->message().c_str());
            return *error;
        }

        auto const & output = lib::get_value(result);
        if (output.exit_code != 0) {
            LOG_ERROR("Failed to load v4l2loopback module (exit code %d): %s",
                      output.exit_code,
                      boost::algorithm::trim_copy(output.err).c_str());
            return boost::system::errc::make_error_code(boost::system::errc::operation_not_permitted);
        }

        return {};
    }
}
