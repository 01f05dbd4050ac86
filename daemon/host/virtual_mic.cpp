/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/virtual_mic.h"

#include "Logging.h"
#include "host/command_runner.h"
#include "lib/error_code_or.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/operations.hpp>

#include <sys/stat.h>

namespace adbcam::host {
    namespace {
        constexpr std::chrono::seconds pactl_timeout {10};
    }

    bool is_module_id(std::string const & text)
    {
        return (!text.empty()) && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
    }

    boost::system::error_code setup_virtual_mic(virtual_mic_options_t const & options,
                                                supervisor::cleanup_coordinator_t & coordinator)
    {
        LOG_INFO("Setting up PulseAudio virtual mic: %s", options.source_name.c_str());

        // remove a pipe left over from an earlier run
        boost::system::error_code ec {};
        boost::filesystem::remove(options.pipe_path, ec);
        if (ec) {
            LOG_ERROR("Failed to remove stale pipe %s: %s", options.pipe_path.c_str(), ec.message().c_str());
            return ec;
        }

        if (::mkfifo(options.pipe_path.c_str(), 0666) != 0) {
            auto const error = lib::error_code_from_errno(errno);
            LOG_ERROR("Failed to create pipe %s: %s", options.pipe_path.c_str(), error.message().c_str());
            return error;
        }
        coordinator.set_pipe_path(options.pipe_path);

        auto result = run_command({"pactl",
                                   "load-module",
                                   "module-pipe-source",
                                   "source_name=" + options.source_name,
                                   "channels=2",
                                   "format=s16le",
                                   "rate=48000",
                                   "file=" + options.pipe_path},
                                  pactl_timeout);

        if (auto const * error = lib::get_error(result)) {
            LOG_ERROR("Failed to load PulseAudio module: %s", error->message().c_str());
            return *error;
        }

        auto const & output = lib::get_value(result);
        auto const module_id = boost::algorithm::trim_copy(output.out);

        if ((output.exit_code != 0) || !is_module_id(module_id)) {
            LOG_ERROR("Failed to load PulseAudio module (exit code %d): %s",
                      output.exit_code,
                      boost::algorithm::trim_copy(output.err).c_str());
            return boost::system::errc::make_error_code(boost::system::errc::io_error);
        }

        LOG_DEBUG("Loaded module-pipe-source as module %s", module_id.c_str());
        coordinator.set_audio_module(module_id);

        return {};
    }
}
