/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/system_host_resources.h"

#include "Logging.h"
#include "host/command_runner.h"

#include <chrono>
#include <cstring>
#include <string>

#include <boost/filesystem/operations.hpp>

namespace adbcam::host {
    namespace {
        constexpr std::chrono::seconds command_timeout {10};

        /** pkill exits with 1 when nothing matched */
        constexpr int pkill_no_match = 1;

        boost::system::error_code run_cleanup_command(std::vector<std::string> const & command, int ignored_exit_code)
        {
            auto result = run_command(command, command_timeout);
            if (auto const * error = lib::get_error(result)) {
                return *error;
            }

            auto const & output = lib::get_value(result);
            if ((output.exit_code != 0) && (output.exit_code != ignored_exit_code)) {
                LOG_DEBUG("'%s' exited with %d: %s", command.front().c_str(), output.exit_code, output.err.c_str());
                return boost::system::errc::make_error_code(boost::system::errc::io_error);
            }
            return {};
        }
    }

    std::string capture_tool_pattern(std::string const & signature)
    {
        std::string escaped {};
        for (char c : signature) {
            if (std::strchr(".[]{}()*+?^$|\\", c) != nullptr) {
                escaped += '\\';
            }
            escaped += c;
        }
        return "^([^ ]*/)?" + escaped + "( |$)";
    }

    boost::system::error_code system_host_resources_t::release_audio_module(std::string const & module_id)
    {
        return run_cleanup_command({"pactl", "unload-module", module_id}, 0);
    }

    boost::system::error_code system_host_resources_t::remove_pipe(std::string const & path)
    {
        boost::system::error_code ec {};
        boost::filesystem::remove(path, ec);
        return ec;
    }

    boost::system::error_code system_host_resources_t::terminate_capture_tool_processes(std::string const & signature)
    {
        // match the first word of the command line, as comm is truncated to 15 characters
        return run_cleanup_command({"pkill", "-TERM", "-f", capture_tool_pattern(signature)}, pkill_no_match);
    }
}
