/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/adb_devices.h"

#include "Logging.h"
#include "host/command_runner.h"

#include <sstream>
#include <string>

namespace adbcam::host {
    std::vector<std::string> parse_adb_devices(std::string_view output)
    {
        std::vector<std::string> serials {};
        std::istringstream lines {std::string(output)};
        std::string line;

        while (std::getline(lines, line)) {
            // "List of devices attached" and "* daemon started successfully" chatter
            if (line.empty() || (line.front() == '*') || (line.rfind("List of devices", 0) == 0)) {
                continue;
            }

            std::istringstream columns {line};
            std::string serial;
            std::string state;
            if ((columns >> serial >> state) && (state == "device")) {
                serials.push_back(serial);
            }
        }

        return serials;
    }

    lib::error_code_or_t<std::vector<std::string>> list_adb_devices(std::chrono::milliseconds timeout)
    {
        auto result = run_command({"adb", "devices"}, timeout);
        if (auto const * error = lib::get_error(result)) {
            LOG_ERROR("Could not run adb: %s", error->message().c_str());
            return *error;
        }

        auto const & output = lib::get_value(result);
        if (output.exit_code != 0) {
            LOG_ERROR("adb devices failed with exit code %d: %s", output.exit_code, output.err.c_str());
            return boost::system::errc::make_error_code(boost::system::errc::io_error);
        }

        return parse_adb_devices(output.out);
    }
}
