/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "supervisor/host_resources.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace adbcam::test {
    /** Records every release request; individual steps can be made to fail */
    class fake_host_resources_t : public supervisor::i_host_resources_t {
    public:
        bool throw_on_release_audio_module {false};
        bool fail_remove_pipe {false};

        [[nodiscard]] boost::system::error_code release_audio_module(std::string const & module_id) override
        {
            record("unload-module " + module_id);
            if (throw_on_release_audio_module) {
                throw std::runtime_error("pactl exploded");
            }
            return {};
        }

        [[nodiscard]] boost::system::error_code remove_pipe(std::string const & path) override
        {
            record("remove " + path);
            if (fail_remove_pipe) {
                return boost::system::errc::make_error_code(boost::system::errc::permission_denied);
            }
            return {};
        }

        [[nodiscard]] boost::system::error_code terminate_capture_tool_processes(std::string const & signature) override
        {
            record("pkill " + signature);
            return {};
        }

        [[nodiscard]] std::vector<std::string> calls() const
        {
            std::lock_guard<std::mutex> lock {mutex};
            return recorded;
        }

    private:
        mutable std::mutex mutex {};
        std::vector<std::string> recorded {};

        void record(std::string call)
        {
            std::lock_guard<std::mutex> lock {mutex};
            recorded.push_back(std::move(call));
        }
    };
}
