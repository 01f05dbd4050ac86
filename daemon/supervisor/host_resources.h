/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include <string>

#include <boost/system/error_code.hpp>

namespace adbcam::supervisor {
    /**
     * Releases the host-side resources acquired during setup. Implementations may report failure either by
     * returning an error code or by throwing.
     */
    class i_host_resources_t {
    public:
        virtual ~i_host_resources_t() = default;

        /** Unload the audio-server module with the given id */
        [[nodiscard]] virtual boost::system::error_code release_audio_module(std::string const & module_id) = 0;

        /** Remove the named pipe; a missing path is not an error */
        [[nodiscard]] virtual boost::system::error_code remove_pipe(std::string const & path) = 0;

        /** Ask every process with exactly this executable name to terminate, system wide */
        [[nodiscard]] virtual boost::system::error_code terminate_capture_tool_processes(
            std::string const & signature) = 0;
    };
}
