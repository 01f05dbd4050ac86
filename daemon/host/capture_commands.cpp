/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "host/capture_commands.h"

#include <cstddef>

namespace adbcam::host {
    std::optional<std::string> resolve_mic_source(std::string_view name_or_index)
    {
        for (std::size_t i = 0; i < mic_sources.size(); ++i) {
            if ((mic_sources[i].name == name_or_index) || (std::to_string(i + 1) == name_or_index)) {
                return std::string(mic_sources[i].name);
            }
        }
        return std::nullopt;
    }

    std::vector<std::string> build_video_command(std::string const & tool,
                                                 capture_selection_t const & selection,
                                                 std::string const & video_device)
    {
        return {
            tool,
            "--video-source=camera",
            "--camera-id=" + selection.camera_id,
            "--no-audio",
            "--v4l2-sink=" + video_device,
            "--camera-size=" + selection.resolution,
            "--camera-fps=" + std::to_string(selection.frame_rate),
            "--port",
            std::string(video_port),
            "--no-window",
        };
    }

    std::vector<std::string> build_audio_command(std::string const & tool,
                                                 std::string const & mic_source,
                                                 std::string const & pipe_path)
    {
        return {
            tool,
            "--no-video",
            "--no-playback",
            "--audio-source=" + mic_source,
            "--audio-codec=raw",
            "--no-window",
            "--record=" + pipe_path,
            "--port",
            std::string(audio_port),
            "--record-format=wav",
        };
    }
}
