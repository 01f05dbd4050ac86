/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include "host/camera_capabilities.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adbcam::host {
    /** A microphone source the capture tool accepts */
    struct mic_source_t {
        std::string_view name;
        std::string_view description;
    };

    static constexpr std::array<mic_source_t, 5> mic_sources {{
        {"mic", "Standard microphone"},
        {"mic-unprocessed", "Unprocessed (raw) microphone"},
        {"mic-camcorder", "Microphone tuned for video recording"},
        {"mic-voice-recognition", "Microphone tuned for voice recognition"},
        {"mic-voice-communication", "Microphone tuned for voice communications (voice calls)"},
    }};

    static constexpr std::string_view default_mic_source {"mic-camcorder"};

    static constexpr std::string_view video_port {"27183"};
    static constexpr std::string_view audio_port {"27184"};

    /** Accepts a source name or its 1-based index; @return the source name */
    [[nodiscard]] std::optional<std::string> resolve_mic_source(std::string_view name_or_index);

    [[nodiscard]] std::vector<std::string> build_video_command(std::string const & tool,
                                                               capture_selection_t const & selection,
                                                               std::string const & video_device);

    [[nodiscard]] std::vector<std::string> build_audio_command(std::string const & tool,
                                                               std::string const & mic_source,
                                                               std::string const & pipe_path);
}
