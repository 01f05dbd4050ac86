/* Copyright (C) 2014-2025 by Arm Limited. All rights reserved. */

#ifndef PARSERRESULT_H_
#define PARSERRESULT_H_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * For containing the results of parsing
 */
class ParserResult {
public:
    enum class ExecutionMode {
        /** set up the virtual devices and supervise the capture processes */
        CAPTURE,
        /** print the device's cameras and exit */
        LIST_CAMERAS,
        USAGE,
        VERSION,
        EXIT,
    };

    std::vector<std::string> error_messages {};

    ExecutionMode mode {ExecutionMode::CAPTURE};

    std::optional<std::string> camera_id {};
    std::optional<std::string> camera_size {};
    std::optional<int> camera_fps {};

    std::string mic_source {"mic-camcorder"};
    std::string video_device {"/dev/video0"};
    std::string card_label {"AdbCam"};
    std::string source_name {"AdbCam"};
    std::string pipe_path {"/tmp/adbcam_pipe"};
    std::string capture_tool {"scrcpy"};

    std::chrono::milliseconds poll_interval {300};
    std::chrono::milliseconds grace_period {2000};
    std::chrono::milliseconds settle_delay {2000};

    bool debug {false};

    /**
     * Set the ExecutionMode to Exit
     */
    void parsingFailed() { mode = ExecutionMode::EXIT; }

    /**
     * @brief Returns whether the argument parsing has succeeded or not.
     *
     * @return false When the parsing has failed.  ExecutionMode is EXIT.
     */
    [[nodiscard]] bool ok() const { return mode != ExecutionMode::EXIT; }

    ParserResult() = default;
    ParserResult(const ParserResult &) = delete;
    ParserResult & operator=(const ParserResult &) = delete;
    ParserResult(ParserResult &&) = delete;
    ParserResult & operator=(ParserResult &&) = delete;
};

#endif /* PARSERRESULT_H_ */
