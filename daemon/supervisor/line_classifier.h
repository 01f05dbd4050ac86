/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace adbcam::supervisor {
    /** Which output stream of a managed process a line came from */
    enum class stream_kind_t {
        stdout_stream,
        stderr_stream,
    };

    /** The category assigned to one line of process output */
    enum class line_category_t {
        disconnect,
        fatal_error,
        warning,
        info,
    };

    /** A single classified output line */
    struct classified_line_t {
        std::string process_name;
        stream_kind_t stream;
        line_category_t category;
        std::string text;
    };

    /** The markers used to classify a line */
    struct classifier_rules_t {
        /** Matches a disconnect only when the warning marker is also present */
        std::string disconnect_marker;
        /** Matches a disconnect on its own */
        std::string unreachable_marker;
        std::string warning_marker;
        std::vector<std::string> fatal_markers;

        /** The rule set matching the capture tool's diagnostics */
        [[nodiscard]] static classifier_rules_t defaults();
    };

    /**
     * Classify one line. Priority is disconnect, then fatal error, then warning, otherwise info.
     * Matching is a case-sensitive substring search.
     */
    [[nodiscard]] line_category_t classify_line(std::string_view line, classifier_rules_t const & rules);

    /** Strip trailing whitespace (including '\r') from a line */
    [[nodiscard]] std::string_view trim_line(std::string_view line);

    [[nodiscard]] const char * to_string(stream_kind_t kind);
    [[nodiscard]] const char * to_string(line_category_t category);
}
