/* Copyright (C) 2025 by Arm Limited. All rights reserved. */

#include "supervisor/line_classifier.h"

#include <algorithm>
#include <string_view>

namespace adbcam::supervisor {
    namespace {
        bool contains(std::string_view haystack, std::string_view needle)
        {
            return (!needle.empty()) && (haystack.find(needle) != std::string_view::npos);
        }
    }

    classifier_rules_t classifier_rules_t::defaults()
    {
        return {
            "Device disconnected",
            "Could not find any ADB device",
            "WARN:",
            {"ERROR:", "FATAL:", "Failed", "Error", "Cannot"},
        };
    }

    line_category_t classify_line(std::string_view line, classifier_rules_t const & rules)
    {
        auto const has_warning = contains(line, rules.warning_marker);

        if ((has_warning && contains(line, rules.disconnect_marker)) || contains(line, rules.unreachable_marker)) {
            return line_category_t::disconnect;
        }

        if (std::any_of(rules.fatal_markers.begin(), rules.fatal_markers.end(), [line](auto const & marker) {
                return contains(line, marker);
            })) {
            return line_category_t::fatal_error;
        }

        if (has_warning) {
            return line_category_t::warning;
        }

        return line_category_t::info;
    }

    std::string_view trim_line(std::string_view line)
    {
        auto const end = line.find_last_not_of(" \t\r\n\v\f");
        if (end == std::string_view::npos) {
            return {};
        }
        return line.substr(0, end + 1);
    }

    const char * to_string(stream_kind_t kind)
    {
        switch (kind) {
            case stream_kind_t::stdout_stream:
                return "stdout";
            case stream_kind_t::stderr_stream:
                return "stderr";
        }
        return "?";
    }

    const char * to_string(line_category_t category)
    {
        switch (category) {
            case line_category_t::disconnect:
                return "disconnect";
            case line_category_t::fatal_error:
                return "fatal-error";
            case line_category_t::warning:
                return "warning";
            case line_category_t::info:
                return "info";
        }
        return "?";
    }
}
