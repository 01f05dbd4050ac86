/* Copyright (C) 2022-2025 by Arm Limited. All rights reserved. */

#pragma once

#include <cstdint>
#include <string_view>

namespace lib {
    namespace detail {
        constexpr std::string_view this_header_suffix {"lib/source_location.h"};

        static_assert(std::string_view(__FILE__).rfind(this_header_suffix) != std::string_view::npos);

        /** Length of the path prefix that leads to the source root (the directory holding lib/) */
        static constexpr std::size_t file_prefix_len = (std::string_view(__FILE__).size() - this_header_suffix.size());

        /** Strip the common source-root prefix from some __FILE__ string, so log lines show 'supervisor/foo.cpp' */
        constexpr std::string_view strip_file_prefix(std::string_view str)
        {
            constexpr std::string_view this_file {__FILE__};

            if (str.size() < file_prefix_len) {
                return str;
            }
            if (str.substr(0, file_prefix_len) != this_file.substr(0, file_prefix_len)) {
                return str;
            }
            return str.substr(file_prefix_len);
        }
    }

    /** Source location identifier */
    class source_loc_t {
    public:
        constexpr source_loc_t() = default;
        constexpr source_loc_t(std::string_view file, std::uint32_t line)
            : file(detail::strip_file_prefix(file)), line(line)
        {
        }

        [[nodiscard]] constexpr std::string_view file_name() const { return file; }
        [[nodiscard]] constexpr std::uint32_t line_no() const { return line; }

    private:
        std::string_view file {};
        std::uint32_t line {};
    };
}
