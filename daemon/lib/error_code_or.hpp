/* Copyright (C) 2022-2025 by Arm Limited. All rights reserved. */

#pragma once

#include <utility>
#include <variant>

#include <boost/system/error_code.hpp>

namespace lib {
    /** An error, or some value. The error type defaults to an error code, but may be any richer failure record */
    template<typename T, typename E = boost::system::error_code>
    using error_code_or_t = std::variant<E, T>;

    /** @return The error, or nullptr if no error */
    template<typename T, typename E>
    constexpr auto * get_error(error_code_or_t<T, E> const & eot)
    {
        return std::get_if<E>(&eot);
    }

    /** @return The value, must previously have been checked for no error */
    template<typename T, typename E>
    constexpr T & get_value(error_code_or_t<T, E> & eot)
    {
        return std::get<T>(eot);
    }

    /** @return The value, must previously have been checked for no error */
    template<typename T, typename E>
    constexpr T const & get_value(error_code_or_t<T, E> const & eot)
    {
        return std::get<T>(eot);
    }

    /** @return The value, must previously have been checked for no error */
    template<typename T, typename E>
    constexpr T && get_value(error_code_or_t<T, E> && eot)
    {
        return std::move(std::get<T>(std::move(eot)));
    }

    /** Convert the current errno into a boost error code */
    inline boost::system::error_code error_code_from_errno(int error)
    {
        return boost::system::errc::make_error_code(boost::system::errc::errc_t(error));
    }
}
