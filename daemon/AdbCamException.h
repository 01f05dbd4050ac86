/* Copyright (C) 2021-2025 by Arm Limited. All rights reserved. */

#pragma once

#include <stdexcept>
#include <string>

class AdbCamException : public std::runtime_error {
public:
    explicit AdbCamException(const std::string & what) : runtime_error(what) {}
};
