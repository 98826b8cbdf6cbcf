/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "platform.hpp"

#include <cstdlib>
#include <optional>
#include <string>

namespace riff {

/**
 * @param name Name of the environment variable, null terminated.
 * @return The value of the variable, or an empty optional when it isn't set.
 */
inline std::optional<std::string> get_env(const char* name) {
#if RIFF_WINDOWS
    char* value = nullptr;
    size_t length = 0;
    if (_dupenv_s(&value, &length, name) != 0 || value == nullptr) {
        return {};
    }
    std::string result(value);
    std::free(value);
    return result;
#else
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return {};
    }
    return std::string(value);
#endif
}

}  // namespace riff
