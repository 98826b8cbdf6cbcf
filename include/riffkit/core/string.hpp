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

#include <cctype>
#include <string>
#include <string_view>

namespace riff {

/**
 * Compares two strings, ignoring case.
 * @param lhs The left hand side string.
 * @param rhs The right hand side string.
 * @return True if the strings are equal (ignoring case), false otherwise.
 */
inline bool string_compare_case_insensitive(const std::string_view lhs, const std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }

    return true;
}

/**
 * Replaces non-printable characters with a dot, so binary tags can be logged safely.
 * @param str The string to sanitize.
 * @return A copy of the string containing only printable characters.
 */
inline std::string string_to_printable(const std::string_view str) {
    std::string out(str);
    for (auto& c : out) {
        if (!std::isprint(static_cast<unsigned char>(c))) {
            c = '.';
        }
    }
    return out;
}

}  // namespace riff
