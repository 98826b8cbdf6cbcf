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

#include <limits>
#include <optional>
#include <type_traits>

namespace riff::safe_math {

/**
 * Overflow checked addition. Container and chunk sizes are accumulated with this before they are narrowed to the
 * 32-bit fields of the format.
 * @return a + b, or an empty optional if the result doesn't fit in T.
 */
template<typename T>
[[nodiscard]] std::optional<T> add(const T a, const T b) {
    static_assert(std::is_integral_v<T>, "Only integers can be added safely");
    using limits = std::numeric_limits<T>;

    const bool overflows = b > 0 && a > limits::max() - b;
    bool underflows = false;
    if constexpr (std::is_signed_v<T>) {
        underflows = b < 0 && a < limits::min() - b;
    }
    if (overflows || underflows) {
        return std::nullopt;
    }
    return static_cast<T>(a + b);
}

}  // namespace riff::safe_math
