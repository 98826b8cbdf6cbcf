/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/riff/four_cc.hpp"

#include "riffkit/core/assert.hpp"
#include "riffkit/core/string.hpp"

#include <algorithm>

riff::FourCC riff::FourCC::from_bytes(const uint8_t* data) {
    RIFF_ASSERT_RETURN_WITH(data != nullptr, "Data must not be nullptr", {});
    FourCC four_cc;
    std::copy_n(data, k_size, four_cc.bytes_.begin());
    return four_cc;
}

std::optional<riff::FourCC> riff::FourCC::from_string(const std::string_view str) {
    if (str.size() != k_size) {
        return std::nullopt;
    }
    return from_bytes(reinterpret_cast<const uint8_t*>(str.data()));
}

std::string riff::FourCC::to_string() const {
    return {reinterpret_cast<const char*>(bytes_.data()), bytes_.size()};
}

namespace riff {

std::ostream& operator<<(std::ostream& os, const FourCC& four_cc) {
    os << string_to_printable(four_cc.to_string());
    return os;
}

}  // namespace riff
