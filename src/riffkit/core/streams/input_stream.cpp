/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/core/streams/input_stream.hpp"

std::optional<size_t> riff::InputStream::remaining() {
    const auto total = size();
    if (!total) {
        return std::nullopt;
    }
    const auto position = get_read_position();
    return position < *total ? *total - position : 0;
}

bool riff::InputStream::skip(const size_t size) {
    return set_read_position(get_read_position() + size);
}

tl::expected<std::string, riff::InputStream::Error> riff::InputStream::read_as_string(const size_t size) {
    std::string str(size, '\0');
    const auto count = read(reinterpret_cast<uint8_t*>(str.data()), size);
    if (!count) {
        return tl::unexpected(count.error());
    }
    if (*count != size) {
        return tl::unexpected(Error::insufficient_data);
    }
    return str;
}
