/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/core/streams/output_stream.hpp"

tl::expected<size_t, riff::OutputStream::Error>
riff::RandomAccessOutputStream::write_at(const size_t position, const uint8_t* buffer, const size_t size) {
    const auto previous_position = get_write_position();
    RIFF_OK_OR_RETURN(set_write_position(position));

    const auto result = write(buffer, size);

    // Restore the sequential position, even when the write failed.
    const auto restored = set_write_position(previous_position);
    if (!result) {
        return result;
    }
    if (!restored) {
        return tl::unexpected(restored.error());
    }
    return result;
}
