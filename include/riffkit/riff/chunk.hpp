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

#include "four_cc.hpp"
#include "padding.hpp"

#include <cstdint>
#include <vector>

namespace riff {

/**
 * A single chunk of a RIFF container: an identifier and a payload. The payload never includes the pad byte.
 */
struct Chunk {
    /// The identifier of the chunk.
    FourCC identifier;
    /// The payload of the chunk, without padding.
    std::vector<uint8_t> data;

    /**
     * @return The number of bytes this chunk occupies in a stream: the header plus the padded payload.
     */
    [[nodiscard]] uint64_t byte_length() const {
        return k_chunk_header_length + padded_length(data.size());
    }

    bool operator==(const Chunk& other) const {
        return identifier == other.identifier && data == other.data;
    }

    bool operator!=(const Chunk& other) const {
        return !(*this == other);
    }
};

}  // namespace riff
