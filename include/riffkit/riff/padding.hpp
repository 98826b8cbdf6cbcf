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

#include <cstddef>
#include <cstdint>
#include <vector>

namespace riff {

/// Chunks start at even offsets; odd sized payloads are followed by a single pad byte.
static constexpr uint64_t k_word_length = 2;

/// Identifier (4 bytes) + size (4 bytes).
static constexpr size_t k_chunk_header_length = 8;

/// "RIFF" (4 bytes) + size (4 bytes) + file type (4 bytes).
static constexpr size_t k_riff_header_length = 12;

/// Offset of the size field, relative to the start of the RIFF header.
static constexpr size_t k_riff_size_offset = 4;

/**
 * Rounds given length up to the next multiple of the word length (2).
 * @param n The length to round.
 * @return The padded length.
 */
constexpr uint64_t padded_length(const uint64_t n) {
    return n + n % k_word_length;
}

/**
 * Pads given data to an even length by appending a zero byte when the length is odd.
 * @param data The data to pad.
 * @return The data, with a zero byte appended if its length was odd.
 */
inline std::vector<uint8_t> pad(std::vector<uint8_t> data) {
    if (data.size() % k_word_length != 0) {
        data.push_back(0);
    }
    return data;
}

}  // namespace riff
