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

#include "riffkit/core/containers/buffer_view.hpp"
#include "riffkit/core/expected.hpp"
#include "riffkit/riff/padding.hpp"
#include "riffkit/riff/riff_error.hpp"
#include "riffkit/riff/riff_reader.hpp"
#include "riffkit/riff/riff_writer.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace riff::wave {

/// A number indicating the WAVE format category. Only PCM is recognized.
enum class AudioFormat : uint16_t { pcm = 0x1 };

/// The size of the payload of the fmt chunk.
static constexpr uint32_t k_format_data_length = 16;

/// The number of bytes the fmt chunk occupies in a stream.
static constexpr size_t k_format_chunk_length = k_chunk_header_length + k_format_data_length;

/**
 * The format of PCM audio data, as described by the fmt chunk of a WAVE file.
 *
 * The fmt chunk also stores the byte rate and the block alignment, but those are derived from the fields below and
 * are therefore not part of this struct.
 */
struct Format {
    /// Bits per sample.
    uint16_t bits_per_sample {};
    /// The number of channels represented in the waveform data.
    uint16_t channels {};
    /// The sampling rate (in samples per second).
    uint32_t sample_rate {};
    /// The format category.
    AudioFormat audio_format {AudioFormat::pcm};

    /**
     * @return The number of bytes of a single frame (one sample for every channel), or an empty optional if the value
     * doesn't fit in the 16-bit field of the fmt chunk.
     */
    [[nodiscard]] std::optional<uint16_t> block_align() const;

    /**
     * @return The number of bytes per second, or an empty optional if the value doesn't fit in the 32-bit field of the
     * fmt chunk.
     */
    [[nodiscard]] std::optional<uint32_t> bytes_per_second() const;

    /**
     * Checks whether the fields describe valid audio: bits per sample must be a non-zero multiple of 8, and the number
     * of channels and the sample rate must be non-zero.
     * @return An expected indicating validity, failing with Error::Kind::invalid_format.
     */
    [[nodiscard]] tl::expected<void, Error> validate() const;

    /**
     * @return A description of this format.
     */
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Format& other) const {
        return bits_per_sample == other.bits_per_sample && channels == other.channels
            && sample_rate == other.sample_rate && audio_format == other.audio_format;
    }

    bool operator!=(const Format& other) const {
        return !(*this == other);
    }
};

/**
 * @param audio_format The format code.
 * @return The name of the format code.
 */
const char* to_string(AudioFormat audio_format);

/**
 * Reads the next chunk from the reader and decodes it as fmt chunk. The stored byte rate and block alignment must
 * match the values derived from the other fields, otherwise the stream is considered corrupted.
 * @param reader The reader to read from, positioned at the fmt chunk.
 * @return The decoded format, or an error.
 */
[[nodiscard]] tl::expected<Format, Error> read_format(RiffReader& reader);

/**
 * Writes an fmt chunk describing the given format, followed by a data chunk holding the given audio data. The byte
 * rate and block alignment are derived from the format. The data chunk is only written if writing the fmt chunk
 * succeeded.
 * @param writer The writer to write to.
 * @param format The format of the audio data.
 * @param pcm The audio data.
 * @return The number of bytes written for both chunks. On failure the error holds the number of bytes written.
 */
[[nodiscard]] tl::expected<size_t, Error>
write_pcm(RiffWriter& writer, const Format& format, BufferView<const uint8_t> pcm);

}  // namespace riff::wave
