/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/wave/wave_format.hpp"

#include "riffkit/core/byte_order.hpp"
#include "riffkit/core/log.hpp"

#include <fmt/format.h>

#include <array>
#include <limits>

namespace {

namespace offset {
    constexpr size_t audio_format = 0;
    constexpr size_t channels = 2;
    constexpr size_t sample_rate = 4;
    constexpr size_t bytes_per_second = 8;
    constexpr size_t block_align = 12;
    constexpr size_t bits_per_sample = 14;
}  // namespace offset

}  // namespace

std::optional<uint16_t> riff::wave::Format::block_align() const {
    const auto value = static_cast<uint32_t>(bits_per_sample / 8) * channels;
    if (value > std::numeric_limits<uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::optional<uint32_t> riff::wave::Format::bytes_per_second() const {
    const auto value = static_cast<uint64_t>(sample_rate) * bits_per_sample / 8 * channels;
    if (value > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

tl::expected<void, riff::Error> riff::wave::Format::validate() const {
    if (bits_per_sample == 0) {
        return tl::unexpected(Error::invalid_format("bits per sample must be non-zero"));
    }
    if (bits_per_sample % 8 != 0) {
        return tl::unexpected(
            Error::invalid_format(fmt::format("bits per sample must be a multiple of 8 (was {})", bits_per_sample))
        );
    }
    if (channels == 0) {
        return tl::unexpected(Error::invalid_format("number of channels must be non-zero"));
    }
    if (sample_rate == 0) {
        return tl::unexpected(Error::invalid_format("sample rate must be non-zero"));
    }
    if (!block_align().has_value() || !bytes_per_second().has_value()) {
        return tl::unexpected(Error::invalid_format("derived block alignment or byte rate is out of range"));
    }
    return {};
}

std::string riff::wave::Format::to_string() const {
    return fmt::format(
        "sample_rate={} channels={} bits_per_sample={} audio_format={}", sample_rate, channels, bits_per_sample,
        riff::wave::to_string(audio_format)
    );
}

const char* riff::wave::to_string(const AudioFormat audio_format) {
    switch (audio_format) {
        case AudioFormat::pcm:
            return "PCM";
    }
    return "unknown";
}

tl::expected<riff::wave::Format, riff::Error> riff::wave::read_format(RiffReader& reader) {
    Chunk chunk;
    const auto read = reader.read_chunk(chunk);
    if (!read) {
        return tl::unexpected(read.error());
    }

    if (read.value() != k_format_chunk_length) {
        return tl::unexpected(Error::corrupted(fmt::format("format chunk is invalid size ({})", read.value())));
    }

    if (chunk.identifier != four_cc::fmt) {
        return tl::unexpected(Error::corrupted(
            fmt::format("format chunk FourCC incorrect ('{}', should be '{}')", chunk.identifier, four_cc::fmt)
        ));
    }

    // An odd sized payload of 15 bytes also occupies 24 bytes in the stream.
    if (chunk.data.size() != k_format_data_length) {
        return tl::unexpected(
            Error::corrupted(fmt::format("format chunk has invalid data size ({})", chunk.data.size()))
        );
    }

    const BufferView<const uint8_t> data(chunk.data);

    Format format;
    format.audio_format = static_cast<AudioFormat>(data.read_le<uint16_t>(offset::audio_format));
    format.channels = data.read_le<uint16_t>(offset::channels);
    format.sample_rate = data.read_le<uint32_t>(offset::sample_rate);
    const auto stored_bytes_per_second = data.read_le<uint32_t>(offset::bytes_per_second);
    const auto stored_block_align = data.read_le<uint16_t>(offset::block_align);
    format.bits_per_sample = data.read_le<uint16_t>(offset::bits_per_sample);

    const auto bytes_per_second = format.bytes_per_second();
    if (bytes_per_second != stored_bytes_per_second) {
        RIFF_WARNING("Format chunk has inconsistent byte rate: {}", format.to_string());
        return tl::unexpected(Error::corrupted(fmt::format(
            "stream has invalid average bytes-per-second field (expected {}, was {})",
            bytes_per_second.value_or(0), stored_bytes_per_second
        )));
    }

    const auto block_align = format.block_align();
    if (block_align != stored_block_align) {
        RIFF_WARNING("Format chunk has inconsistent block alignment: {}", format.to_string());
        return tl::unexpected(Error::corrupted(fmt::format(
            "stream contained invalid block alignment (expected {}, was {})", block_align.value_or(0),
            stored_block_align
        )));
    }

    RIFF_DEBUG("Read WAVE format: {}", format.to_string());

    return format;
}

tl::expected<size_t, riff::Error>
riff::wave::write_pcm(RiffWriter& writer, const Format& format, const BufferView<const uint8_t> pcm) {
    const auto block_align = format.block_align();
    const auto bytes_per_second = format.bytes_per_second();
    if (!block_align || !bytes_per_second) {
        return tl::unexpected(
            Error::invalid_format(fmt::format("derived fields of format are out of range ({})", format.to_string()))
        );
    }

    std::array<uint8_t, k_format_data_length> data {};
    write_le<uint16_t>(data.data() + offset::audio_format, static_cast<uint16_t>(format.audio_format));
    write_le<uint16_t>(data.data() + offset::channels, format.channels);
    write_le<uint32_t>(data.data() + offset::sample_rate, format.sample_rate);
    write_le<uint32_t>(data.data() + offset::bytes_per_second, *bytes_per_second);
    write_le<uint16_t>(data.data() + offset::block_align, *block_align);
    write_le<uint16_t>(data.data() + offset::bits_per_sample, format.bits_per_sample);

    const auto format_written = writer.write_chunk(four_cc::fmt, BufferView<const uint8_t>(data));
    if (!format_written) {
        return tl::unexpected(format_written.error());
    }

    const auto data_written = writer.write_chunk(four_cc::data, pcm);
    if (!data_written) {
        auto error = data_written.error();
        error.bytes_transferred += format_written.value();
        return tl::unexpected(error);
    }

    return format_written.value() + data_written.value();
}
