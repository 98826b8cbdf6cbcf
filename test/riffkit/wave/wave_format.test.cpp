/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "../riff/test_streams.test.hpp"
#include "riffkit/core/streams/byte_stream.hpp"
#include "riffkit/wave/wave_format.hpp"

#include <catch2/catch_all.hpp>

namespace {

/// Writes a WAVE container with a single fmt chunk holding given fields.
void write_format_chunk(
    riff::ByteStream& stream, const uint16_t channels, const uint32_t sample_rate, const uint32_t bytes_per_second,
    const uint16_t block_align, const uint16_t bits_per_sample
) {
    REQUIRE(stream.write("RIFF", 4));
    REQUIRE(stream.write_le<uint32_t>(28));
    REQUIRE(stream.write("WAVE", 4));
    REQUIRE(stream.write("fmt ", 4));
    REQUIRE(stream.write_le<uint32_t>(16));
    REQUIRE(stream.write_le<uint16_t>(1));
    REQUIRE(stream.write_le<uint16_t>(channels));
    REQUIRE(stream.write_le<uint32_t>(sample_rate));
    REQUIRE(stream.write_le<uint32_t>(bytes_per_second));
    REQUIRE(stream.write_le<uint16_t>(block_align));
    REQUIRE(stream.write_le<uint16_t>(bits_per_sample));
}

}  // namespace

TEST_CASE("riff::wave::Format") {
    SECTION("Derived fields") {
        const riff::wave::Format format {16, 2, 44100};
        REQUIRE(format.block_align() == 4);
        REQUIRE(format.bytes_per_second() == 176400);
        REQUIRE(format.audio_format == riff::wave::AudioFormat::pcm);
        REQUIRE(format.validate());
    }

    SECTION("Derived fields of 24 bit audio") {
        const riff::wave::Format format {24, 6, 48000};
        REQUIRE(format.block_align() == 18);
        REQUIRE(format.bytes_per_second() == 864000);
    }

    SECTION("Derived fields out of range") {
        const riff::wave::Format format {0xfff8, 0xffff, 0xffffffff};
        REQUIRE_FALSE(format.block_align().has_value());
        REQUIRE_FALSE(format.bytes_per_second().has_value());

        const auto result = format.validate();
        REQUIRE_FALSE(result);
        REQUIRE(result.error() == riff::Error::Kind::invalid_format);
    }

    SECTION("Validate") {
        REQUIRE(riff::wave::Format {8, 1, 8000}.validate());
        REQUIRE(riff::wave::Format {0, 1, 8000}.validate().error() == riff::Error::Kind::invalid_format);
        REQUIRE(riff::wave::Format {12, 1, 8000}.validate().error() == riff::Error::Kind::invalid_format);
        REQUIRE(riff::wave::Format {16, 0, 8000}.validate().error() == riff::Error::Kind::invalid_format);
        REQUIRE(riff::wave::Format {16, 1, 0}.validate().error() == riff::Error::Kind::invalid_format);
    }

    SECTION("To string") {
        const riff::wave::Format format {16, 2, 48000};
        REQUIRE(format.to_string() == "sample_rate=48000 channels=2 bits_per_sample=16 audio_format=PCM");
        REQUIRE(std::string(riff::wave::to_string(static_cast<riff::wave::AudioFormat>(3))) == "unknown");
    }
}

TEST_CASE("riff::wave::write_pcm") {
    SECTION("Write format and data") {
        riff::ByteStream stream;
        auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
        REQUIRE(writer);

        const std::vector<uint8_t> pcm {0x1, 0x2, 0x3, 0x4, 0x5, 0x6, 0x7, 0x8};
        const auto written = riff::wave::write_pcm(*writer, {16, 2, 44100}, riff::BufferView<const uint8_t>(pcm));
        REQUIRE(written == riff::wave::k_format_chunk_length + 16);
        REQUIRE(writer->close());

        REQUIRE(stream.size() == 52);
        REQUIRE(stream.read_as_string(4) == "RIFF");
        REQUIRE(stream.read_le<uint32_t>().value() == 44);
        REQUIRE(stream.read_as_string(4) == "WAVE");
        REQUIRE(stream.read_as_string(4) == "fmt ");
        REQUIRE(stream.read_le<uint32_t>().value() == 16);      // fmt chunk size
        REQUIRE(stream.read_le<uint16_t>().value() == 0x1);     // Format code
        REQUIRE(stream.read_le<uint16_t>().value() == 2);       // Num channels
        REQUIRE(stream.read_le<uint32_t>().value() == 44100);   // Sample rate
        REQUIRE(stream.read_le<uint32_t>().value() == 176400);  // Avg bytes per sec
        REQUIRE(stream.read_le<uint16_t>().value() == 4);       // Block align
        REQUIRE(stream.read_le<uint16_t>().value() == 16);      // Bits per sample
        REQUIRE(stream.read_as_string(4) == "data");
        REQUIRE(stream.read_le<uint32_t>().value() == 8);  // Data size
    }

    SECTION("Out of range format writes nothing") {
        riff::ByteStream stream;
        auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
        REQUIRE(writer);

        const auto written = riff::wave::write_pcm(*writer, {0xfff8, 0xffff, 0xffffffff}, {});
        REQUIRE_FALSE(written);
        REQUIRE(written.error() == riff::Error::Kind::invalid_format);
        REQUIRE(stream.size() == 12);
    }

    SECTION("Failing format chunk skips the data chunk") {
        riff::test::LimitedOutputStream stream(12 + 20);
        auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
        REQUIRE(writer);

        const std::vector<uint8_t> pcm(4, 0x0);
        const auto written = riff::wave::write_pcm(*writer, {16, 1, 8000}, riff::BufferView<const uint8_t>(pcm));
        REQUIRE_FALSE(written);
        REQUIRE(written.error() == riff::Error::Kind::transport);
        REQUIRE(written.error().bytes_transferred == 8);
        REQUIRE(writer->size() == 12);
        REQUIRE(stream.bytes().size() == 20);
    }

    SECTION("Failing data chunk reports the bytes of both chunks") {
        riff::test::LimitedOutputStream stream(12 + 24 + 8);
        auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
        REQUIRE(writer);

        const std::vector<uint8_t> pcm(4, 0x0);
        const auto written = riff::wave::write_pcm(*writer, {16, 1, 8000}, riff::BufferView<const uint8_t>(pcm));
        REQUIRE_FALSE(written);
        REQUIRE(written.error() == riff::Error::Kind::transport);
        REQUIRE(written.error().bytes_transferred == 24 + 8);
        REQUIRE(writer->size() == 4 + 24 + 8);
    }

    SECTION("Data chunk cut short by the stream") {
        riff::test::ShortWriteOutputStream stream(12 + 24 + 8 + 3);
        auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
        REQUIRE(writer);

        const std::vector<uint8_t> pcm(8, 0x0);
        const auto written = riff::wave::write_pcm(*writer, {16, 1, 8000}, riff::BufferView<const uint8_t>(pcm));
        REQUIRE_FALSE(written);
        REQUIRE(written.error() == riff::Error::Kind::corrupted);
        REQUIRE(written.error().bytes_transferred == 24 + 8 + 3);
        REQUIRE(writer->size() == 4 + 24 + 8 + 3);
    }

    SECTION("Writing to a closed writer") {
        riff::ByteStream stream;
        auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
        REQUIRE(writer);
        REQUIRE(writer->close());

        const auto written = riff::wave::write_pcm(*writer, {16, 2, 44100}, {});
        REQUIRE_FALSE(written);
        REQUIRE(written.error() == riff::Error::Kind::closed);
    }
}

TEST_CASE("riff::wave::read_format") {
    SECTION("Read what was written") {
        const riff::wave::Format format {24, 2, 96000};

        riff::ByteStream stream;
        {
            auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
            REQUIRE(writer);
            const std::vector<uint8_t> pcm(12, 0x0);
            REQUIRE(riff::wave::write_pcm(*writer, format, riff::BufferView<const uint8_t>(pcm)));
            REQUIRE(writer->close());
        }

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);
        REQUIRE(reader->file_type() == riff::file_type::wave);

        const auto read = riff::wave::read_format(*reader);
        REQUIRE(read);
        REQUIRE(*read == format);

        riff::Chunk chunk;
        REQUIRE(reader->read_chunk(chunk) == 20);
        REQUIRE(chunk.identifier == riff::four_cc::data);
        REQUIRE(chunk.data.size() == 12);
    }

    SECTION("Consistent fields") {
        riff::ByteStream stream;
        write_format_chunk(stream, 1, 8000, 16000, 2, 16);

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);

        const auto format = riff::wave::read_format(*reader);
        REQUIRE(format);
        REQUIRE(format->channels == 1);
        REQUIRE(format->sample_rate == 8000);
        REQUIRE(format->bits_per_sample == 16);
        REQUIRE(format->audio_format == riff::wave::AudioFormat::pcm);
    }

    SECTION("Byte rate mismatch is corruption") {
        riff::ByteStream stream;
        write_format_chunk(stream, 2, 44100, 176401, 4, 16);

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);

        const auto format = riff::wave::read_format(*reader);
        REQUIRE_FALSE(format);
        REQUIRE(format.error() == riff::Error::Kind::corrupted);
    }

    SECTION("Block align mismatch is corruption") {
        riff::ByteStream stream;
        write_format_chunk(stream, 2, 44100, 176400, 2, 16);

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);

        const auto format = riff::wave::read_format(*reader);
        REQUIRE_FALSE(format);
        REQUIRE(format.error() == riff::Error::Kind::corrupted);
    }

    SECTION("Wrong identifier is corruption") {
        riff::ByteStream stream;
        {
            auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
            REQUIRE(writer);
            REQUIRE(writer->write_chunk(riff::Chunk {riff::four_cc::data, std::vector<uint8_t>(16, 0x0)}) == 24);
        }

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);

        const auto format = riff::wave::read_format(*reader);
        REQUIRE_FALSE(format);
        REQUIRE(format.error() == riff::Error::Kind::corrupted);
    }

    SECTION("Wrong size is corruption") {
        riff::ByteStream stream;
        {
            auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
            REQUIRE(writer);
            REQUIRE(writer->write_chunk(riff::Chunk {riff::four_cc::fmt, std::vector<uint8_t>(18, 0x0)}) == 26);
        }

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);

        const auto format = riff::wave::read_format(*reader);
        REQUIRE_FALSE(format);
        REQUIRE(format.error() == riff::Error::Kind::corrupted);
    }

    SECTION("Odd sized payload occupying the same space is corruption") {
        riff::ByteStream stream;
        {
            auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
            REQUIRE(writer);
            REQUIRE(writer->write_chunk(riff::Chunk {riff::four_cc::fmt, std::vector<uint8_t>(15, 0x0)}) == 24);
        }

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);

        const auto format = riff::wave::read_format(*reader);
        REQUIRE_FALSE(format);
        REQUIRE(format.error() == riff::Error::Kind::corrupted);
    }

    SECTION("End of stream is passed through") {
        riff::ByteStream stream;
        {
            auto writer = riff::RiffWriter::open(stream, riff::file_type::wave);
            REQUIRE(writer);
        }

        auto reader = riff::RiffReader::open(stream);
        REQUIRE(reader);

        const auto format = riff::wave::read_format(*reader);
        REQUIRE_FALSE(format);
        REQUIRE(format.error() == riff::Error::Kind::end_of_stream);
    }
}
