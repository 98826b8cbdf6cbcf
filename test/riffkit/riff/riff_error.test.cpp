/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/riff/riff_error.hpp"

#include <catch2/catch_all.hpp>

TEST_CASE("riff::Error") {
    SECTION("Kinds") {
        REQUIRE(riff::Error::end_of_stream() == riff::Error::Kind::end_of_stream);
        REQUIRE(riff::Error::corrupted("x") == riff::Error::Kind::corrupted);
        REQUIRE(riff::Error::closed() == riff::Error::Kind::closed);
        REQUIRE(riff::Error::bad_chunk("x") == riff::Error::Kind::bad_chunk);
        REQUIRE(riff::Error::invalid_format("x") == riff::Error::Kind::invalid_format);
        REQUIRE(riff::Error::corrupted("x") != riff::Error::Kind::closed);
        REQUIRE(riff::Error::closed().is(riff::Error::Kind::closed));
    }

    SECTION("Transport errors keep the stream error") {
        const auto input = riff::Error::from(riff::InputStream::Error::failed_to_read);
        REQUIRE(input == riff::Error::Kind::transport);
        REQUIRE(input.transport_error.has_value());
        REQUIRE(std::get<riff::InputStream::Error>(*input.transport_error) == riff::InputStream::Error::failed_to_read);

        const auto output = riff::Error::from(riff::OutputStream::Error::out_of_memory);
        REQUIRE(output == riff::Error::Kind::transport);
        REQUIRE(
            std::get<riff::OutputStream::Error>(*output.transport_error) == riff::OutputStream::Error::out_of_memory
        );
    }

    SECTION("Only transport errors carry a stream error") {
        REQUIRE_FALSE(riff::Error::corrupted("x").transport_error.has_value());
        REQUIRE_FALSE(riff::Error::end_of_stream().transport_error.has_value());
    }

    SECTION("Bytes transferred") {
        REQUIRE(riff::Error::closed().bytes_transferred == 0);
        auto error = riff::Error::from(riff::OutputStream::Error::failed_to_write).with_bytes_transferred(8);
        REQUIRE(error.bytes_transferred == 8);
    }

    SECTION("To string") {
        REQUIRE(riff::Error::corrupted("bad magic").to_string() == "corrupted: bad magic");
        REQUIRE(riff::Error::closed().to_string() == "closed: writer is closed");
        REQUIRE(riff::Error::from(riff::InputStream::Error::failed_to_read).to_string() == "transport: failed to read");
        REQUIRE(riff::Error {riff::Error::Kind::bad_chunk, std::nullopt, 0, {}}.to_string() == "bad_chunk");
        REQUIRE(std::string(riff::to_string(riff::Error::Kind::invalid_format)) == "invalid_format");
    }

    SECTION("Format with fmt") {
        REQUIRE(fmt::format("{}", riff::Error::end_of_stream()) == "end_of_stream: end of stream");
        REQUIRE(fmt::format("{}", riff::Error::Kind::corrupted) == "corrupted");
    }
}
