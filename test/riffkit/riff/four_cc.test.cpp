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

#include <catch2/catch_all.hpp>

#include <sstream>

TEST_CASE("riff::FourCC") {
    SECTION("Construct from literal") {
        constexpr riff::FourCC four_cc("fmt ");
        REQUIRE(four_cc.bytes() == std::array<uint8_t, 4> {'f', 'm', 't', ' '});
        REQUIRE(four_cc.to_string() == "fmt ");
        REQUIRE(four_cc == riff::four_cc::fmt);
        static_assert(riff::four_cc::riff != riff::four_cc::data);
    }

    SECTION("Default constructed is all zeros") {
        constexpr riff::FourCC four_cc;
        REQUIRE(four_cc.bytes() == std::array<uint8_t, 4> {});
    }

    SECTION("Construct from bytes") {
        constexpr uint8_t data[] = {'W', 'A', 'V', 'E', 'x'};
        REQUIRE(riff::FourCC::from_bytes(data) == riff::file_type::wave);
    }

    SECTION("Construct from string") {
        REQUIRE(riff::FourCC::from_string("data") == riff::four_cc::data);
        REQUIRE(riff::FourCC::from_string("WEBP") == riff::file_type::webp);
        REQUIRE_FALSE(riff::FourCC::from_string("dat").has_value());
        REQUIRE_FALSE(riff::FourCC::from_string("datas").has_value());
        REQUIRE_FALSE(riff::FourCC::from_string("").has_value());
    }

    SECTION("Comparison is case sensitive") {
        REQUIRE(riff::FourCC("RIFF") != riff::FourCC("riff"));
        REQUIRE(riff::FourCC("RIFF") != riff::FourCC("RIFX"));
    }

    SECTION("Printing replaces non printable characters") {
        constexpr uint8_t data[] = {'a', 0x0, 'b', 0x7f};
        std::ostringstream os;
        os << riff::FourCC::from_bytes(data);
        REQUIRE(os.str() == "a.b.");
        REQUIRE(riff::FourCC::from_bytes(data).to_string().size() == 4);
    }

    SECTION("Format with fmt") {
        REQUIRE(fmt::format("'{}'", riff::four_cc::smpl) == "'smpl'");
        REQUIRE(fmt::format("{}", riff::four_cc::wsmp) == "wsmp");
    }
}
