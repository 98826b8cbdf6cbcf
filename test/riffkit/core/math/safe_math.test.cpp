/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/core/math/safe_math.hpp"

#include <catch2/catch_all.hpp>

#include <cstdint>

TEST_CASE("safe_math::add") {
    SECTION("Addition without overflow or underflow") {
        REQUIRE(riff::safe_math::add<int8_t>(10, 20) == std::optional<int8_t> {30});
        REQUIRE(riff::safe_math::add<int32_t>(100000, 200000) == std::optional<int32_t> {300000});
        REQUIRE(riff::safe_math::add<uint8_t>(100, 50) == std::optional<uint8_t> {150});
        REQUIRE(riff::safe_math::add<uint64_t>(4, 8) == std::optional<uint64_t> {12});
    }

    SECTION("Positive overflow detection") {
        REQUIRE(riff::safe_math::add<int8_t>(100, 30) == std::nullopt);    // Exceeds int8_t max
        REQUIRE(riff::safe_math::add<uint8_t>(200, 100) == std::nullopt);  // Exceeds uint8_t max
        REQUIRE(riff::safe_math::add<int32_t>(std::numeric_limits<int32_t>::max(), 1) == std::nullopt);
        REQUIRE(riff::safe_math::add<uint64_t>(std::numeric_limits<uint64_t>::max(), 1) == std::nullopt);
    }

    SECTION("Negative underflow detection") {
        REQUIRE(riff::safe_math::add<int8_t>(-100, -30) == std::nullopt);  // Exceeds int8_t min
        REQUIRE(riff::safe_math::add<int32_t>(std::numeric_limits<int32_t>::min(), -1) == std::nullopt);
    }

    SECTION("Chunk sizes near the 32-bit limit") {
        constexpr uint64_t limit = std::numeric_limits<uint32_t>::max();
        REQUIRE(riff::safe_math::add<uint64_t>(limit, 1) == std::optional<uint64_t> {limit + 1});
        REQUIRE(riff::safe_math::add<uint32_t>(static_cast<uint32_t>(limit), 1) == std::nullopt);
    }

    SECTION("Edge cases") {
        REQUIRE(riff::safe_math::add<int8_t>(-128, 0) == std::optional<int8_t> {-128});
        REQUIRE(riff::safe_math::add<int8_t>(127, 0) == std::optional<int8_t> {127});
        REQUIRE(riff::safe_math::add<uint8_t>(255, 0) == std::optional<uint8_t> {255});
        REQUIRE(
            riff::safe_math::add<uint64_t>(std::numeric_limits<uint64_t>::max() - 1, 1)
            == std::optional<uint64_t> {std::numeric_limits<uint64_t>::max()}
        );
    }
}
