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

#include <fmt/ostream.h>

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace riff {

/**
 * A four character code, used to tag chunks and the file type of a RIFF container. Codes are compared byte-wise and
 * are never interpreted as integers.
 */
class FourCC {
  public:
    static constexpr size_t k_size = 4;

    constexpr FourCC() = default;

    /**
     * Constructs a code from a four character string literal, like FourCC("fmt ").
     * @param literal The literal. Must hold exactly four characters, which is checked at compile time.
     */
    template<size_t N>
    constexpr explicit FourCC(const char (&literal)[N]) :
        bytes_ {
            static_cast<uint8_t>(literal[0]),
            static_cast<uint8_t>(literal[1]),
            static_cast<uint8_t>(literal[2]),
            static_cast<uint8_t>(literal[3]),
        } {
        static_assert(N == k_size + 1, "A FourCC literal must hold exactly four characters");
    }

    /**
     * Constructs a code from the first four bytes of given data.
     * @param data The data, which must hold at least four bytes.
     * @return The code.
     */
    static FourCC from_bytes(const uint8_t* data);

    /**
     * Creates a code from a string of runtime length.
     * @param str The string.
     * @return The code, or an empty optional if the string doesn't hold exactly four characters.
     */
    static std::optional<FourCC> from_string(std::string_view str);

    /**
     * @return The four bytes of this code.
     */
    [[nodiscard]] constexpr const std::array<uint8_t, k_size>& bytes() const {
        return bytes_;
    }

    /**
     * @return A pointer to the four bytes of this code.
     */
    [[nodiscard]] constexpr const uint8_t* data() const {
        return bytes_.data();
    }

    /**
     * @return The code as string. Note: might contain non-printable characters.
     */
    [[nodiscard]] std::string to_string() const;

    constexpr bool operator==(const FourCC& other) const {
        return bytes_[0] == other.bytes_[0] && bytes_[1] == other.bytes_[1] && bytes_[2] == other.bytes_[2]
            && bytes_[3] == other.bytes_[3];
    }

    constexpr bool operator!=(const FourCC& other) const {
        return !(*this == other);
    }

    friend std::ostream& operator<<(std::ostream& os, const FourCC& four_cc);

  private:
    std::array<uint8_t, k_size> bytes_ {};
};

/// The file type tag of a RIFF container is a four character code as well.
using FileType = FourCC;

namespace four_cc {
    inline constexpr FourCC riff("RIFF");
    inline constexpr FourCC fmt("fmt ");
    inline constexpr FourCC data("data");
    inline constexpr FourCC smpl("smpl");
    inline constexpr FourCC wsmp("wsmp");
}  // namespace four_cc

namespace file_type {
    inline constexpr FileType wave("WAVE");
    inline constexpr FileType webp("WEBP");
}  // namespace file_type

}  // namespace riff

/// Make FourCC printable with fmt
template<>
struct fmt::formatter<riff::FourCC>: ostream_formatter {};
