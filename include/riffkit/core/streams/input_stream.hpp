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

#include "riffkit/core/byte_order.hpp"
#include "riffkit/core/expected.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace riff {

/**
 * Source of bytes for the RIFF reader. Implementations wrap files, memory, or anything else that can be read
 * sequentially and repositioned.
 */
class InputStream {
  public:
    enum class Error {
        insufficient_data,
        failed_to_set_read_position,
        failed_to_read,
    };

    InputStream() = default;
    virtual ~InputStream() = default;

    /**
     * Reads up to size bytes into buffer. A count lower than size means the end of the stream was reached. Streams
     * which can't deliver partial data fail with Error::insufficient_data and leave the read position untouched.
     * @param buffer Destination, must hold at least size bytes.
     * @param size The number of bytes requested.
     * @return The number of bytes actually read.
     */
    [[nodiscard]] virtual tl::expected<size_t, Error> read(uint8_t* buffer, size_t size) = 0;

    /**
     * @param position The new read position, counted from the start of the stream.
     * @return True on success.
     */
    [[nodiscard]] virtual bool set_read_position(size_t position) = 0;

    [[nodiscard]] virtual size_t get_read_position() = 0;

    /**
     * @return The total size of the stream, or an empty optional if the stream doesn't know.
     */
    [[nodiscard]] virtual std::optional<size_t> size() const = 0;

    /**
     * @return True if no bytes are left to read.
     */
    [[nodiscard]] virtual bool exhausted() = 0;

    /**
     * @return size() minus the read position, or an empty optional if the size is unknown.
     */
    [[nodiscard]] std::optional<size_t> remaining();

    /**
     * Moves the read position forward.
     * @param size The number of bytes to skip.
     * @return True on success.
     */
    [[nodiscard]] bool skip(size_t size);

    /**
     * Reads exactly size bytes into a string, which may hold non-printable characters.
     * @param size The number of bytes to read.
     * @return The string, or Error::insufficient_data if fewer bytes were available.
     */
    [[nodiscard]] tl::expected<std::string, Error> read_as_string(size_t size);

    /**
     * Reads a value stored in host byte order.
     */
    template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
    [[nodiscard]] tl::expected<Type, Error> read_ne() {
        Type value;
        const auto count = read(reinterpret_cast<uint8_t*>(std::addressof(value)), sizeof(Type));
        if (!count) {
            return tl::unexpected(count.error());
        }
        if (*count != sizeof(Type)) {
            return tl::unexpected(Error::insufficient_data);
        }
        return value;
    }

    /**
     * Reads a value stored in little endian byte order, which is the byte order of RIFF.
     */
    template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
    [[nodiscard]] tl::expected<Type, Error> read_le() {
        return read_ne<Type>().map([](const Type value) {
            return host_to_le(value);
        });
    }

    static const char* to_string(const Error e) {
        switch (e) {
            case Error::insufficient_data:
                return "insufficient data";
            case Error::failed_to_set_read_position:
                return "failed to set read position";
            case Error::failed_to_read:
                return "failed to read";
        }
        return "unknown error";
    }
};

}  // namespace riff
