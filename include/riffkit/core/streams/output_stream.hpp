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

namespace riff {

/**
 * Sink of bytes for the RIFF writer.
 */
class OutputStream {
  public:
    enum class Error {
        failed_to_write,
        out_of_memory,
        failed_to_set_write_position,
    };

    OutputStream() = default;
    virtual ~OutputStream() = default;

    /**
     * Writes up to size bytes from buffer. A count lower than size means the sink stored a prefix of the buffer and
     * couldn't take the rest. Fails when not a single byte could be written.
     * @param buffer Source of the data.
     * @param size The number of bytes to write.
     * @return The number of bytes which reached the sink.
     */
    [[nodiscard]] virtual tl::expected<size_t, Error> write(const uint8_t* buffer, size_t size) = 0;

    /**
     * Pushes buffered data to the underlying storage. A no-op for sinks without buffering.
     */
    virtual void flush() = 0;

    [[nodiscard]] tl::expected<size_t, Error> write(const char* buffer, const size_t size) {
        return write(reinterpret_cast<const uint8_t*>(buffer), size);
    }

    /**
     * Writes a value in host byte order.
     */
    template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
    [[nodiscard]] tl::expected<size_t, Error> write_ne(const Type value) {
        return write(reinterpret_cast<const uint8_t*>(std::addressof(value)), sizeof(Type));
    }

    /**
     * Writes a value in little endian byte order, which is the byte order of RIFF.
     */
    template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
    [[nodiscard]] tl::expected<size_t, Error> write_le(const Type value) {
        return write_ne(host_to_le(value));
    }

    static const char* to_string(const Error e) {
        switch (e) {
            case Error::failed_to_write:
                return "failed to write";
            case Error::out_of_memory:
                return "out of memory";
            case Error::failed_to_set_write_position:
                return "failed to set write position";
        }
        return "unknown error";
    }
};

/**
 * An output stream which can go back and overwrite bytes it wrote earlier. The RIFF writer needs this to fill in the
 * container size once all chunks are written. Append-only sinks like sockets and pipes can't offer it.
 */
class RandomAccessOutputStream: public OutputStream {
  public:
    /**
     * @param position The new write position, counted from the start of the stream.
     * @return Nothing on success, the reason of the failure otherwise.
     */
    [[nodiscard]] virtual tl::expected<void, Error> set_write_position(size_t position) = 0;

    [[nodiscard]] virtual size_t get_write_position() = 0;

    /**
     * Overwrites bytes at position and moves the write position back to where it was.
     * @param position Where to write.
     * @param buffer Source of the data.
     * @param size The number of bytes to write.
     * @return The number of bytes written, see write().
     */
    [[nodiscard]] tl::expected<size_t, Error> write_at(size_t position, const uint8_t* buffer, size_t size);
};

}  // namespace riff
