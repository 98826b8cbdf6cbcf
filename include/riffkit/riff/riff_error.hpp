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

#include "riffkit/core/streams/input_stream.hpp"
#include "riffkit/core/streams/output_stream.hpp"

#include <fmt/ostream.h>

#include <optional>
#include <ostream>
#include <string>
#include <variant>

namespace riff {

/**
 * The error type reported by the RIFF reader, writer and the codecs built on top of them. Callers branch on the kind
 * of an error, never on its message.
 */
struct Error {
    enum class Kind {
        /// The stream ended cleanly at a chunk boundary; there are no more chunks.
        end_of_stream,
        /// The data violates the structure of the container (bad magic, size mismatch, short read, etc.).
        corrupted,
        /// The writer was already closed.
        closed,
        /// Reserved for chunks which are invalid for the context they appear in.
        bad_chunk,
        /// A value doesn't describe a valid format (for example a WAVE format without channels).
        invalid_format,
        /// The underlying stream failed. The original stream error is available through transport_error.
        transport,
    };

    using TransportError = std::variant<InputStream::Error, OutputStream::Error>;

    Kind kind {Kind::corrupted};
    /// The error reported by the stream, only set for Kind::transport.
    std::optional<TransportError> transport_error;
    /// The number of bytes which made it to the stream before the error occurred.
    size_t bytes_transferred {};
    /// Human readable details, for logging.
    std::string message;

    static Error end_of_stream();
    static Error corrupted(std::string message);
    static Error closed();
    static Error bad_chunk(std::string message);
    static Error invalid_format(std::string message);
    static Error from(InputStream::Error error);
    static Error from(OutputStream::Error error);

    /**
     * @param k The kind to test for.
     * @return True if this error is of given kind.
     */
    [[nodiscard]] bool is(const Kind k) const {
        return kind == k;
    }

    /**
     * Sets the number of bytes which made it to the stream before the error occurred.
     * @param n The number of bytes.
     * @return This error.
     */
    Error& with_bytes_transferred(size_t n);

    /**
     * @return A description of this error, including the kind and the message.
     */
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const Error& error, const Kind kind) {
        return error.kind == kind;
    }

    friend bool operator!=(const Error& error, const Kind kind) {
        return error.kind != kind;
    }
};

/**
 * @param kind The kind to convert.
 * @return The name of the kind.
 */
const char* to_string(Error::Kind kind);

std::ostream& operator<<(std::ostream& os, const Error& error);
std::ostream& operator<<(std::ostream& os, Error::Kind kind);

}  // namespace riff

/// Make riff::Error printable with fmt
template<>
struct fmt::formatter<riff::Error>: ostream_formatter {};

/// Make riff::Error::Kind printable with fmt
template<>
struct fmt::formatter<riff::Error::Kind>: ostream_formatter {};
