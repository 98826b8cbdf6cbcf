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

riff::Error riff::Error::end_of_stream() {
    return Error {Kind::end_of_stream, std::nullopt, 0, "end of stream"};
}

riff::Error riff::Error::corrupted(std::string message) {
    return Error {Kind::corrupted, std::nullopt, 0, std::move(message)};
}

riff::Error riff::Error::closed() {
    return Error {Kind::closed, std::nullopt, 0, "writer is closed"};
}

riff::Error riff::Error::bad_chunk(std::string message) {
    return Error {Kind::bad_chunk, std::nullopt, 0, std::move(message)};
}

riff::Error riff::Error::invalid_format(std::string message) {
    return Error {Kind::invalid_format, std::nullopt, 0, std::move(message)};
}

riff::Error riff::Error::from(const InputStream::Error error) {
    return Error {Kind::transport, error, 0, InputStream::to_string(error)};
}

riff::Error riff::Error::from(const OutputStream::Error error) {
    return Error {Kind::transport, error, 0, OutputStream::to_string(error)};
}

riff::Error& riff::Error::with_bytes_transferred(const size_t n) {
    bytes_transferred = n;
    return *this;
}

std::string riff::Error::to_string() const {
    if (message.empty()) {
        return riff::to_string(kind);
    }
    return std::string(riff::to_string(kind)) + ": " + message;
}

const char* riff::to_string(const Error::Kind kind) {
    switch (kind) {
        case Error::Kind::end_of_stream:
            return "end_of_stream";
        case Error::Kind::corrupted:
            return "corrupted";
        case Error::Kind::closed:
            return "closed";
        case Error::Kind::bad_chunk:
            return "bad_chunk";
        case Error::Kind::invalid_format:
            return "invalid_format";
        case Error::Kind::transport:
            return "transport";
    }
    return "unknown";
}

std::ostream& riff::operator<<(std::ostream& os, const Error& error) {
    os << error.to_string();
    return os;
}

std::ostream& riff::operator<<(std::ostream& os, const Error::Kind kind) {
    os << to_string(kind);
    return os;
}
