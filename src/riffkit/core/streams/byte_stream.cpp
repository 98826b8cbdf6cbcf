/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/core/streams/byte_stream.hpp"

#include <cstring>
#include <new>
#include <stdexcept>

riff::ByteStream::ByteStream(std::vector<uint8_t> data) : data_(std::move(data)), write_position_(data_.size()) {}

void riff::ByteStream::reset() {
    data_.clear();
    read_position_ = write_position_ = 0;
}

const std::vector<uint8_t>& riff::ByteStream::data() const {
    return data_;
}

tl::expected<size_t, riff::InputStream::Error> riff::ByteStream::read(uint8_t* buffer, const size_t size) {
    const auto available = read_position_ < data_.size() ? data_.size() - read_position_ : 0;
    if (size > available) {
        return tl::unexpected(InputStream::Error::insufficient_data);
    }
    if (size != 0) {
        std::memcpy(buffer, &data_[read_position_], size);
        read_position_ += size;
    }
    return size;
}

bool riff::ByteStream::set_read_position(const size_t position) {
    if (position > data_.size()) {
        return false;
    }
    read_position_ = position;
    return true;
}

size_t riff::ByteStream::get_read_position() {
    return read_position_;
}

std::optional<size_t> riff::ByteStream::size() const {
    return data_.size();
}

bool riff::ByteStream::exhausted() {
    return read_position_ >= data_.size();
}

tl::expected<size_t, riff::OutputStream::Error> riff::ByteStream::write(const uint8_t* buffer, const size_t size) {
    if (size == 0) {
        return 0;
    }

    // Writing beyond the end grows the buffer, zero filling any gap left by set_write_position().
    const auto end = write_position_ + size;
    if (end < write_position_) {
        return tl::unexpected(OutputStream::Error::out_of_memory);
    }
    if (end > data_.size()) {
        try {
            data_.resize(end, 0);
        } catch (const std::bad_alloc&) {
            return tl::unexpected(OutputStream::Error::out_of_memory);
        } catch (const std::length_error&) {
            return tl::unexpected(OutputStream::Error::out_of_memory);
        }
    }

    std::memcpy(&data_[write_position_], buffer, size);
    write_position_ = end;
    return size;
}

void riff::ByteStream::flush() {}

tl::expected<void, riff::OutputStream::Error> riff::ByteStream::set_write_position(const size_t position) {
    write_position_ = position;
    return {};
}

size_t riff::ByteStream::get_write_position() {
    return write_position_;
}
