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

#include "input_stream.hpp"
#include "output_stream.hpp"

#include <vector>

namespace riff {

/**
 * An in-memory stream backed by a growable vector. Used to assemble RIFF files in memory and to read them back.
 */
class ByteStream final: public InputStream, public RandomAccessOutputStream {
  public:
    ByteStream() = default;
    explicit ByteStream(std::vector<uint8_t> data);

    /**
     * Drops all data and moves both positions back to 0.
     */
    void reset();

    /**
     * @return The bytes held by this stream.
     */
    [[nodiscard]] const std::vector<uint8_t>& data() const;

    // InputStream overrides
    [[nodiscard]] tl::expected<size_t, InputStream::Error> read(uint8_t* buffer, size_t size) override;
    [[nodiscard]] bool set_read_position(size_t position) override;
    [[nodiscard]] size_t get_read_position() override;
    [[nodiscard]] std::optional<size_t> size() const override;
    [[nodiscard]] bool exhausted() override;

    // OutputStream overrides
    [[nodiscard]] tl::expected<size_t, OutputStream::Error> write(const uint8_t* buffer, size_t size) override;
    void flush() override;

    // RandomAccessOutputStream overrides
    [[nodiscard]] tl::expected<void, OutputStream::Error> set_write_position(size_t position) override;
    [[nodiscard]] size_t get_write_position() override;

    using OutputStream::write;

  private:
    std::vector<uint8_t> data_;
    size_t read_position_ = 0;
    size_t write_position_ = 0;
};

}  // namespace riff
