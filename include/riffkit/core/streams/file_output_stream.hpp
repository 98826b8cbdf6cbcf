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

#include "output_stream.hpp"
#include "riffkit/core/exception.hpp"

#include <filesystem>
#include <fstream>

namespace riff {

/**
 * An implementation of RandomAccessOutputStream for writing to a file. Existing files are truncated.
 */
class FileOutputStream final: public RandomAccessOutputStream {
  public:
    /**
     * Opens the given file for writing. Throws if the file cannot be opened.
     * @param f The path of the file to write.
     */
    explicit FileOutputStream(const std::filesystem::path& f) {
        ofstream_.open(f, std::ios::binary | std::ios::trunc);
        if (!ofstream_.is_open()) {
            RIFF_THROW_EXCEPTION("Failed to open file");
        }
    }

    ~FileOutputStream() override = default;

    // OutputStream overrides
    [[nodiscard]] tl::expected<size_t, Error> write(const uint8_t* buffer, const size_t size) override {
        if (size == 0) {
            return 0;
        }
        // The stream buffer reports how much of the data it took, which is less than size when the disk fills up.
        const auto count =
            ofstream_.rdbuf()->sputn(reinterpret_cast<const char*>(buffer), static_cast<std::streamsize>(size));
        if (count <= 0) {
            return tl::unexpected(Error::failed_to_write);
        }
        return static_cast<size_t>(count);
    }

    void flush() override {
        ofstream_.flush();
    }

    // RandomAccessOutputStream overrides
    [[nodiscard]] tl::expected<void, Error> set_write_position(const size_t position) override {
        ofstream_.seekp(static_cast<std::streamoff>(position));
        if (ofstream_.fail()) {
            return tl::unexpected(Error::failed_to_set_write_position);
        }
        return {};
    }

    [[nodiscard]] size_t get_write_position() override {
        const auto pos = ofstream_.tellp();
        if (pos == -1) {
            RIFF_THROW_EXCEPTION("Failed to get write position");
        }
        return static_cast<size_t>(pos);
    }

    using OutputStream::write;

  private:
    std::ofstream ofstream_;
};

}  // namespace riff
