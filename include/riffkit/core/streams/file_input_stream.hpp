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
#include "riffkit/core/exception.hpp"

#include <filesystem>
#include <fstream>

namespace riff {

/**
 * Reads a file from disk. Reading past the end of the file results in a short read, which is how the RIFF reader
 * detects truncated files.
 */
class FileInputStream final: public InputStream {
  public:
    /**
     * Opens a file. Throws riff::Exception if the file is missing or can't be opened.
     * @param path The file to open.
     */
    explicit FileInputStream(const std::filesystem::path& path) : file_(path, std::ios::binary) {
        if (!file_.is_open()) {
            RIFF_THROW_EXCEPTION(std::filesystem::exists(path) ? "Failed to open file" : "File does not exist");
        }
        std::error_code ec;
        file_size_ = static_cast<size_t>(std::filesystem::file_size(path, ec));
        if (ec) {
            RIFF_THROW_EXCEPTION("Failed to get file size: " + ec.message());
        }
    }

    // InputStream overrides
    [[nodiscard]] tl::expected<size_t, Error> read(uint8_t* buffer, const size_t size) override {
        file_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
        if (file_.bad()) {
            return tl::unexpected(Error::failed_to_read);
        }
        const auto count = static_cast<size_t>(file_.gcount());
        if (count < size) {
            file_.clear();  // End of file, keep the stream usable for seeking.
        }
        return count;
    }

    bool set_read_position(const size_t position) override {
        file_.clear();
        return static_cast<bool>(file_.seekg(static_cast<std::streamoff>(position)));
    }

    [[nodiscard]] size_t get_read_position() override {
        const auto position = file_.tellg();
        if (position < 0) {
            RIFF_THROW_EXCEPTION("Failed to get read position");
        }
        return static_cast<size_t>(position);
    }

    [[nodiscard]] std::optional<size_t> size() const override {
        return file_size_;
    }

    [[nodiscard]] bool exhausted() override {
        return get_read_position() >= file_size_;
    }

  private:
    std::ifstream file_;
    size_t file_size_ {};
};

}  // namespace riff
