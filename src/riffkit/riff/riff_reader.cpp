/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/riff/riff_reader.hpp"

#include "riffkit/core/byte_order.hpp"
#include "riffkit/core/log.hpp"
#include "riffkit/riff/padding.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>

namespace {

// Payloads are read in blocks of this size, so memory grows with the data the stream delivers and not with the size
// a chunk header claims.
constexpr size_t k_read_block_size = 64 * 1024;

riff::Error to_error(const riff::InputStream::Error error, const size_t bytes_transferred) {
    if (error == riff::InputStream::Error::insufficient_data) {
        return riff::Error::corrupted("read fewer bytes than expected").with_bytes_transferred(bytes_transferred);
    }
    return riff::Error::from(error).with_bytes_transferred(bytes_transferred);
}

}  // namespace

tl::expected<riff::RiffReader, riff::Error> riff::RiffReader::open(InputStream& istream) {
    std::array<uint8_t, k_riff_header_length> header {};

    const auto result = istream.read(header.data(), header.size());
    if (!result) {
        if (result.error() == InputStream::Error::insufficient_data) {
            return tl::unexpected(Error::corrupted("data is too short to hold a RIFF header"));
        }
        return tl::unexpected(Error::from(result.error()));
    }
    if (result.value() < header.size()) {
        return tl::unexpected(
            Error::corrupted("data is too short to hold a RIFF header").with_bytes_transferred(result.value())
        );
    }

    if (FourCC::from_bytes(header.data()) != four_cc::riff) {
        return tl::unexpected(Error::corrupted("data does not begin with RIFF header"));
    }

    const auto size = read_le<uint32_t>(header.data() + k_riff_size_offset);
    if (size < FileType::k_size) {
        return tl::unexpected(Error::corrupted(fmt::format("impossibly small file size ({})", size)));
    }

    const auto file_type = FourCC::from_bytes(header.data() + k_riff_size_offset + sizeof(uint32_t));
    RIFF_TRACE("Opened RIFF container of type '{}' with size {}", file_type, size);

    return RiffReader(istream, file_type, size);
}

tl::expected<size_t, riff::Error> riff::RiffReader::read_chunk(Chunk& chunk) {
    // Shortcut for streams which know their size. Sequential streams only notice the end when a read comes back empty.
    if (istream_->exhausted()) {
        return tl::unexpected(Error::end_of_stream());
    }

    std::array<uint8_t, k_chunk_header_length> header {};
    const auto header_read = istream_->read(header.data(), header.size());
    if (!header_read) {
        if (header_read.error() == InputStream::Error::insufficient_data && istream_->remaining().value_or(0) == 0) {
            return tl::unexpected(Error::end_of_stream());
        }
        return tl::unexpected(to_error(header_read.error(), 0));
    }
    if (header_read.value() == 0) {
        return tl::unexpected(Error::end_of_stream());
    }

    size_t consumed = 0;
    if (const auto result = consume(header_read.value(), header.size(), consumed); !result) {
        return tl::unexpected(result.error());
    }

    const auto identifier = FourCC::from_bytes(header.data());
    const auto chunk_size = read_le<uint32_t>(header.data() + FourCC::k_size);
    const auto padded_size = padded_length(chunk_size);

    // Refuse payloads which can't fit in the declared container size, or in what is left of the stream.
    if (bytes_read_ + padded_size > padded_length(size_)) {
        RIFF_WARNING("Chunk '{}' of {} bytes exceeds the declared RIFF size of {}", identifier, chunk_size, size_);
        auto error = Error::corrupted(fmt::format(
            "chunk '{}' ({} bytes) extends beyond the declared RIFF size ({})", identifier, chunk_size, size_
        ));
        return tl::unexpected(error.with_bytes_transferred(consumed));
    }
    if (const auto remaining = istream_->remaining(); remaining && padded_size > *remaining) {
        RIFF_WARNING(
            "Chunk '{}' of {} bytes exceeds the {} bytes left in the stream", identifier, chunk_size, *remaining
        );
        auto error = Error::corrupted(
            fmt::format("chunk '{}' ({} bytes) extends beyond the end of the stream", identifier, chunk_size)
        );
        return tl::unexpected(error.with_bytes_transferred(consumed));
    }

    std::vector<uint8_t> data;
    while (data.size() < padded_size) {
        const auto offset = data.size();
        const auto block = static_cast<size_t>(std::min<uint64_t>(padded_size - offset, k_read_block_size));
        data.resize(offset + block);
        if (const auto result = read_exactly(data.data() + offset, block, consumed); !result) {
            return tl::unexpected(result.error());
        }
    }

    data.resize(chunk_size);  // Drops the pad byte, if any.

    chunk.identifier = identifier;
    chunk.data = std::move(data);

    RIFF_TRACE("Read chunk '{}' with {} bytes of data", identifier, chunk_size);

    return consumed;
}

tl::expected<void, riff::Error> riff::RiffReader::read_to_end(std::vector<Chunk>& chunks) {
    while (true) {
        Chunk chunk;
        const auto result = read_chunk(chunk);
        if (!result) {
            if (result.error().is(Error::Kind::end_of_stream)) {
                return {};
            }
            return tl::unexpected(result.error());
        }
        chunks.push_back(std::move(chunk));
    }
}

riff::FileType riff::RiffReader::file_type() const {
    return file_type_;
}

uint32_t riff::RiffReader::size() const {
    return size_;
}

uint64_t riff::RiffReader::bytes_read() const {
    return bytes_read_;
}

riff::RiffReader::RiffReader(InputStream& istream, const FileType file_type, const uint32_t size) :
    istream_(&istream), file_type_(file_type), size_(size), bytes_read_(FileType::k_size) {}

tl::expected<void, riff::Error>
riff::RiffReader::read_exactly(uint8_t* buffer, const size_t size, size_t& consumed) {
    const auto result = istream_->read(buffer, size);
    if (!result) {
        return tl::unexpected(to_error(result.error(), consumed));
    }
    return consume(result.value(), size, consumed);
}

tl::expected<void, riff::Error>
riff::RiffReader::consume(const size_t count, const size_t requested, size_t& consumed) {
    bytes_read_ += count;
    consumed += count;

    if (count < requested) {
        return tl::unexpected(Error::corrupted("read fewer bytes than expected").with_bytes_transferred(consumed));
    }

    if (bytes_read_ > padded_length(size_)) {
        auto error = Error::corrupted("read outside of the declared RIFF size");
        return tl::unexpected(error.with_bytes_transferred(consumed));
    }

    return {};
}
