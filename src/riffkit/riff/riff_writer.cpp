/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/riff/riff_writer.hpp"

#include "riffkit/core/byte_order.hpp"
#include "riffkit/core/log.hpp"
#include "riffkit/core/math/safe_math.hpp"
#include "riffkit/riff/padding.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

tl::expected<riff::RiffWriter, riff::Error>
riff::RiffWriter::open(RandomAccessOutputStream& ostream, const FileType file_type) {
    const auto header_position = ostream.get_write_position();

    std::array<uint8_t, k_riff_header_length> header {};
    std::copy(four_cc::riff.bytes().begin(), four_cc::riff.bytes().end(), header.begin());
    // The size stays zero until close().
    std::copy(
        file_type.bytes().begin(), file_type.bytes().end(), header.begin() + k_riff_size_offset + sizeof(uint32_t)
    );

    const auto result = ostream.write(header.data(), header.size());
    if (!result) {
        return tl::unexpected(Error::from(result.error()));
    }
    if (result.value() < header.size()) {
        auto error = Error::corrupted("wrote fewer bytes than the RIFF header holds");
        return tl::unexpected(error.with_bytes_transferred(result.value()));
    }

    return RiffWriter(ostream, file_type, header_position);
}

riff::RiffWriter::RiffWriter(RiffWriter&& other) noexcept :
    ostream_(std::exchange(other.ostream_, nullptr)),
    file_type_(other.file_type_),
    header_position_(other.header_position_),
    size_(other.size_),
    closed_(std::exchange(other.closed_, true)) {}

riff::RiffWriter::~RiffWriter() {
    if (ostream_ == nullptr || closed_) {
        return;
    }
    try {
        if (const auto result = close(); !result) {
            RIFF_ERROR("Failed to finalize RIFF header: {}", result.error());
        }
    } catch (const std::exception& e) {
        RIFF_ERROR("Failed to finalize RIFF header: {}", e.what());
    }
}

tl::expected<size_t, riff::Error> riff::RiffWriter::write_chunk(const Chunk& chunk) {
    return write_chunk(chunk.identifier, BufferView<const uint8_t>(chunk.data.data(), chunk.data.size()));
}

tl::expected<size_t, riff::Error>
riff::RiffWriter::write_chunk(const FourCC identifier, const BufferView<const uint8_t> data) {
    if (closed_) {
        return tl::unexpected(Error::closed());
    }

    const auto chunk_length = safe_math::add<uint64_t>(k_chunk_header_length, padded_length(data.size()));
    const auto new_size = chunk_length ? safe_math::add<uint64_t>(size_, *chunk_length) : std::nullopt;
    if (!new_size || *new_size > std::numeric_limits<uint32_t>::max()) {
        RIFF_WARNING("Chunk '{}' of {} bytes would overflow the RIFF size field", identifier, data.size());
        return tl::unexpected(Error::corrupted("wrote too many bytes - size overflow"));
    }

    // Fits, given the overflow check above.
    std::array<uint8_t, sizeof(uint32_t)> size_field {};
    write_le<uint32_t>(size_field.data(), static_cast<uint32_t>(data.size()));

    size_t written = 0;
    RIFF_OK_OR_RETURN(write_field(identifier.data(), FourCC::k_size, written));
    RIFF_OK_OR_RETURN(write_field(size_field.data(), size_field.size(), written));
    if (!data.empty()) {
        RIFF_OK_OR_RETURN(write_field(data.data(), data.size(), written));
    }
    if (data.size() % k_word_length != 0) {
        constexpr uint8_t pad_byte = 0;
        RIFF_OK_OR_RETURN(write_field(&pad_byte, sizeof(pad_byte), written));
    }

    RIFF_TRACE("Wrote chunk '{}' with {} bytes of data", identifier, data.size());

    return written;
}

tl::expected<void, riff::Error> riff::RiffWriter::close() {
    if (closed_) {
        return tl::unexpected(Error::closed());
    }
    closed_ = true;

    std::array<uint8_t, sizeof(uint32_t)> size_bytes {};
    write_le<uint32_t>(size_bytes.data(), static_cast<uint32_t>(size_));

    const auto result =
        ostream_->write_at(header_position_ + k_riff_size_offset, size_bytes.data(), size_bytes.size());
    if (!result) {
        return tl::unexpected(Error::from(result.error()));
    }
    if (result.value() < size_bytes.size()) {
        auto error = Error::corrupted("wrote fewer bytes than the RIFF size field holds");
        return tl::unexpected(error.with_bytes_transferred(result.value()));
    }

    ostream_->flush();

    RIFF_TRACE("Finalized RIFF container of type '{}' with size {}", file_type_, size_);

    return {};
}

riff::FileType riff::RiffWriter::file_type() const {
    return file_type_;
}

uint32_t riff::RiffWriter::size() const {
    return static_cast<uint32_t>(size_);
}

bool riff::RiffWriter::is_closed() const {
    return closed_;
}

riff::RiffWriter::RiffWriter(
    RandomAccessOutputStream& ostream, const FileType file_type, const size_t header_position
) :
    ostream_(&ostream), file_type_(file_type), header_position_(header_position), size_(FileType::k_size) {}

tl::expected<void, riff::Error>
riff::RiffWriter::write_field(const uint8_t* buffer, const size_t size, size_t& written) {
    const auto result = ostream_->write(buffer, size);
    if (!result) {
        return tl::unexpected(Error::from(result.error()).with_bytes_transferred(written));
    }

    // Whatever reached the stream is part of the container now, also when the write fell short.
    written += result.value();
    size_ += result.value();

    if (result.value() < size) {
        auto error = Error::corrupted("wrote fewer bytes than expected");
        return tl::unexpected(error.with_bytes_transferred(written));
    }
    return {};
}
