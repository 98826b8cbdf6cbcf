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

#include "chunk.hpp"
#include "four_cc.hpp"
#include "riff_error.hpp"
#include "riffkit/core/expected.hpp"
#include "riffkit/core/streams/input_stream.hpp"

#include <vector>

namespace riff {

/**
 * Reads the chunks of a RIFF container from an input stream, strictly in sequence. The reader keeps track of the
 * number of bytes consumed and reports the stream as corrupted as soon as it yields more data than the container
 * header declares.
 *
 * The reader doesn't own the stream; the stream must outlive the reader.
 */
class RiffReader {
  public:
    /**
     * Reads the RIFF header from the given stream and constructs a reader positioned at the first chunk.
     * A short header is always reported as Error::Kind::corrupted.
     * @param istream The stream to read from.
     * @return The reader, or an error if the header is invalid or couldn't be read.
     */
    static tl::expected<RiffReader, Error> open(InputStream& istream);

    RiffReader(const RiffReader&) = delete;
    RiffReader& operator=(const RiffReader&) = delete;

    RiffReader(RiffReader&&) noexcept = default;
    RiffReader& operator=(RiffReader&&) noexcept = default;

    /**
     * Reads the next chunk. The pad byte following an odd sized payload is consumed, but not exposed.
     * @param chunk The chunk to read into. Only modified when reading succeeds.
     * @return The number of bytes consumed (header plus padded payload), or Error::Kind::end_of_stream when the stream
     * ended cleanly at a chunk boundary. Other errors carry the number of bytes this call consumed before failing.
     */
    [[nodiscard]] tl::expected<size_t, Error> read_chunk(Chunk& chunk);

    /**
     * Reads all remaining chunks until the end of the stream. When an error occurs, the chunks read up to that point
     * are left in the given vector.
     * @param chunks The vector to append the chunks to.
     * @return An expected indicating success or failure.
     */
    [[nodiscard]] tl::expected<void, Error> read_to_end(std::vector<Chunk>& chunks);

    /**
     * @return The file type of the container, for example "WAVE".
     */
    [[nodiscard]] FileType file_type() const;

    /**
     * @return The size as declared by the container header.
     */
    [[nodiscard]] uint32_t size() const;

    /**
     * @return The number of bytes consumed after the size field, including the file type.
     */
    [[nodiscard]] uint64_t bytes_read() const;

  private:
    InputStream* istream_ {};
    FileType file_type_;
    uint32_t size_ {};
    uint64_t bytes_read_ {};

    RiffReader(InputStream& istream, FileType file_type, uint32_t size);

    /**
     * Reads exactly size bytes. Bytes which arrive are added to consumed, also when the read falls short.
     */
    [[nodiscard]] tl::expected<void, Error> read_exactly(uint8_t* buffer, size_t size, size_t& consumed);

    /**
     * Accounts for count bytes received from a read of requested bytes, and checks them against the declared size.
     */
    [[nodiscard]] tl::expected<void, Error> consume(size_t count, size_t requested, size_t& consumed);
};

}  // namespace riff
