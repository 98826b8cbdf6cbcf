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
#include "riffkit/core/containers/buffer_view.hpp"
#include "riffkit/core/streams/output_stream.hpp"

namespace riff {

/**
 * Writes the chunks of a RIFF container to an output stream.
 *
 * The size of a RIFF container is stored in its header, but it's only known after all chunks have been written.
 * Therefore the writer writes a placeholder when opened, and patches the actual size into the header when closed,
 * which is why the stream must support positioned writes.
 *
 * The writer doesn't own the stream; the stream must outlive the writer.
 */
class RiffWriter {
  public:
    /**
     * Writes the RIFF header with a placeholder size, and constructs a writer for the chunks following it.
     * @param ostream The stream to write to.
     * @param file_type The file type of the container, for example "WAVE".
     * @return The writer, or an error if the header couldn't be written.
     */
    static tl::expected<RiffWriter, Error> open(RandomAccessOutputStream& ostream, FileType file_type);

    RiffWriter(const RiffWriter&) = delete;
    RiffWriter& operator=(const RiffWriter&) = delete;

    RiffWriter(RiffWriter&& other) noexcept;
    RiffWriter& operator=(RiffWriter&&) = delete;

    /**
     * Finalizes the header if close() wasn't called.
     */
    ~RiffWriter();

    /**
     * Writes a chunk: its identifier, its size and its payload, followed by a pad byte if the payload has an odd size.
     * @param chunk The chunk to write.
     * @return The number of bytes written, or an error. Nothing is written when the chunk would grow the container
     * beyond what the 32-bit size field can represent. When the stream fails halfway, the bytes which made it are
     * counted in the container size and reported through Error::bytes_transferred.
     */
    [[nodiscard]] tl::expected<size_t, Error> write_chunk(const Chunk& chunk);

    /**
     * Writes a chunk from an identifier and a payload which isn't owned by a Chunk.
     * @param identifier The identifier of the chunk.
     * @param data The payload of the chunk.
     * @return The number of bytes written, or an error.
     */
    [[nodiscard]] tl::expected<size_t, Error> write_chunk(FourCC identifier, BufferView<const uint8_t> data);

    /**
     * Patches the final size into the header. Closing is one-shot: the writer is closed afterwards, even if patching
     * the header failed.
     * @return An expected indicating success or failure. Fails with Error::Kind::closed if already closed.
     */
    [[nodiscard]] tl::expected<void, Error> close();

    /**
     * @return The file type of the container.
     */
    [[nodiscard]] FileType file_type() const;

    /**
     * @return The current size of the container, as it will be written to the header.
     */
    [[nodiscard]] uint32_t size() const;

    /**
     * @return True if the writer was closed.
     */
    [[nodiscard]] bool is_closed() const;

  private:
    RandomAccessOutputStream* ostream_ {};
    FileType file_type_;
    size_t header_position_ {};
    uint64_t size_ {};
    bool closed_ {};

    RiffWriter(RandomAccessOutputStream& ostream, FileType file_type, size_t header_position);

    /**
     * Writes one field of a chunk. Bytes which reach the stream are added to written and to the container size, also
     * when the write falls short.
     */
    [[nodiscard]] tl::expected<void, Error> write_field(const uint8_t* buffer, size_t size, size_t& written);
};

}  // namespace riff
