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
#include "riffkit/core/containers/buffer_view.hpp"

namespace riff {

/**
 * Reads from memory owned by someone else, which must stay alive as long as the stream is used. Reading past the end
 * fails with Error::insufficient_data, so a view never produces short reads.
 */
class InputStreamView: public InputStream {
  public:
    explicit InputStreamView(BufferView<const uint8_t> bytes);

    InputStreamView(const uint8_t* data, size_t size);

    /**
     * @param container A contiguous byte container, like std::vector<uint8_t> or std::array<uint8_t, N>.
     */
    template<class Container>
    explicit InputStreamView(const Container& container) :
        InputStreamView(BufferView<const uint8_t>(container.data(), container.size())) {}

    /**
     * Moves the read position back to the start.
     */
    void reset();

    // InputStream overrides
    [[nodiscard]] tl::expected<size_t, Error> read(uint8_t* buffer, size_t size) override;
    [[nodiscard]] bool set_read_position(size_t position) override;
    [[nodiscard]] size_t get_read_position() override;
    [[nodiscard]] std::optional<size_t> size() const override;
    [[nodiscard]] bool exhausted() override;

  private:
    BufferView<const uint8_t> bytes_;
    size_t position_ {0};
};

}  // namespace riff
