/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "riffkit/core/streams/input_stream_view.hpp"

#include <cstring>

riff::InputStreamView::InputStreamView(const BufferView<const uint8_t> bytes) : bytes_(bytes) {}

riff::InputStreamView::InputStreamView(const uint8_t* data, const size_t size) : bytes_(data, size) {
    RIFF_ASSERT(data != nullptr, "Data must not be nullptr");
}

void riff::InputStreamView::reset() {
    position_ = 0;
}

tl::expected<size_t, riff::InputStream::Error> riff::InputStreamView::read(uint8_t* buffer, const size_t size) {
    if (size > bytes_.size() - position_) {
        return tl::unexpected(Error::insufficient_data);
    }
    if (size != 0) {
        std::memcpy(buffer, bytes_.data() + position_, size);
        position_ += size;
    }
    return size;
}

bool riff::InputStreamView::set_read_position(const size_t position) {
    if (position > bytes_.size()) {
        return false;
    }
    position_ = position;
    return true;
}

size_t riff::InputStreamView::get_read_position() {
    return position_;
}

std::optional<size_t> riff::InputStreamView::size() const {
    return bytes_.size();
}

bool riff::InputStreamView::exhausted() {
    return position_ == bytes_.size();
}
