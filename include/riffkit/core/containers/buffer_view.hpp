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

#include "riffkit/core/assert.hpp"
#include "riffkit/core/byte_order.hpp"

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace riff {

/**
 * A non-owning view over contiguous elements, similar to std::string_view. Chunk payloads are passed around as
 * BufferView<const uint8_t>.
 * @tparam Type The element type, const qualified for read-only views.
 */
template<class Type>
class BufferView {
  public:
    BufferView() = default;

    /**
     * @param data The first element. A nullptr results in an empty view.
     * @param size The number of elements.
     */
    BufferView(Type* data, const size_t size) : data_(data), size_(data == nullptr ? 0 : size) {}

    /**
     * Views the elements of a contiguous container like std::vector or std::array. The container must outlive the view.
     * @param container The container.
     */
    template<
        class Container,
        std::enable_if_t<
            !std::is_same_v<std::remove_cv_t<Container>, BufferView>
                && std::is_convertible_v<decltype(std::declval<Container&>().data()), Type*>,
            bool> = true>
    explicit BufferView(Container& container) : BufferView(container.data(), container.size()) {}

    Type& operator[](const size_t index) const {
        return data_[index];
    }

    [[nodiscard]] Type* data() const {
        return data_;
    }

    [[nodiscard]] size_t size() const {
        return size_;
    }

    [[nodiscard]] bool empty() const {
        return size_ == 0;
    }

    /**
     * Decodes a little endian integer at given byte offset. Only available on byte views. An out of range offset is a
     * programming error, and is asserted.
     * @param offset The offset in bytes.
     * @return The decoded value.
     */
    template<typename ValueType>
    [[nodiscard]] ValueType read_le(const size_t offset) const {
        static_assert(sizeof(Type) == 1, "Only byte views can be decoded");
        RIFF_ASSERT(offset + sizeof(ValueType) <= size_, "Read beyond the end of the buffer view");
        return riff::read_le<ValueType>(reinterpret_cast<const uint8_t*>(data_) + offset);
    }

  private:
    Type* data_ {nullptr};
    size_t size_ {0};
};

}  // namespace riff
