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

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <type_traits>

namespace riff {

// RIFF stores every integer least significant byte first. Big endian hosts swap on the way in and out.
#if (defined(__BYTE_ORDER__) && (__BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)) || (defined(__BIG_ENDIAN__) && __BIG_ENDIAN__)
static constexpr bool little_endian = false;
#else
static constexpr bool little_endian = true;
#endif

/**
 * Reverses the byte order of an integer, or of an enum backed by one.
 * @param value The value to swap.
 * @return The value with its bytes in reverse order.
 */
template<typename Type, std::enable_if_t<std::is_integral_v<Type> || std::is_enum_v<Type>, bool> = true>
constexpr Type swap_bytes(const Type value) {
    using Bits = std::make_unsigned_t<Type>;
    auto in = static_cast<Bits>(value);
    Bits out = 0;
    for (size_t i = 0; i < sizeof(Type); ++i) {
        out = static_cast<Bits>((out << 8) | (in & 0xff));
        in = static_cast<Bits>(in >> 8);
    }
    return static_cast<Type>(out);
}

/**
 * Converts a value between host order and little endian order. The conversion is its own inverse.
 * @param value The value to convert.
 * @return The converted value.
 */
template<typename Type>
constexpr Type host_to_le(const Type value) {
    if constexpr (little_endian) {
        return value;
    } else {
        return swap_bytes(value);
    }
}

/**
 * Reads a value from unaligned memory, in host byte order.
 * @param data Points to at least sizeof(Type) bytes.
 * @return The value.
 */
template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
Type read_ne(const uint8_t* data) {
    Type value;
    std::memcpy(std::addressof(value), data, sizeof(Type));
    return value;
}

/**
 * Reads a little endian integer from unaligned memory.
 * @param data Points to at least sizeof(Type) bytes.
 * @return The value in host byte order.
 */
template<typename Type>
Type read_le(const uint8_t* data) {
    return host_to_le(read_ne<Type>(data));
}

/**
 * Writes a value to unaligned memory, in host byte order.
 * @param dst Points to at least sizeof(Type) writable bytes.
 * @param value The value to write.
 */
template<typename Type, std::enable_if_t<std::is_trivially_copyable_v<Type>, bool> = true>
void write_ne(uint8_t* dst, const Type value) {
    std::memcpy(dst, std::addressof(value), sizeof(Type));
}

/**
 * Writes an integer to unaligned memory in little endian order.
 * @param dst Points to at least sizeof(Type) writable bytes.
 * @param value The value to write.
 */
template<typename Type>
void write_le(uint8_t* dst, const Type value) {
    write_ne(dst, host_to_le(value));
}

}  // namespace riff
