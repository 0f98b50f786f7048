/**
 * @file byte_order.hpp
 * @brief Запись и чтение целых чисел в фиксированном порядке байт
 *
 * Каноническая кодировка QTC (заголовки, транзакции, записи журнала)
 * использует little-endian. Big-endian нужен только внутри SHA256.
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <span>

namespace qtc {

inline void write_le32(uint8_t* dest, uint32_t value) noexcept {
    dest[0] = static_cast<uint8_t>(value);
    dest[1] = static_cast<uint8_t>(value >> 8);
    dest[2] = static_cast<uint8_t>(value >> 16);
    dest[3] = static_cast<uint8_t>(value >> 24);
}

inline void write_le64(uint8_t* dest, uint64_t value) noexcept {
    write_le32(dest, static_cast<uint32_t>(value));
    write_le32(dest + 4, static_cast<uint32_t>(value >> 32));
}

[[nodiscard]] inline uint32_t read_le32(const uint8_t* src) noexcept {
    return static_cast<uint32_t>(src[0]) |
           (static_cast<uint32_t>(src[1]) << 8) |
           (static_cast<uint32_t>(src[2]) << 16) |
           (static_cast<uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline uint64_t read_le64(const uint8_t* src) noexcept {
    return static_cast<uint64_t>(read_le32(src)) |
           (static_cast<uint64_t>(read_le32(src + 4)) << 32);
}

/**
 * @brief Записать 32-битное число в big-endian (для SHA256)
 */
inline void write_be32(uint8_t* dest, uint32_t value) noexcept {
    dest[0] = static_cast<uint8_t>(value >> 24);
    dest[1] = static_cast<uint8_t>(value >> 16);
    dest[2] = static_cast<uint8_t>(value >> 8);
    dest[3] = static_cast<uint8_t>(value);
}

/**
 * @brief Прочитать 32-битное число в big-endian (для SHA256)
 */
[[nodiscard]] inline uint32_t read_be32(const uint8_t* src) noexcept {
    return (static_cast<uint32_t>(src[0]) << 24) |
           (static_cast<uint32_t>(src[1]) << 16) |
           (static_cast<uint32_t>(src[2]) << 8) |
           static_cast<uint32_t>(src[3]);
}

} // namespace qtc
