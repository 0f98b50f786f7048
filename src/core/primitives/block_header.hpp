/**
 * @file block_header.hpp
 * @brief 80-байтный заголовок блока QTC
 *
 * Хеш блока вычисляется только по канонической бинарной кодировке
 * заголовка фиксированной длины, поэтому любые два узла получают
 * побайтово одинаковый хеш.
 */

#pragma once

#include "../types.hpp"
#include "../constants.hpp"
#include "uint256.hpp"

#include <array>
#include <cstdint>
#include <span>

namespace qtc::core {

/// @brief Размер заголовка блока в байтах
inline constexpr std::size_t BLOCK_HEADER_SIZE = constants::BLOCK_HEADER_SIZE;

/**
 * @brief Заголовок блока (80 байт)
 *
 * Структура:
 * - version:     4 байта (int32_t, little-endian)
 * - prev_hash:   32 байта
 * - merkle_root: 32 байта
 * - timestamp:   4 байта (uint32_t, little-endian)
 * - bits:        4 байта (uint32_t, little-endian) - compact target
 * - nonce:       4 байта (uint32_t, little-endian)
 */
struct BlockHeader {
    /// @brief Версия блока
    int32_t version{constants::BLOCK_VERSION};

    /// @brief Хеш предыдущего блока
    Hash256 prev_hash{};

    /// @brief Корень Merkle дерева транзакций
    Hash256 merkle_root{};

    /// @brief Временная метка (Unix timestamp)
    uint32_t timestamp{0};

    /// @brief Compact target (nBits)
    uint32_t bits{0};

    /// @brief Nonce для proof-of-work
    uint32_t nonce{0};

    /**
     * @brief Сериализовать заголовок в 80 байт
     */
    [[nodiscard]] std::array<uint8_t, BLOCK_HEADER_SIZE> serialize() const noexcept;

    /**
     * @brief Десериализовать заголовок из span
     *
     * @param data Span данных (должен быть минимум 80 байт)
     */
    [[nodiscard]] static BlockHeader deserialize(
        std::span<const uint8_t, BLOCK_HEADER_SIZE> data
    ) noexcept;

    /**
     * @brief Вычислить хеш заголовка (double SHA256)
     */
    [[nodiscard]] Hash256 hash() const noexcept;

    /**
     * @brief Получить target из compact bits
     */
    [[nodiscard]] uint256 get_target() const noexcept;

    /**
     * @brief Проверить, соответствует ли хеш target
     *
     * @return true если hash <= target и target не нулевой
     */
    [[nodiscard]] bool check_pow() const noexcept;

    /**
     * @brief Вычислить сложность относительно pow limit 0x1d00ffff
     */
    [[nodiscard]] double get_difficulty() const noexcept;

    [[nodiscard]] bool operator==(const BlockHeader&) const noexcept = default;
};

/**
 * @brief Преобразовать compact bits в 256-битный target
 *
 * @param bits Compact representation
 * @return uint256 Target; ноль для отрицательных и переполненных значений
 */
[[nodiscard]] uint256 bits_to_target(uint32_t bits) noexcept;

/**
 * @brief Преобразовать 256-битный target в compact bits
 *
 * Младшие разряды за пределами 3-байтной мантиссы отбрасываются.
 */
[[nodiscard]] uint32_t target_to_bits(const uint256& target) noexcept;

/**
 * @brief Вычислить сложность из compact bits
 */
[[nodiscard]] double bits_to_difficulty(uint32_t bits) noexcept;

/**
 * @brief Ожидаемое количество хешей для блока с данным bits
 *
 * work = 2^256 / (target + 1), вычисляется как ~target / (target + 1) + 1.
 */
[[nodiscard]] uint256 block_work(uint32_t bits) noexcept;

} // namespace qtc::core
