/**
 * @file block.hpp
 * @brief Полный блок: заголовок и список транзакций
 *
 * Кодировка: заголовок[80] + VarInt count + транзакции.
 * Первая транзакция - coinbase.
 */

#pragma once

#include "../types.hpp"
#include "block_header.hpp"
#include "transaction.hpp"

#include <vector>

namespace qtc::core {

/// @brief Предел количества транзакций при декодировании
inline constexpr std::size_t MAX_BLOCK_ITEMS = 1'000'000;

/**
 * @brief Блок
 */
struct Block {
    BlockHeader header;
    std::vector<Transaction> transactions;

    /**
     * @brief Хеш блока (хеш заголовка)
     */
    [[nodiscard]] Hash256 hash() const noexcept {
        return header.hash();
    }

    /**
     * @brief Вычислить Merkle root по txid транзакций
     */
    [[nodiscard]] Hash256 compute_merkle_root() const;

    /**
     * @brief txid всех транзакций в порядке блока
     */
    [[nodiscard]] std::vector<Hash256> txids() const;

    /**
     * @brief Каноническая кодировка блока
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Размер канонической кодировки в байтах
     */
    [[nodiscard]] std::size_t serialized_size() const;

    /**
     * @brief Декодировать блок из байт
     *
     * @return Result<Block> Блок или ошибка декодирования
     */
    [[nodiscard]] static Result<Block> decode(ByteSpan data);

    [[nodiscard]] bool operator==(const Block&) const noexcept = default;
};

} // namespace qtc::core
