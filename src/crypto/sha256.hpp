/**
 * @file sha256.hpp
 * @brief SHA256 и SHA256d
 *
 * SHA256d (двойной SHA256) используется для:
 * - хеша заголовка блока (proof-of-work)
 * - txid и хеша подписи транзакции
 * - Merkle tree
 * - lock = SHA256d(публичный ключ)
 * - контрольных сумм записей журнала и адресов
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <array>
#include <span>
#include <cstdint>

namespace qtc::crypto {

/**
 * @brief SHA256 состояние (8 x 32-bit слов)
 */
using Sha256State = std::array<uint32_t, 8>;

/**
 * @brief Инкрементальный SHA256 (FIPS 180-4)
 *
 * Позволяет хешировать данные частями без промежуточной конкатенации.
 *
 * @code
 * Sha256 hasher;
 * hasher.update(header);
 * hasher.update(payload);
 * Hash256 digest = hasher.finalize();
 * @endcode
 */
class Sha256 {
public:
    Sha256() noexcept;

    /**
     * @brief Добавить данные
     */
    Sha256& update(ByteSpan data) noexcept;

    /**
     * @brief Завершить вычисление и получить хеш
     *
     * После вызова объект сбрасывается в начальное состояние.
     */
    [[nodiscard]] Hash256 finalize() noexcept;

    /**
     * @brief Сбросить в начальное состояние
     */
    void reset() noexcept;

private:

    Sha256State state_;
    std::array<uint8_t, constants::SHA256_BLOCK_SIZE> buffer_{};
    std::size_t buffered_{0};
    uint64_t total_len_{0};
};

/**
 * @brief Функция сжатия SHA256 для одного 64-байтного блока
 *
 * @param state Состояние хеша (будет модифицировано)
 * @param block Указатель на 64 байта данных
 */
void sha256_transform(Sha256State& state, const uint8_t* block) noexcept;

/**
 * @brief Вычислить SHA256 хеш данных произвольной длины
 */
[[nodiscard]] Hash256 sha256(ByteSpan data) noexcept;

/**
 * @brief Вычислить SHA256d = SHA256(SHA256(data))
 */
[[nodiscard]] Hash256 sha256d(ByteSpan data) noexcept;

} // namespace qtc::crypto
