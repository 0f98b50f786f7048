/**
 * @file address.hpp
 * @brief Адреса QTC
 *
 * Адрес - текстовая форма lock (SHA256d публичного ключа):
 * "qtc1" + hex(lock, 64 символа) + hex(первые 4 байта SHA256d(lock)).
 * Всего 76 символов.
 */

#pragma once

#include "../types.hpp"

#include <string>
#include <string_view>

namespace qtc::core {

/// @brief Длина адреса в символах
inline constexpr std::size_t ADDRESS_LENGTH = 4 + 64 + 8;

/**
 * @brief Вычислить lock для публичного ключа
 *
 * @param public_key Публичный ключ Dilithium2
 * @return Hash256 SHA256d(public_key)
 */
[[nodiscard]] Hash256 lock_from_public_key(ByteSpan public_key) noexcept;

/**
 * @brief Создать адрес из lock
 */
[[nodiscard]] std::string encode_address(const Hash256& lock);

/**
 * @brief Разобрать адрес
 *
 * @param address Адрес вида qtc1...
 * @return Result<Hash256> Lock или ошибка (префикс, длина, контрольная сумма)
 */
[[nodiscard]] Result<Hash256> decode_address(std::string_view address);

/**
 * @brief Проверить валидность адреса
 */
[[nodiscard]] bool is_valid_address(std::string_view address);

} // namespace qtc::core
