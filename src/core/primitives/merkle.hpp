/**
 * @file merkle.hpp
 * @brief Merkle root транзакций блока
 */

#pragma once

#include "../types.hpp"

#include <vector>

namespace qtc::core {

/**
 * @brief Объединить два хеша для Merkle дерева
 *
 * @return Hash256 SHA256d(left || right)
 */
[[nodiscard]] Hash256 merkle_hash(
    const Hash256& left,
    const Hash256& right
) noexcept;

/**
 * @brief Вычислить Merkle root из списка txid
 *
 * При нечётном количестве элементов на уровне последний дублируется.
 * Из-за этого правила списки [a, b, c] и [a, b, c, c] дают одинаковый
 * корень, поэтому валидатор блока отдельно отвергает повторяющиеся txid.
 *
 * @param leaves Листья дерева
 * @return Hash256 Корень дерева (нули для пустого списка)
 */
[[nodiscard]] Hash256 compute_merkle_root(std::vector<Hash256> leaves);

} // namespace qtc::core
