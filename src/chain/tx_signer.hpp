/**
 * @file tx_signer.hpp
 * @brief Подпись входов транзакции
 */

#pragma once

#include "../core/types.hpp"
#include "../core/primitives/transaction.hpp"
#include "../crypto/dilithium.hpp"

#include <span>

namespace qtc::chain {

/**
 * @brief Подписать все входы транзакции
 *
 * Сначала всем входам назначаются публичные ключи, затем каждый вход
 * подписывает общий signature_hash().
 *
 * @param tx Транзакция (изменяется на месте)
 * @param keys Ключ для каждого входа (размер равен количеству входов)
 */
[[nodiscard]] Result<void> sign_transaction(
    core::Transaction& tx,
    std::span<const crypto::KeyPair* const> keys
);

/**
 * @brief Подписать все входы одним ключом
 */
[[nodiscard]] Result<void> sign_transaction(core::Transaction& tx, const crypto::KeyPair& key);

} // namespace qtc::chain
