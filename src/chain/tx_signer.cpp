/**
 * @file tx_signer.cpp
 * @brief Реализация подписи транзакций
 */

#include "tx_signer.hpp"

#include <format>
#include <vector>

namespace qtc::chain {

Result<void> sign_transaction(
    core::Transaction& tx,
    std::span<const crypto::KeyPair* const> keys
) {
    if (keys.size() != tx.inputs.size()) {
        return Err<void>(
            ErrorCode::CryptoInvalidLength,
            std::format("Ключей {}, входов {}", keys.size(), tx.inputs.size())
        );
    }

    for (std::size_t i = 0; i < tx.inputs.size(); ++i) {
        if (keys[i] == nullptr) {
            return Err<void>(ErrorCode::CryptoSignFailed, std::format("Нет ключа для входа {}", i));
        }
        tx.inputs[i].public_key = keys[i]->public_key;
    }

    const auto sighash = tx.signature_hash();
    for (std::size_t i = 0; i < tx.inputs.size(); ++i) {
        auto signature = crypto::sign(keys[i]->secret_key, sighash);
        if (!signature) {
            return std::unexpected(signature.error());
        }
        tx.inputs[i].signature = std::move(*signature);
    }
    return {};
}

Result<void> sign_transaction(core::Transaction& tx, const crypto::KeyPair& key) {
    std::vector<const crypto::KeyPair*> keys(tx.inputs.size(), &key);
    return sign_transaction(tx, keys);
}

} // namespace qtc::chain
