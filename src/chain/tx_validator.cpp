/**
 * @file tx_validator.cpp
 * @brief Реализация валидатора транзакций
 */

#include "tx_validator.hpp"
#include "../core/primitives/address.hpp"
#include "../crypto/dilithium.hpp"

#include <unordered_set>

namespace qtc::chain {

namespace {

/**
 * @brief Общая часть проверки выходов
 */
bool outputs_in_range(const Transaction& tx, const core::ChainParams& params) {
    Amount total = 0;
    for (const auto& out : tx.outputs) {
        if (out.amount <= 0 || out.amount > params.rewards.max_supply) {
            return false;
        }
        total += out.amount;
        if (total > params.rewards.max_supply) {
            return false;
        }
    }
    return true;
}

} // namespace

TxValidator::TxValidator(const core::ChainParams& params)
    : params_(params) {}

TxValidator::CheckResult TxValidator::check_structure(const Transaction& tx) const {
    if (tx.inputs.empty()) {
        return std::unexpected(
            tx.outputs.empty() ? InvalidReason::NoInputs : InvalidReason::UnexpectedCoinbase
        );
    }
    if (tx.outputs.empty()) {
        return std::unexpected(InvalidReason::NoOutputs);
    }
    if (tx.serialized_size() > params_.limits.max_tx_size) {
        return std::unexpected(InvalidReason::Oversized);
    }
    if (tx.outputs.size() > params_.limits.max_tx_outputs) {
        return std::unexpected(InvalidReason::TooManyOutputs);
    }
    if (tx.inputs.size() > params_.limits.max_tx_inputs) {
        return std::unexpected(InvalidReason::TooManyInputs);
    }
    if (!outputs_in_range(tx, params_)) {
        return std::unexpected(InvalidReason::BadOutputAmount);
    }
    return {};
}

TxValidator::CheckResult TxValidator::check_coinbase(const Transaction& tx) const {
    if (!tx.is_coinbase()) {
        return std::unexpected(InvalidReason::UnexpectedCoinbase);
    }
    if (tx.serialized_size() > params_.limits.max_tx_size) {
        return std::unexpected(InvalidReason::Oversized);
    }
    if (tx.outputs.size() > params_.limits.max_tx_outputs) {
        return std::unexpected(InvalidReason::TooManyOutputs);
    }
    if (!outputs_in_range(tx, params_)) {
        return std::unexpected(InvalidReason::BadOutputAmount);
    }
    return {};
}

TxValidator::FeeResult TxValidator::resolve_inputs(
    const Transaction& tx,
    const UtxoView& view,
    uint32_t spend_height
) const {
    if (auto structure = check_structure(tx); !structure) {
        return std::unexpected(structure.error());
    }

    std::unordered_set<OutPoint> seen;
    seen.reserve(tx.inputs.size());
    for (const auto& input : tx.inputs) {
        if (!seen.insert(input.prevout).second) {
            return std::unexpected(InvalidReason::DuplicateInput);
        }
    }

    std::vector<Coin> coins;
    coins.reserve(tx.inputs.size());
    for (const auto& input : tx.inputs) {
        auto coin = view.lookup(input.prevout);
        if (!coin) {
            return std::unexpected(InvalidReason::UnknownInput);
        }
        coins.push_back(*coin);
    }

    const uint32_t maturity = params_.rewards.coinbase_maturity;
    for (const auto& coin : coins) {
        if (coin.coinbase && spend_height < coin.height + maturity) {
            return std::unexpected(InvalidReason::ImmatureCoinbase);
        }
    }

    Amount input_total = 0;
    for (std::size_t i = 0; i < tx.inputs.size(); ++i) {
        if (core::lock_from_public_key(tx.inputs[i].public_key) != coins[i].out.lock) {
            return std::unexpected(InvalidReason::LockMismatch);
        }
        input_total += coins[i].out.amount;
    }
    return input_total;
}

TxValidator::FeeResult TxValidator::compute_fee(const Transaction& tx, Amount input_total) const {
    auto output_total = tx.total_output();
    if (!output_total || !params_.is_money_range(input_total)) {
        return std::unexpected(InvalidReason::BadOutputAmount);
    }
    if (input_total < *output_total) {
        return std::unexpected(InvalidReason::NegativeFee);
    }
    return input_total - *output_total;
}

TxValidator::FeeResult TxValidator::check_inputs(
    const Transaction& tx,
    const UtxoView& view,
    uint32_t spend_height
) const {
    auto input_total = resolve_inputs(tx, view, spend_height);
    if (!input_total) {
        return input_total;
    }
    return compute_fee(tx, *input_total);
}

TxValidator::CheckResult TxValidator::verify_signatures(const Transaction& tx) const {
    const auto sighash = tx.signature_hash();
    for (const auto& input : tx.inputs) {
        if (!crypto::verify(input.public_key, sighash, input.signature)) {
            return std::unexpected(InvalidReason::BadSignature);
        }
    }
    return {};
}

TxValidator::FeeResult TxValidator::validate(
    const Transaction& tx,
    const UtxoView& view,
    uint32_t spend_height
) const {
    auto input_total = resolve_inputs(tx, view, spend_height);
    if (!input_total) {
        return input_total;
    }
    if (auto signatures = verify_signatures(tx); !signatures) {
        return std::unexpected(signatures.error());
    }
    return compute_fee(tx, *input_total);
}

} // namespace qtc::chain
