/**
 * @file block_validator.cpp
 * @brief Реализация валидатора блоков
 */

#include "block_validator.hpp"

#include "../core/primitives/merkle.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <thread>
#include <unordered_set>

namespace qtc::chain {

namespace {

/// @brief Минимум транзакций на один поток проверки подписей
constexpr std::size_t MIN_TXS_PER_WORKER = 4;

} // namespace

BlockValidator::BlockValidator(const core::ChainParams& params)
    : params_(params)
    , tx_validator_(params)
    , pow_validator_(params) {}

BlockValidator::CheckResult BlockValidator::check_block(const core::Block& block) const {
    const auto& txs = block.transactions;

    // Структура
    if (txs.empty()) {
        return std::unexpected(RejectReason::make(RejectCode::BadStructure, "нет транзакций"));
    }
    if (!txs.front().is_coinbase()) {
        return std::unexpected(RejectReason::make(RejectCode::BadStructure, "первая транзакция не coinbase"));
    }
    for (std::size_t i = 1; i < txs.size(); ++i) {
        if (txs[i].is_coinbase()) {
            return std::unexpected(RejectReason::make(
                RejectCode::BadStructure, std::format("лишняя coinbase на позиции {}", i)));
        }
    }

    auto txids = block.txids();
    std::unordered_set<Hash256> unique(txids.begin(), txids.end());
    if (unique.size() != txids.size()) {
        return std::unexpected(RejectReason::make(RejectCode::BadStructure, "повторяющийся txid"));
    }

    if (auto coinbase = tx_validator_.check_coinbase(txs.front()); !coinbase) {
        return std::unexpected(RejectReason::make(
            RejectCode::BadCoinbase, std::string(to_string(coinbase.error()))));
    }

    // Размер
    if (txs.size() > params_.limits.max_block_transactions) {
        return std::unexpected(RejectReason::make(
            RejectCode::OversizedBlock, std::format("{} транзакций", txs.size())));
    }
    if (block.serialized_size() > params_.limits.max_block_size) {
        return std::unexpected(RejectReason::make(
            RejectCode::OversizedBlock, std::format("{} байт", block.serialized_size())));
    }

    // Proof-of-work
    if (!pow_validator_.validate_bits(block.header.bits)) {
        return std::unexpected(RejectReason::make(
            RejectCode::BadDifficulty, std::format("bits {:08x}", block.header.bits)));
    }
    if (!block.header.check_pow()) {
        return std::unexpected(RejectReason::make(RejectCode::BadProofOfWork));
    }

    // Merkle
    if (core::compute_merkle_root(txids) != block.header.merkle_root) {
        return std::unexpected(RejectReason::make(RejectCode::BadMerkleRoot));
    }

    return {};
}

BlockValidator::CheckResult BlockValidator::check_header(
    const core::Block& block,
    const BlockContext& context
) const {
    const auto& header = block.header;

    if (header.bits != context.required_bits) {
        return std::unexpected(RejectReason::make(
            RejectCode::BadDifficulty,
            std::format("bits {:08x}, требуется {:08x}", header.bits, context.required_bits)));
    }

    if (header.timestamp <= context.median_time_past) {
        return std::unexpected(RejectReason::make(
            RejectCode::BadTimestamp,
            std::format("timestamp {} <= MTP {}", header.timestamp, context.median_time_past)));
    }
    if (static_cast<int64_t>(header.timestamp) > context.adjusted_time + params_.difficulty.max_future_drift) {
        return std::unexpected(RejectReason::make(
            RejectCode::BadTimestamp,
            std::format("timestamp {} слишком далеко в будущем", header.timestamp)));
    }

    if (block.transactions.empty() || block.transactions.front().lock_time != context.height) {
        return std::unexpected(RejectReason::make(
            RejectCode::BadCoinbase, std::format("lock_time coinbase не равен высоте {}", context.height)));
    }

    return {};
}

std::vector<char> BlockValidator::verify_signatures_parallel(const core::Block& block) const {
    const auto& txs = block.transactions;
    std::vector<char> valid(txs.size(), 1);
    if (txs.size() <= 1) {
        return valid;
    }

    const std::size_t work = txs.size() - 1;
    const std::size_t hw = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    const std::size_t workers = std::clamp<std::size_t>(work / MIN_TXS_PER_WORKER, 1, hw);
    const std::size_t chunk = (work + workers - 1) / workers;

    auto verify_range = [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            valid[i] = tx_validator_.verify_signatures(txs[i]).has_value() ? 1 : 0;
        }
    };

    std::vector<std::future<void>> tasks;
    for (std::size_t begin = 1; begin < txs.size(); begin += chunk) {
        const std::size_t end = std::min(txs.size(), begin + chunk);
        if (end == txs.size()) {
            // Последний диапазон выполняем в текущем потоке
            verify_range(begin, end);
            break;
        }
        tasks.push_back(std::async(std::launch::async, verify_range, begin, end));
    }
    for (auto& task : tasks) {
        task.get();
    }
    return valid;
}

BlockValidator::FeeResult BlockValidator::check_transactions(
    const core::Block& block,
    uint32_t height,
    const UtxoView& view,
    Amount allowed_subsidy
) const {
    const auto& txs = block.transactions;
    const auto signatures = verify_signatures_parallel(block);

    UtxoOverlay overlay(view);
    Amount fees = 0;

    for (std::size_t i = 1; i < txs.size(); ++i) {
        auto fee = tx_validator_.check_inputs(txs[i], overlay, height);
        if (!fee) {
            auto reason = fee.error();
            if (reason == InvalidReason::NegativeFee && !signatures[i]) {
                reason = InvalidReason::BadSignature;
            }
            return std::unexpected(RejectReason::invalid_transaction(i, reason));
        }
        if (!signatures[i]) {
            return std::unexpected(RejectReason::invalid_transaction(i, InvalidReason::BadSignature));
        }
        if (!overlay.apply(txs[i], height)) {
            return std::unexpected(RejectReason::invalid_transaction(i, InvalidReason::UnknownInput));
        }
        fees += *fee;
    }

    auto coinbase_total = txs.front().total_output();
    if (!coinbase_total) {
        return std::unexpected(RejectReason::make(RejectCode::BadCoinbase));
    }
    if (*coinbase_total > allowed_subsidy + fees) {
        return std::unexpected(RejectReason::make(
            RejectCode::OversizedCoinbase,
            std::format("coinbase {} > {}", *coinbase_total, allowed_subsidy + fees)));
    }

    return fees;
}

} // namespace qtc::chain
