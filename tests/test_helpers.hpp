/**
 * @file test_helpers.hpp
 * @brief Общие вспомогательные функции тестов
 *
 * Ключи, подписанные транзакции и добыча блоков на regtest, где
 * подходящий nonce находится за несколько попыток.
 */

#pragma once

#include "chain/consensus_engine.hpp"
#include "chain/tx_signer.hpp"
#include "core/chain/chain_params.hpp"
#include "core/chain/economics.hpp"
#include "core/network_time.hpp"
#include "core/primitives/address.hpp"
#include "core/primitives/block.hpp"
#include "crypto/dilithium.hpp"
#include "mining/block_assembler.hpp"

#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qtc::tests {

/// @brief Время узла в тестах (позже genesis regtest)
inline constexpr int64_t TEST_NOW = 1'700'100'000;

/// @brief Комиссия тестовых транзакций (fee-rate ~25000 за 1000 байт)
inline constexpr Amount TEST_FEE = 100'000;

/**
 * @brief Часы с фиксированным временем
 */
inline core::NetworkTime fixed_time(int64_t now = TEST_NOW) {
    return core::NetworkTime([now]() { return now; });
}

/**
 * @brief Ключ вместе с его lock
 */
struct TestKey {
    crypto::KeyPair pair;
    Hash256 lock{};
};

inline TestKey make_key() {
    auto pair = crypto::generate_keypair();
    if (!pair) {
        throw std::runtime_error(pair.error().message);
    }
    TestKey key;
    key.lock = core::lock_from_public_key(pair->public_key);
    key.pair = std::move(*pair);
    return key;
}

/**
 * @brief Подписанная транзакция, тратящая prevouts одного владельца
 */
inline core::Transaction make_spend(
    const std::vector<core::OutPoint>& prevouts,
    const TestKey& owner,
    std::vector<core::TxOut> outputs
) {
    core::Transaction tx;
    for (const auto& prevout : prevouts) {
        core::TxIn input;
        input.prevout = prevout;
        tx.inputs.push_back(std::move(input));
    }
    tx.outputs = std::move(outputs);

    if (auto signed_tx = chain::sign_transaction(tx, owner.pair); !signed_tx) {
        throw std::runtime_error(signed_tx.error().message);
    }
    return tx;
}

/**
 * @brief Перебрать nonce до валидного proof-of-work
 */
inline void mine(core::Block& block) {
    std::atomic<bool> cancel{false};
    if (mining::BlockAssembler::search(block, cancel, 10'000'000) != mining::SearchResult::Found) {
        throw std::runtime_error("nonce не найден");
    }
}

/**
 * @brief Состояние для сборки потомка произвольного блока индекса
 *
 * Эмиссия родителя берётся по графику: тесты не сжигают комиссии.
 */
inline chain::ChainState state_for_parent(
    const chain::ConsensusEngine& engine,
    const Hash256& parent_hash
) {
    const auto* parent = engine.find(parent_hash);
    if (parent == nullptr) {
        throw std::runtime_error("родитель не найден в индексе");
    }
    chain::ChainState state;
    state.tip_hash = parent->hash;
    state.height = parent->height;
    state.chain_work = parent->chain_work;
    state.tip_bits = parent->header.bits;
    state.next_bits = engine.required_bits(*parent);
    state.median_time_past = engine.median_time_past(*parent);
    state.total_minted = core::scheduled_supply(engine.params(), parent->height);
    return state;
}

/**
 * @brief Собрать и добыть блок поверх состояния
 */
inline core::Block build_block(
    const core::ChainParams& params,
    const chain::ChainState& state,
    const Hash256& payout,
    std::vector<core::Transaction> txs = {},
    Amount fees = 0,
    int64_t now = TEST_NOW
) {
    mining::BlockAssembler assembler(params);
    auto tmpl = assembler.assemble(state, std::move(txs), fees, payout, now);
    mine(tmpl.block);
    return tmpl.block;
}

/**
 * @brief Собрать блок поверх tip основной цепочки движка
 */
inline core::Block next_block(
    const chain::ConsensusEngine& engine,
    const Hash256& payout,
    std::vector<core::Transaction> txs = {},
    Amount fees = 0
) {
    return build_block(engine.params(), engine.state(), payout, std::move(txs), fees);
}

/**
 * @brief Собрать блок поверх произвольного блока индекса
 */
inline core::Block child_block(
    const chain::ConsensusEngine& engine,
    const Hash256& parent_hash,
    const Hash256& payout,
    std::vector<core::Transaction> txs = {},
    Amount fees = 0
) {
    return build_block(engine.params(), state_for_parent(engine, parent_hash), payout, std::move(txs), fees);
}

/**
 * @brief Первый выход coinbase блока
 */
inline core::OutPoint coinbase_outpoint(const core::Block& block) {
    return core::OutPoint{block.transactions.front().txid(), 0};
}

/**
 * @brief Пересчитать Merkle root и заново добыть блок после изменения
 */
inline void reseal(core::Block& block) {
    block.header.merkle_root = block.compute_merkle_root();
    block.header.nonce = 0;
    mine(block);
}

} // namespace qtc::tests
