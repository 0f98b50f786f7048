/**
 * @file test_consensus.cpp
 * @brief Тесты движка консенсуса: основная цепочка, сироты, отказы
 */

#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "chain/chain_store.hpp"
#include "chain/consensus_engine.hpp"

namespace qtc::tests {

using chain::BlockStatus;
using chain::RejectCode;

/**
 * @brief Класс тестов для ConsensusEngine
 */
class ConsensusTest : public ::testing::Test {
protected:
    void SetUp() override {
        miner_ = make_key();
        user_ = make_key();
        engine_ = std::make_unique<chain::ConsensusEngine>(params(), store_, time_);
        ASSERT_TRUE(engine_->initialize().has_value());
    }

    static const core::ChainParams& params() {
        return core::ChainParams::regtest();
    }

    /// @brief Добыть и подключить блок поверх tip
    core::Block extend(const Hash256& payout, std::vector<core::Transaction> txs = {}, Amount fees = 0) {
        auto block = next_block(*engine_, payout, std::move(txs), fees);
        auto outcome = engine_->submit_block(block);
        EXPECT_TRUE(outcome.has_value());
        if (outcome) {
            EXPECT_EQ(outcome->status, BlockStatus::ExtendMain);
        }
        return block;
    }

    core::NetworkTime time_ = fixed_time();
    chain::MemoryChainStore store_;
    std::unique_ptr<chain::ConsensusEngine> engine_;
    TestKey miner_;
    TestKey user_;
};

/**
 * @brief Тест: genesis создаётся при пустом хранилище
 */
TEST_F(ConsensusTest, InitializesGenesis) {
    const auto genesis = core::make_genesis_block(params());
    const auto& state = engine_->state();

    EXPECT_TRUE(engine_->initialized());
    EXPECT_EQ(state.height, 0u);
    EXPECT_EQ(state.tip_hash, genesis.hash());
    EXPECT_EQ(state.total_minted, 0);
    EXPECT_EQ(state.next_subsidy, params().rewards.initial_subsidy);
    EXPECT_EQ(state.next_bits, params().difficulty.pow_limit_bits);
    EXPECT_EQ(engine_->utxo().size(), 0u);

    ASSERT_NE(engine_->main_at(0), nullptr);
    EXPECT_EQ(engine_->main_at(0)->hash, genesis.hash());
    EXPECT_EQ(engine_->main_at(1), nullptr);
    EXPECT_EQ(store_.block_count(), 1u);

    // Повторная инициализация ничего не меняет
    EXPECT_TRUE(engine_->initialize().has_value());
    EXPECT_EQ(store_.block_count(), 1u);
}

/**
 * @brief Тест: до инициализации блоки не принимаются
 */
TEST_F(ConsensusTest, RequiresInitialization) {
    chain::MemoryChainStore store;
    chain::ConsensusEngine engine(params(), store, time_);
    EXPECT_FALSE(engine.initialized());

    auto result = engine.submit_block(core::make_genesis_block(params()));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ChainNotInitialized);
}

/**
 * @brief Тест: наращивание основной цепочки и балансы
 */
TEST_F(ConsensusTest, ExtendsMainChain) {
    const Amount subsidy = params().rewards.initial_subsidy;

    auto block1 = extend(miner_.lock);
    EXPECT_EQ(engine_->state().height, 1u);
    EXPECT_EQ(engine_->state().tip_hash, block1.hash());
    EXPECT_EQ(engine_->utxo().balance(miner_.lock), subsidy);

    auto spend = make_spend({coinbase_outpoint(block1)}, miner_, {
        core::TxOut{subsidy / 2, user_.lock},
        core::TxOut{subsidy - subsidy / 2 - TEST_FEE, miner_.lock},
    });
    auto block2 = extend(miner_.lock, {spend}, TEST_FEE);

    const auto& state = engine_->state();
    EXPECT_EQ(state.height, 2u);
    EXPECT_EQ(state.total_minted, 2 * subsidy);
    EXPECT_EQ(engine_->utxo().balance(user_.lock), subsidy / 2);
    EXPECT_EQ(engine_->utxo().balance(miner_.lock), subsidy - subsidy / 2 + subsidy);
    EXPECT_EQ(engine_->utxo().total_value(), state.total_minted);

    const auto* entry = engine_->find(block2.hash());
    ASSERT_NE(entry, nullptr);
    EXPECT_TRUE(engine_->is_main(*entry));
    EXPECT_EQ(entry->validity, chain::BlockValidity::Connected);
    EXPECT_EQ(entry->height, 2u);
    EXPECT_EQ(engine_->tips().size(), 1u);
}

/**
 * @brief Тест: повторная отправка блока
 */
TEST_F(ConsensusTest, DuplicateBlock) {
    auto block = extend(miner_.lock);

    auto again = engine_->submit_block(block);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->status, BlockStatus::Duplicate);
    EXPECT_EQ(engine_->state().height, 1u);
}

/**
 * @brief Тест: блок с уже потраченным входом отвергается, потомки тоже
 */
TEST_F(ConsensusTest, RejectsSpentInput) {
    const Amount subsidy = params().rewards.initial_subsidy;
    auto block1 = extend(miner_.lock);
    auto spend = make_spend({coinbase_outpoint(block1)}, miner_, {core::TxOut{subsidy - TEST_FEE, user_.lock}});
    extend(miner_.lock, {spend}, TEST_FEE);

    const auto tip_before = engine_->state().tip_hash;
    auto replay = next_block(*engine_, user_.lock, {spend}, TEST_FEE);
    auto outcome = engine_->submit_block(replay);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, BlockStatus::Rejected);
    ASSERT_TRUE(outcome->reason.has_value());
    EXPECT_EQ(*outcome->reason,
              chain::RejectReason::invalid_transaction(1, chain::InvalidReason::UnknownInput));

    EXPECT_EQ(engine_->state().tip_hash, tip_before);
    EXPECT_EQ(engine_->utxo().balance(user_.lock), subsidy - TEST_FEE);

    const auto* entry = engine_->find(replay.hash());
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->validity, chain::BlockValidity::Invalid);

    // Потомок невалидного блока
    auto child = child_block(*engine_, replay.hash(), miner_.lock);
    auto child_outcome = engine_->submit_block(child);
    ASSERT_TRUE(child_outcome.has_value());
    EXPECT_EQ(child_outcome->status, BlockStatus::Rejected);
    EXPECT_EQ(child_outcome->reason->code, RejectCode::InvalidAncestor);
}

/**
 * @brief Тест: неверная сложность и структурные ошибки
 */
TEST_F(ConsensusTest, RejectsBadHeader) {
    auto block = next_block(*engine_, miner_.lock);
    block.header.bits = 0x1f00ffff;
    block.header.nonce = 0;
    mine(block);

    auto outcome = engine_->submit_block(block);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, BlockStatus::Rejected);
    EXPECT_EQ(outcome->reason->code, RejectCode::BadDifficulty);
    // Блок с ошибкой заголовка не попадает в индекс
    EXPECT_EQ(engine_->find(block.hash()), nullptr);

    core::Block empty;
    auto malformed = engine_->submit_block(empty);
    ASSERT_TRUE(malformed.has_value());
    EXPECT_EQ(malformed->status, BlockStatus::Rejected);
    EXPECT_EQ(malformed->reason->code, RejectCode::BadStructure);
    EXPECT_EQ(engine_->state().height, 0u);
}

/**
 * @brief Тест: сирота подключается после прихода родителя
 */
TEST_F(ConsensusTest, OrphanConnectsWhenParentArrives) {
    // Вторая цепочка строит блоки 1 и 2
    chain::MemoryChainStore other_store;
    chain::ConsensusEngine other(params(), other_store, time_);
    ASSERT_TRUE(other.initialize().has_value());
    auto block1 = next_block(other, miner_.lock);
    ASSERT_EQ(other.submit_block(block1)->status, BlockStatus::ExtendMain);
    auto block2 = next_block(other, miner_.lock);
    ASSERT_EQ(other.submit_block(block2)->status, BlockStatus::ExtendMain);

    auto orphan = engine_->submit_block(block2);
    ASSERT_TRUE(orphan.has_value());
    EXPECT_EQ(orphan->status, BlockStatus::Orphan);
    EXPECT_EQ(orphan->reason->code, RejectCode::OrphanParent);
    EXPECT_EQ(engine_->orphan_count(), 1u);
    EXPECT_TRUE(engine_->has_orphan(block2.hash()));

    // Сирота уже известна
    EXPECT_EQ(engine_->submit_block(block2)->status, BlockStatus::Duplicate);

    auto parent = engine_->submit_block(block1);
    ASSERT_TRUE(parent.has_value());
    EXPECT_EQ(parent->status, BlockStatus::ExtendMain);
    EXPECT_EQ(parent->connected.size(), 2u);
    EXPECT_EQ(engine_->orphan_count(), 0u);
    EXPECT_EQ(engine_->state().height, 2u);
    EXPECT_EQ(engine_->state().tip_hash, block2.hash());
}

/**
 * @brief Тест: просроченные сироты удаляются, буфер ограничен
 */
TEST_F(ConsensusTest, OrphanExpiryAndLimit) {
    chain::MemoryChainStore store;
    chain::ConsensusEngine engine(params(), store, time_, chain::OrphanPolicy{1, 60});
    ASSERT_TRUE(engine.initialize().has_value());

    chain::MemoryChainStore other_store;
    chain::ConsensusEngine other(params(), other_store, time_);
    ASSERT_TRUE(other.initialize().has_value());
    auto block1 = next_block(other, miner_.lock);
    ASSERT_TRUE(other.submit_block(block1).has_value());
    auto block2 = next_block(other, miner_.lock);
    ASSERT_TRUE(other.submit_block(block2).has_value());
    auto block3 = next_block(other, miner_.lock);

    EXPECT_EQ(engine.submit_block(block2)->status, BlockStatus::Orphan);
    EXPECT_EQ(engine.submit_block(block3)->status, BlockStatus::Orphan);
    EXPECT_EQ(engine.orphan_count(), 1u);

    EXPECT_EQ(engine.expire_orphans(TEST_NOW + 60), 0u);
    EXPECT_EQ(engine.expire_orphans(TEST_NOW + 61), 1u);
    EXPECT_EQ(engine.orphan_count(), 0u);
}

/**
 * @brief Тест: уведомление о смене tip
 */
TEST_F(ConsensusTest, TipCallback) {
    int calls = 0;
    uint32_t last_height = 0;
    engine_->set_tip_callback([&](const chain::ChainState& state) {
        ++calls;
        last_height = state.height;
    });

    auto block = extend(miner_.lock);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(last_height, 1u);

    ASSERT_TRUE(engine_->submit_block(block).has_value());
    EXPECT_EQ(calls, 1);
}

/**
 * @brief Тест: ошибка записи останавливает движок
 */
TEST_F(ConsensusTest, HaltsOnStorageFailure) {
    extend(miner_.lock);
    auto block = next_block(*engine_, miner_.lock);

    store_.set_fail_writes(true);
    auto failed = engine_->submit_block(block);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::StorageWriteFailed);
    EXPECT_TRUE(engine_->halted());

    // Состояние в памяти не изменилось
    EXPECT_EQ(engine_->state().height, 1u);

    store_.set_fail_writes(false);
    auto after = engine_->submit_block(block);
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, ErrorCode::StorageHalted);
}

/**
 * @brief Тест: новый движок восстанавливает состояние из хранилища
 */
TEST_F(ConsensusTest, RestoresFromStore) {
    auto block1 = extend(miner_.lock);
    auto spend = make_spend({coinbase_outpoint(block1)}, miner_,
                            {core::TxOut{params().rewards.initial_subsidy - TEST_FEE, user_.lock}});
    extend(miner_.lock, {spend}, TEST_FEE);
    const auto expected = engine_->state();

    chain::ConsensusEngine restored(params(), store_, time_);
    ASSERT_TRUE(restored.initialize().has_value());
    EXPECT_EQ(restored.state().tip_hash, expected.tip_hash);
    EXPECT_EQ(restored.state().height, expected.height);
    EXPECT_EQ(restored.state().total_minted, expected.total_minted);
    EXPECT_EQ(restored.state().next_bits, expected.next_bits);
    EXPECT_EQ(restored.utxo().balance(user_.lock), engine_->utxo().balance(user_.lock));
    EXPECT_EQ(restored.utxo().size(), engine_->utxo().size());

    // Восстановленный движок продолжает цепочку
    auto block3 = next_block(restored, miner_.lock);
    auto outcome = restored.submit_block(block3);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, BlockStatus::ExtendMain);
}

/**
 * @brief Тест: пересчёт сложности на regtest
 */
TEST_F(ConsensusTest, RetargetSchedule) {
    const uint32_t interval = params().difficulty.adjustment_interval;
    for (uint32_t h = 1; h <= interval; ++h) {
        extend(miner_.lock);
    }
    EXPECT_EQ(engine_->state().height, interval);
    EXPECT_EQ(engine_->state().next_retarget_height, interval + 1);

    // Интервал от genesis длиннее цели: target упирается в предел
    extend(miner_.lock);
    EXPECT_EQ(engine_->state().tip_bits, params().difficulty.pow_limit_bits);
    EXPECT_EQ(engine_->state().next_retarget_height, 2 * interval + 1);
}

} // namespace qtc::tests
