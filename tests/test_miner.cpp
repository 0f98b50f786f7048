/**
 * @file test_miner.cpp
 * @brief Тесты сборщика блоков и фонового майнера
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "test_helpers.hpp"
#include "chain/chain_store.hpp"
#include "chain/mempool.hpp"
#include "mining/block_assembler.hpp"
#include "mining/miner.hpp"

namespace qtc::tests {

using mining::BlockAssembler;
using mining::SearchResult;

namespace {

/// @brief Ждать условие не дольше timeout
template<typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

} // namespace

/**
 * @brief Класс тестов для BlockAssembler
 */
class BlockAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        payout_ = make_key();
        engine_ = std::make_unique<chain::ConsensusEngine>(params(), store_, time_);
        ASSERT_TRUE(engine_->initialize().has_value());
    }

    static const core::ChainParams& params() {
        return core::ChainParams::regtest();
    }

    core::NetworkTime time_ = fixed_time();
    chain::MemoryChainStore store_;
    std::unique_ptr<chain::ConsensusEngine> engine_;
    TestKey payout_;
};

/**
 * @brief Тест: шаблон поверх genesis
 */
TEST_F(BlockAssemblerTest, TemplateFields) {
    BlockAssembler assembler(params());
    chain::Mempool mempool(params(), {});
    const auto& state = engine_->state();

    auto tmpl = assembler.assemble(state, mempool, payout_.lock, TEST_NOW);
    EXPECT_EQ(tmpl.height, 1u);
    EXPECT_EQ(tmpl.subsidy, params().rewards.initial_subsidy);
    EXPECT_EQ(tmpl.fees, 0);

    const auto& block = tmpl.block;
    ASSERT_EQ(block.transactions.size(), 1u);
    const auto& coinbase = block.transactions.front();
    EXPECT_TRUE(coinbase.is_coinbase());
    EXPECT_EQ(coinbase.lock_time, 1u);
    ASSERT_EQ(coinbase.outputs.size(), 1u);
    EXPECT_EQ(coinbase.outputs[0].amount, tmpl.subsidy);
    EXPECT_EQ(coinbase.outputs[0].lock, payout_.lock);

    EXPECT_EQ(block.header.prev_hash, state.tip_hash);
    EXPECT_EQ(block.header.bits, state.next_bits);
    EXPECT_EQ(block.header.timestamp, static_cast<uint32_t>(TEST_NOW));
    EXPECT_EQ(block.header.merkle_root, block.compute_merkle_root());
}

/**
 * @brief Тест: timestamp не меньше MTP + 1
 */
TEST_F(BlockAssemblerTest, TimestampAfterMedianTimePast) {
    BlockAssembler assembler(params());
    const auto& state = engine_->state();
    auto tmpl = assembler.assemble(state, {}, 0, payout_.lock, state.median_time_past - 1000);
    EXPECT_EQ(tmpl.block.header.timestamp, state.median_time_past + 1);
}

/**
 * @brief Тест: транзакции из mempool и комиссии в coinbase
 */
TEST_F(BlockAssemblerTest, IncludesMempoolTransactions) {
    const Amount subsidy = params().rewards.initial_subsidy;
    auto block1 = next_block(*engine_, payout_.lock);
    ASSERT_EQ(engine_->submit_block(block1)->status, chain::BlockStatus::ExtendMain);

    chain::Mempool mempool(params(), {});
    auto other = make_key();
    auto spend = make_spend({coinbase_outpoint(block1)}, payout_, {core::TxOut{subsidy - TEST_FEE, other.lock}});
    ASSERT_TRUE(mempool.admit(spend, engine_->utxo(), 2, TEST_NOW).has_value());

    BlockAssembler assembler(params());
    auto tmpl = assembler.assemble(engine_->state(), mempool, payout_.lock, TEST_NOW);
    EXPECT_EQ(tmpl.height, 2u);
    EXPECT_EQ(tmpl.fees, TEST_FEE);
    ASSERT_EQ(tmpl.block.transactions.size(), 2u);
    EXPECT_EQ(tmpl.block.transactions[1].txid(), spend.txid());
    EXPECT_EQ(tmpl.block.transactions[0].outputs[0].amount, subsidy + TEST_FEE);

    // Собранный блок принимается движком
    mine(tmpl.block);
    EXPECT_EQ(engine_->submit_block(tmpl.block)->status, chain::BlockStatus::ExtendMain);
    EXPECT_EQ(engine_->utxo().balance(other.lock), subsidy - TEST_FEE);

    // Бюджет меньше транзакции: блок только с coinbase
    chain::Mempool pending(params(), {});
    auto change = make_spend({core::OutPoint{tmpl.block.transactions[0].txid(), 0}}, payout_,
                             {core::TxOut{subsidy, other.lock}});
    ASSERT_TRUE(pending.admit(change, engine_->utxo(), 3, TEST_NOW).has_value());
    BlockAssembler small(params(), mining::AssemblerOptions{1000});
    EXPECT_EQ(small.max_block_bytes(), 1000u);
    auto empty = small.assemble(engine_->state(), pending, payout_.lock, TEST_NOW);
    EXPECT_EQ(empty.block.transactions.size(), 1u);
    EXPECT_EQ(empty.fees, 0);
}

/**
 * @brief Тест: перебор nonce находит блок на regtest
 */
TEST_F(BlockAssemblerTest, SearchFinds) {
    BlockAssembler assembler(params());
    auto tmpl = assembler.assemble(engine_->state(), {}, 0, payout_.lock, TEST_NOW);
    std::atomic<bool> cancel{false};

    EXPECT_EQ(BlockAssembler::search(tmpl.block, cancel, 1'000'000), SearchResult::Found);
    EXPECT_TRUE(tmpl.block.header.check_pow());
}

/**
 * @brief Тест: отмена и исчерпание бюджета
 */
TEST_F(BlockAssemblerTest, SearchCancelledAndExhausted) {
    BlockAssembler assembler(params());
    auto tmpl = assembler.assemble(engine_->state(), {}, 0, payout_.lock, TEST_NOW);
    // Сложность mainnet: на бюджете в 1000 хешей решения нет
    tmpl.block.header.bits = 0x1d00ffff;

    std::atomic<bool> cancel{true};
    EXPECT_EQ(BlockAssembler::search(tmpl.block, cancel, 1000), SearchResult::Cancelled);

    cancel.store(false);
    EXPECT_EQ(BlockAssembler::search(tmpl.block, cancel, 1000), SearchResult::Exhausted);
    EXPECT_EQ(mining::to_string(SearchResult::Exhausted), "exhausted");
}

// =============================================================================
// Miner
// =============================================================================

/**
 * @brief Тест: майнер находит блоки и отдаёт их получателю
 */
TEST(MinerTest, FindsBlocks) {
    const auto& params = core::ChainParams::regtest();
    auto payout = make_key();
    chain::ChainState state;
    state.tip_hash = core::make_genesis_block(params).hash();
    state.next_bits = params.difficulty.pow_limit_bits;
    state.median_time_past = params.genesis.timestamp;

    BlockAssembler assembler(params);
    std::mutex mutex;
    std::vector<core::Block> found;

    mining::Miner miner(
        mining::MinerConfig{1000, std::chrono::milliseconds(10)},
        [&]() -> Result<mining::BlockTemplate> {
            return assembler.assemble(state, {}, 0, payout.lock, TEST_NOW);
        },
        [&](const core::Block& block, uint64_t) {
            std::lock_guard<std::mutex> lock(mutex);
            found.push_back(block);
        }
    );

    EXPECT_FALSE(miner.is_running());
    miner.start();
    EXPECT_TRUE(miner.is_running());

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return !found.empty();
    }));
    miner.stop();
    EXPECT_FALSE(miner.is_running());

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_TRUE(found.front().header.check_pow());
    EXPECT_EQ(found.front().header.prev_hash, state.tip_hash);
    EXPECT_GE(miner.stats().blocks_found, 1u);
    EXPECT_GE(miner.stats().templates, 1u);
}

/**
 * @brief Тест: смена tip прерывает перебор устаревшего шаблона
 */
TEST(MinerTest, NotifyTipAbortsStaleWork) {
    const auto& params = core::ChainParams::regtest();
    auto payout = make_key();
    chain::ChainState state;
    state.tip_hash = core::make_genesis_block(params).hash();
    // Недостижимая сложность: перебор идёт, пока его не прервут
    state.next_bits = 0x1d00ffff;
    state.median_time_past = params.genesis.timestamp;

    BlockAssembler assembler(params);
    std::atomic<int> sunk{0};
    mining::Miner miner(
        mining::MinerConfig{1000, std::chrono::milliseconds(10)},
        [&]() -> Result<mining::BlockTemplate> {
            return assembler.assemble(state, {}, 0, payout.lock, TEST_NOW);
        },
        [&](const core::Block&, uint64_t) { ++sunk; }
    );

    const auto gen = miner.generation();
    EXPECT_TRUE(miner.is_current(gen));

    miner.start();
    ASSERT_TRUE(wait_until([&] { return miner.stats().templates >= 1; }));

    miner.notify_tip();
    EXPECT_EQ(miner.generation(), gen + 1);
    EXPECT_FALSE(miner.is_current(gen));
    EXPECT_TRUE(miner.is_current(gen + 1));

    // Новый шаблон после прерывания
    ASSERT_TRUE(wait_until([&] { return miner.stats().templates >= 2; }));
    miner.stop();

    EXPECT_EQ(sunk.load(), 0);
    EXPECT_GE(miner.stats().aborts, 1u);
}

/**
 * @brief Тест: недоступный шаблон не останавливает майнер
 */
TEST(MinerTest, RetriesWhenTemplateUnavailable) {
    std::atomic<int> calls{0};
    mining::Miner miner(
        mining::MinerConfig{1000, std::chrono::milliseconds(5)},
        [&]() -> Result<mining::BlockTemplate> {
            ++calls;
            return Err<mining::BlockTemplate>(ErrorCode::ChainNotInitialized);
        },
        [](const core::Block&, uint64_t) {}
    );

    miner.start();
    ASSERT_TRUE(wait_until([&] { return calls.load() >= 3; }));
    miner.stop();
    EXPECT_EQ(miner.stats().templates, 0u);

    // Повторная остановка безопасна
    miner.stop();
}

} // namespace qtc::tests
