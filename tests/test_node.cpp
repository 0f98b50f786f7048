/**
 * @file test_node.cpp
 * @brief Тесты фасада узла: запросы, транзакции, таймауты, майнинг
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "test_helpers.hpp"
#include "chain/chain_store.hpp"
#include "core/chain/economics.hpp"
#include "core/primitives/address.hpp"
#include "node/node.hpp"

namespace qtc::tests {

using chain::BlockStatus;

/**
 * @brief Класс тестов для Node
 *
 * Блоки строятся отдельным движком-зеркалом, которому передаются
 * те же блоки, что и узлу.
 */
class NodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        miner_ = make_key();
        user_ = make_key();
        mirror_ = std::make_unique<chain::ConsensusEngine>(params(), mirror_store_, time_);
        ASSERT_TRUE(mirror_->initialize().has_value());
    }

    static const core::ChainParams& params() {
        return core::ChainParams::regtest();
    }

    /// @brief Добыть блок поверх tip и передать узлу
    core::Block feed(node::Node& node, const Hash256& payout,
                     std::vector<core::Transaction> txs = {}, Amount fees = 0) {
        auto block = next_block(*mirror_, payout, std::move(txs), fees);
        EXPECT_TRUE(mirror_->submit_block(block).has_value());
        auto outcome = node.submit_block(block);
        EXPECT_TRUE(outcome.has_value());
        if (outcome) {
            EXPECT_EQ(outcome->status, BlockStatus::ExtendMain);
        }
        return block;
    }

    core::NetworkTime time_ = fixed_time();
    chain::MemoryChainStore store_;
    chain::MemoryChainStore mirror_store_;
    std::unique_ptr<chain::ConsensusEngine> mirror_;
    TestKey miner_;
    TestKey user_;
};

/**
 * @brief Тест: до запуска запросы возвращают ChainNotInitialized
 */
TEST_F(NodeTest, NotInitializedBeforeStart) {
    node::Node node(params(), store_, time_);

    auto info = node.chain_info();
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code, ErrorCode::ChainNotInitialized);

    auto block = node.submit_block(core::make_genesis_block(params()));
    ASSERT_FALSE(block.has_value());
    EXPECT_EQ(block.error().code, ErrorCode::ChainNotInitialized);
}

/**
 * @brief Тест: сводка цепочки после запуска и нескольких блоков
 */
TEST_F(NodeTest, ChainInfo) {
    node::Node node(params(), store_, time_);
    ASSERT_TRUE(node.start().has_value());

    auto genesis = node.chain_info();
    ASSERT_TRUE(genesis.has_value());
    EXPECT_EQ(genesis->network, "regtest");
    EXPECT_EQ(genesis->height, 0u);
    EXPECT_EQ(genesis->total_minted, 0);
    EXPECT_EQ(genesis->next_subsidy, params().rewards.initial_subsidy);
    EXPECT_EQ(genesis->bits, params().difficulty.pow_limit_bits);

    feed(node, miner_.lock);
    auto block2 = feed(node, miner_.lock);

    auto info = node.chain_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->height, 2u);
    EXPECT_EQ(info->tip_hash, block2.hash());
    EXPECT_EQ(info->total_minted, 2 * params().rewards.initial_subsidy);
    EXPECT_EQ(info->mempool_size, 0u);
    EXPECT_EQ(info->orphan_count, 0u);
    EXPECT_GT(info->difficulty, 0.0);
}

/**
 * @brief Тест: баланс по адресу и ошибки адреса
 */
TEST_F(NodeTest, Balance) {
    node::Node node(params(), store_, time_);
    ASSERT_TRUE(node.start().has_value());
    feed(node, miner_.lock);

    auto balance = node.balance(core::encode_address(miner_.lock));
    ASSERT_TRUE(balance.has_value());
    EXPECT_EQ(*balance, params().rewards.initial_subsidy);

    EXPECT_EQ(node.balance(user_.lock).value(), 0);

    auto bad = node.balance("qtc1nothex");
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().code, ErrorCode::QueryTimeout);

    auto coins = node.unspent(miner_.lock);
    ASSERT_TRUE(coins.has_value());
    ASSERT_EQ(coins->size(), 1u);
    EXPECT_EQ((*coins)[0].coin.height, 1u);
}

/**
 * @brief Тест: блоки по высоте и хешу
 */
TEST_F(NodeTest, BlockQueries) {
    node::Node node(params(), store_, time_);
    ASSERT_TRUE(node.start().has_value());
    auto block1 = feed(node, miner_.lock);
    feed(node, miner_.lock);

    auto by_height = node.block_by_height(1);
    ASSERT_TRUE(by_height.has_value());
    EXPECT_EQ(by_height->hash, block1.hash());
    EXPECT_EQ(by_height->height, 1u);
    EXPECT_TRUE(by_height->main_chain);
    EXPECT_EQ(by_height->confirmations, 2u);
    EXPECT_EQ(by_height->block, block1);

    auto by_hash = node.block_by_hash(block1.hash());
    ASSERT_TRUE(by_hash.has_value());
    EXPECT_EQ(by_hash->height, 1u);

    auto missing_height = node.block_by_height(10);
    ASSERT_FALSE(missing_height.has_value());
    EXPECT_EQ(missing_height.error().code, ErrorCode::QueryNotFound);

    Hash256 unknown{};
    unknown[31] = 0x01;
    auto missing_hash = node.block_by_hash(unknown);
    ASSERT_FALSE(missing_hash.has_value());
    EXPECT_EQ(missing_hash.error().code, ErrorCode::QueryNotFound);
}

/**
 * @brief Тест: экономика и график эмиссии
 */
TEST_F(NodeTest, Economics) {
    node::Node node(params(), store_, time_);
    ASSERT_TRUE(node.start().has_value());
    feed(node, miner_.lock);

    auto economics = node.economics();
    ASSERT_TRUE(economics.has_value());
    EXPECT_EQ(economics->max_supply, 22'000'000 * constants::COIN);
    EXPECT_EQ(economics->current_subsidy, params().rewards.initial_subsidy);
    EXPECT_EQ(economics->halving_interval, params().rewards.halving_interval);
    EXPECT_EQ(economics->target_block_interval, params().difficulty.target_spacing);
    ASSERT_TRUE(economics->next_halving_height.has_value());
    EXPECT_EQ(*economics->next_halving_height, params().rewards.halving_interval);
    EXPECT_EQ(economics->total_minted, params().rewards.initial_subsidy);
    EXPECT_EQ(economics->scheduled_supply, economics->total_minted);

    auto genesis = node.issuance_schedule(0);
    EXPECT_EQ(genesis.subsidy, 0);
    auto first = node.issuance_schedule(1);
    EXPECT_EQ(first.subsidy, params().rewards.initial_subsidy);
}

/**
 * @brief Тест: приём транзакции и её подтверждение
 */
TEST_F(NodeTest, SubmitTransaction) {
    const Amount subsidy = params().rewards.initial_subsidy;
    node::Node node(params(), store_, time_);
    ASSERT_TRUE(node.start().has_value());
    auto block1 = feed(node, miner_.lock);

    auto spend = make_spend({coinbase_outpoint(block1)}, miner_, {core::TxOut{subsidy - TEST_FEE, user_.lock}});
    auto txid = node.submit_transaction(spend);
    ASSERT_TRUE(txid.has_value()) << txid.error().to_string();
    EXPECT_EQ(*txid, spend.txid());

    auto again = node.submit_transaction(spend);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, chain::MempoolRejectCode::AlreadyPresent);

    // Испорченная подпись отвергается до блокировки
    auto forged = spend;
    forged.inputs[0].signature[10] ^= 0x01;
    auto rejected = node.submit_transaction(forged);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error(), chain::MempoolReject::invalid(chain::InvalidReason::BadSignature));

    // Шаблон включает транзакцию из mempool
    auto tmpl = node.block_template(miner_.lock);
    ASSERT_TRUE(tmpl.has_value());
    EXPECT_EQ(tmpl->height, 2u);
    EXPECT_EQ(tmpl->fees, TEST_FEE);
    ASSERT_EQ(tmpl->block.transactions.size(), 2u);

    mine(tmpl->block);
    ASSERT_TRUE(mirror_->submit_block(tmpl->block).has_value());
    auto outcome = node.submit_block(tmpl->block);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->status, BlockStatus::ExtendMain);

    EXPECT_EQ(node.mempool_summary()->count, 0u);
    EXPECT_EQ(node.balance(user_.lock).value(), subsidy - TEST_FEE);

    // Подтверждённая транзакция тратит уже потраченный выход
    auto confirmed = node.submit_transaction(spend);
    ASSERT_FALSE(confirmed.has_value());
    EXPECT_EQ(confirmed.error(), chain::MempoolReject::invalid(chain::InvalidReason::UnknownInput));
}

/**
 * @brief Тест: запрос завершается по таймауту, пока узел занят
 */
TEST_F(NodeTest, QueryTimeout) {
    node::NodeOptions options;
    options.query_timeout = std::chrono::milliseconds(50);
    node::Node node(params(), store_, time_, options);
    ASSERT_TRUE(node.start().has_value());

    std::atomic<bool> locked{false};
    std::atomic<bool> release{false};
    std::thread holder([&] {
        auto lock = node.exclusive_lock();
        locked.store(true);
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    while (!locked.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    const auto started = std::chrono::steady_clock::now();
    auto info = node.chain_info();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code, ErrorCode::QueryTimeout);
    EXPECT_GE(elapsed, std::chrono::milliseconds(40));

    EXPECT_EQ(node.balance(miner_.lock).error().code, ErrorCode::QueryTimeout);

    release.store(true);
    holder.join();

    EXPECT_TRUE(node.chain_info().has_value());
}

/**
 * @brief Тест: ошибка хранилища вызывает обработчик один раз
 */
TEST_F(NodeTest, FatalHandler) {
    node::Node node(params(), store_, time_);
    ASSERT_TRUE(node.start().has_value());

    int calls = 0;
    ErrorCode code = ErrorCode::Success;
    node.set_fatal_handler([&](const Error& error) {
        ++calls;
        code = error.code;
    });

    auto block = next_block(*mirror_, miner_.lock);
    store_.set_fail_writes(true);
    EXPECT_FALSE(node.submit_block(block).has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(code, ErrorCode::StorageWriteFailed);

    EXPECT_EQ(node.submit_block(block).error().code, ErrorCode::StorageHalted);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(node.block_template(miner_.lock).error().code, ErrorCode::StorageHalted);
}

/**
 * @brief Тест: встроенный майнер добывает блоки
 */
TEST_F(NodeTest, MiningProducesBlocks) {
    node::NodeOptions options;
    options.mining_enabled = true;
    options.payout_lock = miner_.lock;
    options.miner.hashes_per_round = 1000;
    options.miner.retry_interval = std::chrono::milliseconds(10);
    node::Node node(params(), store_, time_, options);

    EXPECT_EQ(node.miner(), nullptr);
    ASSERT_TRUE(node.start().has_value());
    ASSERT_NE(node.miner(), nullptr);
    EXPECT_TRUE(node.miner()->is_running());

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(20);
    uint32_t height = 0;
    while (height < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        if (auto info = node.chain_info(); info) {
            height = info->height;
        }
    }
    node.stop();

    EXPECT_GE(height, 3u);
    EXPECT_FALSE(node.miner()->is_running());
    EXPECT_GE(node.miner()->stats().blocks_found, 3u);
    EXPECT_GE(node.miner()->generation(), 3u);

    auto balance = node.balance(miner_.lock);
    ASSERT_TRUE(balance.has_value());
    auto info = node.chain_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(*balance, info->total_minted);
}

} // namespace qtc::tests
