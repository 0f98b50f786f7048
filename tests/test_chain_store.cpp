/**
 * @file test_chain_store.cpp
 * @brief Тесты файлового хранилища: перезапуск, оборванные записи, снимки
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "test_helpers.hpp"
#include "chain/consensus_engine.hpp"
#include "chain/file_chain_store.hpp"

namespace qtc::tests {

using chain::BlockStatus;
using chain::FileChainStore;

/**
 * @brief Класс тестов для FileChainStore
 */
class ChainStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("qtc_store_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        miner_ = make_key();
        user_ = make_key();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static const core::ChainParams& params() {
        return core::ChainParams::regtest();
    }

    std::unique_ptr<FileChainStore> open_store(chain::FileStoreOptions options = {false, 1000}) {
        auto store = FileChainStore::open(dir_, options);
        EXPECT_TRUE(store.has_value()) << store.error().message;
        return store ? std::move(*store) : nullptr;
    }

    /// @brief Построить цепочку из трёх блоков с одной транзакцией
    chain::ChainState build_chain(chain::ChainStore& store) {
        chain::ConsensusEngine engine(params(), store, time_);
        EXPECT_TRUE(engine.initialize().has_value());

        auto block1 = next_block(engine, miner_.lock);
        EXPECT_EQ(engine.submit_block(block1)->status, BlockStatus::ExtendMain);

        auto spend = make_spend({coinbase_outpoint(block1)}, miner_,
                                {core::TxOut{params().rewards.initial_subsidy - TEST_FEE, user_.lock}});
        auto block2 = next_block(engine, miner_.lock, {spend}, TEST_FEE);
        EXPECT_EQ(engine.submit_block(block2)->status, BlockStatus::ExtendMain);

        auto block3 = next_block(engine, miner_.lock);
        EXPECT_EQ(engine.submit_block(block3)->status, BlockStatus::ExtendMain);
        return engine.state();
    }

    std::filesystem::path log_path() const {
        return dir_ / FileChainStore::LOG_FILE;
    }

    std::filesystem::path dir_;
    core::NetworkTime time_ = fixed_time();
    TestKey miner_;
    TestKey user_;
};

/**
 * @brief Тест: перезапуск восстанавливает tip и UTXO set
 */
TEST_F(ChainStoreTest, RestartRecovery) {
    chain::ChainState before;
    {
        auto store = open_store();
        ASSERT_NE(store, nullptr);
        before = build_chain(*store);
        EXPECT_TRUE(std::filesystem::exists(log_path()));
        EXPECT_EQ(store->log_size(), std::filesystem::file_size(log_path()));
    }

    auto store = open_store();
    ASSERT_NE(store, nullptr);
    chain::ConsensusEngine engine(params(), *store, time_);
    ASSERT_TRUE(engine.initialize().has_value());

    EXPECT_EQ(engine.state().tip_hash, before.tip_hash);
    EXPECT_EQ(engine.state().height, 3u);
    EXPECT_EQ(engine.state().total_minted, before.total_minted);
    EXPECT_EQ(engine.utxo().balance(user_.lock), params().rewards.initial_subsidy - TEST_FEE);

    auto tip = store->read_tip();
    ASSERT_TRUE(tip.has_value());
    EXPECT_EQ(tip->tip_hash, before.tip_hash);

    auto block = store->read_block(2u);
    ASSERT_TRUE(block.has_value());
    EXPECT_EQ(block->transactions.size(), 2u);
    EXPECT_EQ(store->read_block(block->hash())->hash(), block->hash());

    EXPECT_TRUE(store->read_undo(block->hash()).has_value());
}

/**
 * @brief Тест: отсутствующие блоки
 */
TEST_F(ChainStoreTest, ReadNotFound) {
    auto store = open_store();
    ASSERT_NE(store, nullptr);
    build_chain(*store);

    Hash256 unknown{};
    unknown[0] = 0x42;
    auto by_hash = store->read_block(unknown);
    ASSERT_FALSE(by_hash.has_value());
    EXPECT_EQ(by_hash.error().code, ErrorCode::QueryNotFound);

    auto by_height = store->read_block(99u);
    ASSERT_FALSE(by_height.has_value());
    EXPECT_EQ(by_height.error().code, ErrorCode::QueryNotFound);
}

/**
 * @brief Тест: мусор в конце журнала отбрасывается
 */
TEST_F(ChainStoreTest, TrailingGarbageTruncated) {
    chain::ChainState before;
    uint64_t clean_size = 0;
    {
        auto store = open_store();
        ASSERT_NE(store, nullptr);
        before = build_chain(*store);
        clean_size = store->log_size();
    }

    {
        std::ofstream out(log_path(), std::ios::binary | std::ios::app);
        out << "oborvannaya zapis";
    }
    ASSERT_GT(std::filesystem::file_size(log_path()), clean_size);

    auto store = open_store();
    ASSERT_NE(store, nullptr);
    chain::ConsensusEngine engine(params(), *store, time_);
    ASSERT_TRUE(engine.initialize().has_value());

    EXPECT_EQ(engine.state().tip_hash, before.tip_hash);
    EXPECT_EQ(store->log_size(), clean_size);
    EXPECT_EQ(std::filesystem::file_size(log_path()), clean_size);
}

/**
 * @brief Тест: оборванная последняя фиксация
 *
 * Тело блока 3 записано, фиксация подключения оборвана. После
 * восстановления блок подключается заново как лучшая ветка.
 */
TEST_F(ChainStoreTest, TornCommitRecovered) {
    chain::ChainState before;
    {
        auto store = open_store();
        ASSERT_NE(store, nullptr);
        before = build_chain(*store);
    }

    const auto size = std::filesystem::file_size(log_path());
    std::filesystem::resize_file(log_path(), size - 3);

    auto store = open_store();
    ASSERT_NE(store, nullptr);
    chain::ConsensusEngine engine(params(), *store, time_);
    ASSERT_TRUE(engine.initialize().has_value());

    EXPECT_EQ(engine.state().height, 3u);
    EXPECT_EQ(engine.state().tip_hash, before.tip_hash);
    EXPECT_EQ(engine.utxo().balance(user_.lock), params().rewards.initial_subsidy - TEST_FEE);
    EXPECT_EQ(engine.utxo().total_value(), before.total_minted);

    // Цепочка продолжается после восстановления
    auto block4 = next_block(engine, miner_.lock);
    EXPECT_EQ(engine.submit_block(block4)->status, BlockStatus::ExtendMain);
}

/**
 * @brief Тест: снимок UTXO и воспроизведение журнала после него
 */
TEST_F(ChainStoreTest, SnapshotAndReplay) {
    chain::ChainState before;
    {
        auto store = open_store({false, 2});
        ASSERT_NE(store, nullptr);
        before = build_chain(*store);
        EXPECT_TRUE(std::filesystem::exists(dir_ / FileChainStore::SNAPSHOT_FILE));
    }

    auto store = open_store({false, 2});
    ASSERT_NE(store, nullptr);
    chain::ConsensusEngine engine(params(), *store, time_);
    ASSERT_TRUE(engine.initialize().has_value());
    EXPECT_EQ(engine.state().tip_hash, before.tip_hash);
    EXPECT_EQ(engine.utxo().balance(user_.lock), params().rewards.initial_subsidy - TEST_FEE);

    ASSERT_TRUE(store->write_snapshot().has_value());
}

/**
 * @brief Тест: повреждённый снимок пропускается, журнал воспроизводится целиком
 */
TEST_F(ChainStoreTest, CorruptSnapshotIgnored) {
    chain::ChainState before;
    {
        auto store = open_store();
        ASSERT_NE(store, nullptr);
        before = build_chain(*store);
        ASSERT_TRUE(store->write_snapshot().has_value());
    }

    {
        std::fstream snapshot(dir_ / FileChainStore::SNAPSHOT_FILE,
                              std::ios::binary | std::ios::in | std::ios::out);
        snapshot.seekp(20);
        snapshot.put('\x7f');
    }

    auto store = open_store();
    ASSERT_NE(store, nullptr);
    chain::ConsensusEngine engine(params(), *store, time_);
    ASSERT_TRUE(engine.initialize().has_value());
    EXPECT_EQ(engine.state().tip_hash, before.tip_hash);
    EXPECT_EQ(engine.utxo().total_value(), before.total_minted);
}

/**
 * @brief Тест: хранилище другой сети не принимается
 */
TEST_F(ChainStoreTest, RejectsOtherNetwork) {
    {
        auto store = open_store();
        ASSERT_NE(store, nullptr);
        build_chain(*store);
    }

    auto store = open_store();
    ASSERT_NE(store, nullptr);
    chain::ConsensusEngine engine(core::ChainParams::mainnet(), *store, time_);
    auto result = engine.initialize();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::StorageCorrupted);
}

} // namespace qtc::tests
