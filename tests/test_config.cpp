/**
 * @file test_config.cpp
 * @brief Тесты загрузки и валидации конфигурации
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "core/config.hpp"
#include "core/primitives/address.hpp"

namespace qtc::tests {

/**
 * @brief Класс тестов для Config
 */
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("qtc_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::string& content) {
        auto path = dir_ / "qtc.toml";
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

/**
 * @brief Тест: значения по умолчанию валидны
 */
TEST_F(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_EQ(config.node.network, "mainnet");
    EXPECT_EQ(config.node.query_timeout_ms, 2000u);
    EXPECT_EQ(config.mempool.min_fee_rate, 1000);
    EXPECT_FALSE(config.mining.enabled);
    EXPECT_TRUE(config.validate().has_value());
}

/**
 * @brief Тест: разбор всех секций
 */
TEST_F(ConfigTest, ParseAllSections) {
    auto config = Config::parse(R"(
[node]
network = "regtest"
data_dir = "/var/lib/qtc"
query_timeout_ms = 500

[mempool]
max_transactions = 10
max_bytes = 4096
expiry_seconds = 60
min_fee_rate = 5

[orphans]
max_blocks = 7
ttl_seconds = 30

[mining]
enabled = false
max_block_bytes = 20000

[storage]
snapshot_interval = 3
fsync = false

[logging]
level = "debug"
color = false
)");

    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->node.network, "regtest");
    EXPECT_EQ(config->node.data_dir, std::filesystem::path("/var/lib/qtc"));
    EXPECT_EQ(config->node.query_timeout_ms, 500u);
    EXPECT_EQ(config->mempool.max_transactions, 10u);
    EXPECT_EQ(config->mempool.max_bytes, 4096u);
    EXPECT_EQ(config->mempool.expiry_seconds, 60);
    EXPECT_EQ(config->mempool.min_fee_rate, 5);
    EXPECT_EQ(config->orphans.max_blocks, 7u);
    EXPECT_EQ(config->orphans.ttl_seconds, 30);
    EXPECT_EQ(config->mining.max_block_bytes, 20000u);
    EXPECT_EQ(config->storage.snapshot_interval, 3u);
    EXPECT_FALSE(config->storage.fsync);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);
    EXPECT_TRUE(config->validate().has_value());
}

/**
 * @brief Тест: отсутствующие ключи сохраняют значения по умолчанию
 */
TEST_F(ConfigTest, PartialConfig) {
    auto config = Config::parse("[node]\nnetwork = \"regtest\"\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->node.network, "regtest");
    EXPECT_EQ(config->orphans.max_blocks, 100u);
    EXPECT_EQ(config->logging.level, "info");
}

/**
 * @brief Тест: синтаксическая ошибка и отрицательные значения
 */
TEST_F(ConfigTest, ParseErrors) {
    auto broken = Config::parse("[node\nnetwork = ");
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error().code, ErrorCode::ConfigParseError);

    auto negative = Config::parse("[mempool]\nmin_fee_rate = -1\n");
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, ErrorCode::ConfigInvalidValue);
    EXPECT_NE(negative.error().message.find("mempool.min_fee_rate"), std::string::npos);
}

/**
 * @brief Тест: валидация отвергает некорректные значения
 */
TEST_F(ConfigTest, ValidationErrors) {
    Config unknown_network;
    unknown_network.node.network = "testnet";
    EXPECT_FALSE(unknown_network.validate().has_value());

    Config zero_timeout;
    zero_timeout.node.query_timeout_ms = 0;
    EXPECT_FALSE(zero_timeout.validate().has_value());

    Config zero_mempool;
    zero_mempool.mempool.max_bytes = 0;
    EXPECT_FALSE(zero_mempool.validate().has_value());

    Config bad_level;
    bad_level.logging.level = "verbose";
    auto level = bad_level.validate();
    ASSERT_FALSE(level.has_value());
    EXPECT_EQ(level.error().code, ErrorCode::ConfigInvalidValue);
}

/**
 * @brief Тест: майнинг требует корректный адрес выплаты
 */
TEST_F(ConfigTest, MiningRequiresPayoutAddress) {
    Config config;
    config.mining.enabled = true;
    EXPECT_FALSE(config.validate().has_value());

    config.mining.payout_address = "qtc1xyz";
    EXPECT_FALSE(config.validate().has_value());

    Hash256 lock{};
    lock[0] = 0x42;
    config.mining.payout_address = core::encode_address(lock);
    EXPECT_TRUE(config.validate().has_value());
}

/**
 * @brief Тест: загрузка из файла
 */
TEST_F(ConfigTest, LoadFromFile) {
    auto path = write_file("[node]\nnetwork = \"regtest\"\nquery_timeout_ms = 100\n");

    auto config = Config::load(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->node.network, "regtest");
    EXPECT_EQ(config->node.query_timeout_ms, 100u);

    auto searched = Config::load_with_search(path);
    ASSERT_TRUE(searched.has_value());
    EXPECT_EQ(searched->node.query_timeout_ms, 100u);
}

/**
 * @brief Тест: явно указанный отсутствующий файл - ошибка
 */
TEST_F(ConfigTest, MissingFile) {
    auto missing = Config::load(dir_ / "absent.toml");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::ConfigNotFound);

    auto searched = Config::load_with_search(dir_ / "absent.toml");
    ASSERT_FALSE(searched.has_value());
    EXPECT_EQ(searched.error().code, ErrorCode::ConfigNotFound);
}

} // namespace qtc::tests
