/**
 * @file config.hpp
 * @brief Конфигурация узла QTC
 *
 * Загрузка и парсинг конфигурации из TOML файла. Консенсусные константы
 * здесь не настраиваются: их источник - ChainParams.
 *
 * Пример конфигурации (qtc.toml):
 * @code
 * [node]
 * network = "mainnet"
 * data_dir = "qtc-data"
 * query_timeout_ms = 2000
 *
 * [mempool]
 * max_transactions = 100000
 * max_bytes = 300000000
 * expiry_seconds = 1209600
 * min_fee_rate = 1000
 *
 * [orphans]
 * max_blocks = 100
 * ttl_seconds = 1200
 *
 * [mining]
 * enabled = false
 * payout_address = "qtc1..."
 * max_block_bytes = 0
 *
 * [storage]
 * snapshot_interval = 1000
 * fsync = true
 *
 * [logging]
 * level = "info"
 * color = true
 * @endcode
 */

#pragma once

#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace qtc {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Общие настройки узла
 */
struct NodeConfig {
    /// @brief Сеть: "mainnet" или "regtest"
    std::string network = "mainnet";

    /// @brief Каталог данных хранилища
    std::filesystem::path data_dir = "qtc-data";

    /// @brief Таймаут запросов (мс)
    uint32_t query_timeout_ms = 2000;
};

/**
 * @brief Политика mempool
 */
struct MempoolConfig {
    /// @brief Максимальное количество транзакций
    std::size_t max_transactions = 100'000;

    /// @brief Максимальный суммарный размер (байт)
    std::size_t max_bytes = 300'000'000;

    /// @brief Время жизни транзакции (секунды, по умолчанию 14 дней)
    int64_t expiry_seconds = 14 * 24 * 60 * 60;

    /// @brief Минимальная комиссия за 1000 байт
    Amount min_fee_rate = 1000;
};

/**
 * @brief Буфер блоков-сирот
 */
struct OrphanConfig {
    std::size_t max_blocks = 100;
    int64_t ttl_seconds = 20 * 60;
};

/**
 * @brief Настройки майнинга
 */
struct MiningConfig {
    /// @brief Запустить встроенный майнер
    bool enabled = false;

    /// @brief Адрес для выплаты награды (qtc1...)
    std::string payout_address;

    /// @brief Предел размера блока (0 = консенсусный максимум)
    std::size_t max_block_bytes = 0;
};

/**
 * @brief Настройки хранилища
 */
struct StorageConfig {
    /// @brief Период записи снимка UTXO (в фиксациях)
    uint64_t snapshot_interval = 1000;

    /// @brief fsync после каждой записи
    bool fsync = true;
};

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;
};

/**
 * @brief Полная конфигурация узла
 */
struct Config {
    NodeConfig node;
    MempoolConfig mempool;
    OrphanConfig orphans;
    MiningConfig mining;
    StorageConfig storage;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из строки TOML
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./qtc.toml
     * 3. /etc/qtc/qtc.toml
     * 4. ~/.config/qtc/qtc.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - Известную сеть и уровень логирования
     * - Непустой data_dir, ненулевые таймаут и лимиты mempool
     * - Корректный payout_address при включённом майнинге
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace qtc
