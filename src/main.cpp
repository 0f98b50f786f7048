/**
 * @file main.cpp
 * @brief Точка входа узла QTC
 *
 * Основные компоненты:
 * 1. FileChainStore - журнал блоков и снимки UTXO
 * 2. ConsensusEngine - индекс блоков, выбор цепочки, reorg
 * 3. Mempool - неподтверждённые транзакции
 * 4. Miner - встроенный майнер (опционально)
 * 5. Node - фасад запросов
 *
 * Использование:
 *   qtc-node [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/chain/chain_params.hpp"
#include "core/network_time.hpp"
#include "core/primitives/address.hpp"
#include "crypto/dilithium.hpp"
#include "chain/file_chain_store.hpp"
#include "node/node.hpp"
#include "log/logger.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Компонент для логов
constexpr const char* COMPONENT = "Main";

/// @brief Интервал обслуживания (просрочка mempool и сирот, статус)
constexpr auto MAINTENANCE_INTERVAL = std::chrono::seconds(60);

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/// @brief Код выхода (ненулевой после фатальной ошибки)
std::atomic<int> g_exit_code{0};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
QTC Node v)" << VERSION << R"(
Узел proof-of-work блокчейна QTC с подписями Dilithium2

ИСПОЛЬЗОВАНИЕ:
    qtc-node [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (qtc.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти
    --info               Восстановить цепочку, вывести состояние и выйти

ПРИМЕРЫ:
    qtc-node -c /etc/qtc/qtc.toml
    qtc-node --info

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "QTC Node v" << VERSION << std::endl;
    std::cout << "Подписи: " << qtc::crypto::algorithm_name() << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool show_info = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--info") {
            args.show_info = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
    }

    return args;
}

/**
 * @brief Собрать настройки узла из конфигурации
 */
qtc::node::NodeOptions make_node_options(const qtc::Config& config) {
    qtc::node::NodeOptions options;
    options.query_timeout = std::chrono::milliseconds(config.node.query_timeout_ms);

    options.mempool.max_transactions = config.mempool.max_transactions;
    options.mempool.max_bytes = config.mempool.max_bytes;
    options.mempool.expiry_seconds = config.mempool.expiry_seconds;
    options.mempool.min_fee_rate = config.mempool.min_fee_rate;

    options.orphans.max_blocks = config.orphans.max_blocks;
    options.orphans.ttl_seconds = config.orphans.ttl_seconds;

    options.mining_enabled = config.mining.enabled;
    if (config.mining.enabled) {
        // Адрес проверен в Config::validate()
        options.payout_lock = qtc::core::decode_address(config.mining.payout_address).value_or(qtc::Hash256{});
    }
    options.assembler.max_block_bytes = config.mining.max_block_bytes;
    return options;
}

/**
 * @brief Вывести состояние цепочки
 */
void print_chain_info(const qtc::node::Node& node) {
    using namespace qtc;

    auto info = node.chain_info();
    if (!info) {
        log::error(COMPONENT, std::format("Состояние недоступно: {}", info.error().message));
        return;
    }
    auto economics = node.economics();

    std::cout << "Сеть:              " << info->network << std::endl;
    std::cout << "Высота:            " << info->height << std::endl;
    std::cout << "Tip:               " << hash_to_hex(info->tip_hash) << std::endl;
    std::cout << "Работа цепочки:    " << info->chain_work.to_hex() << std::endl;
    std::cout << std::format("Сложность:         {:.6f}", info->difficulty) << std::endl;
    std::cout << std::format("Следующие bits:    0x{:08x}", info->next_bits) << std::endl;
    std::cout << "Пересчёт на:       " << info->next_retarget_height << std::endl;
    std::cout << "MTP:               " << info->median_time_past << std::endl;
    std::cout << "Выпущено:          " << format_amount(info->total_minted) << " QTC" << std::endl;
    if (economics) {
        std::cout << "Награда блока:     " << format_amount(economics->current_subsidy) << " QTC" << std::endl;
        std::cout << "Лимит эмиссии:     " << format_amount(economics->max_supply) << " QTC" << std::endl;
        if (economics->next_halving_height) {
            std::cout << "Следующий halving: " << *economics->next_halving_height << std::endl;
        }
    }
    std::cout << "Mempool:           " << info->mempool_size << " транзакций" << std::endl;
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace qtc;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Загружаем конфигурацию
    auto config_result = Config::load_with_search(args.config_path);
    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    if (args.test_config) {
        std::cout << "[INFO] Конфигурация валидна" << std::endl;
        return 0;
    }

    // Логирование
    auto& logger = log::Logger::instance();
    logger.set_level(log::parse_level(config.logging.level).value_or(log::Level::Info));
    logger.set_color(config.logging.color);

    const core::ChainParams params = *core::ChainParams::for_network(config.node.network);

    // Открываем хранилище
    chain::FileStoreOptions store_options;
    store_options.fsync = config.storage.fsync;
    store_options.snapshot_interval = config.storage.snapshot_interval;

    log::info(COMPONENT, std::format("Открытие хранилища {}", config.node.data_dir.string()));
    auto store = chain::FileChainStore::open(config.node.data_dir, store_options);
    if (!store) {
        log::error(COMPONENT, std::format("Не удалось открыть хранилище: {}", store.error().message));
        return 1;
    }

    core::NetworkTime network_time;
    node::Node node(params, **store, network_time, make_node_options(config));

    node.set_fatal_handler([](const Error& error) {
        log::error(COMPONENT, std::format("Остановка узла: {}", error.message));
        g_exit_code.store(2);
        g_running.store(false);
    });

    auto started = node.start();
    if (!started) {
        log::error(COMPONENT, std::format("Не удалось запустить узел: {}", started.error().message));
        return 1;
    }

    if (args.show_info) {
        node.stop();
        print_chain_info(node);
        return 0;
    }

    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    log::info(COMPONENT, std::format("QTC Node v{} запущен", VERSION));

    // Основной цикл
    auto last_maintenance = std::chrono::steady_clock::now();
    while (g_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        const auto now = std::chrono::steady_clock::now();
        if (now - last_maintenance < MAINTENANCE_INTERVAL) {
            continue;
        }
        last_maintenance = now;

        node.expire_stale();
        if (auto info = node.chain_info()) {
            log::info(COMPONENT, std::format("Высота {}, mempool {}, выпущено {} QTC",
                info->height, info->mempool_size, format_amount(info->total_minted)));
        }
    }

    // Graceful shutdown
    log::info(COMPONENT, "Остановка узла...");
    node.stop();

    if (const auto* miner = node.miner()) {
        const auto stats = miner->stats();
        std::cout << "\n=== Итоговая статистика майнера ===" << std::endl;
        std::cout << "Шаблонов: " << stats.templates << std::endl;
        std::cout << "Найдено блоков: " << stats.blocks_found << std::endl;
        std::cout << "Устаревших блоков: " << stats.stale_blocks << std::endl;
    }

    log::info(COMPONENT, "QTC Node остановлен");
    return g_exit_code.load();
}
