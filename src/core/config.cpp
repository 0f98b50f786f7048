/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"
#include "chain/chain_params.hpp"
#include "primitives/address.hpp"
#include "../log/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <vector>

namespace qtc {

namespace {

/**
 * @brief Прочитать неотрицательное целое
 *
 * @return false если значение есть, но отрицательное
 */
template<typename T>
bool read_unsigned(const toml::table& section, std::string_view key, T& out) {
    auto val = section[key].value<int64_t>();
    if (!val) {
        return true;
    }
    if (*val < 0) {
        return false;
    }
    out = static_cast<T>(*val);
    return true;
}

Result<Config> from_table(const toml::table& table) {
    Config config;
    std::string bad_key;

    auto check = [&](bool ok, std::string_view key) {
        if (!ok && bad_key.empty()) {
            bad_key = key;
        }
    };

    // === Секция [node] ===
    if (auto node = table["node"].as_table()) {
        if (auto val = (*node)["network"].value<std::string>()) {
            config.node.network = *val;
        }
        if (auto val = (*node)["data_dir"].value<std::string>()) {
            config.node.data_dir = *val;
        }
        check(read_unsigned(*node, "query_timeout_ms", config.node.query_timeout_ms), "node.query_timeout_ms");
    }

    // === Секция [mempool] ===
    if (auto mempool = table["mempool"].as_table()) {
        check(read_unsigned(*mempool, "max_transactions", config.mempool.max_transactions), "mempool.max_transactions");
        check(read_unsigned(*mempool, "max_bytes", config.mempool.max_bytes), "mempool.max_bytes");
        check(read_unsigned(*mempool, "expiry_seconds", config.mempool.expiry_seconds), "mempool.expiry_seconds");
        check(read_unsigned(*mempool, "min_fee_rate", config.mempool.min_fee_rate), "mempool.min_fee_rate");
    }

    // === Секция [orphans] ===
    if (auto orphans = table["orphans"].as_table()) {
        check(read_unsigned(*orphans, "max_blocks", config.orphans.max_blocks), "orphans.max_blocks");
        check(read_unsigned(*orphans, "ttl_seconds", config.orphans.ttl_seconds), "orphans.ttl_seconds");
    }

    // === Секция [mining] ===
    if (auto mining = table["mining"].as_table()) {
        if (auto val = (*mining)["enabled"].value<bool>()) {
            config.mining.enabled = *val;
        }
        if (auto val = (*mining)["payout_address"].value<std::string>()) {
            config.mining.payout_address = *val;
        }
        check(read_unsigned(*mining, "max_block_bytes", config.mining.max_block_bytes), "mining.max_block_bytes");
    }

    // === Секция [storage] ===
    if (auto storage = table["storage"].as_table()) {
        check(read_unsigned(*storage, "snapshot_interval", config.storage.snapshot_interval), "storage.snapshot_interval");
        if (auto val = (*storage)["fsync"].value<bool>()) {
            config.storage.fsync = *val;
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
    }

    if (!bad_key.empty()) {
        return Err<Config>(
            ErrorCode::ConfigInvalidValue,
            std::format("Отрицательное значение: {}", bad_key)
        );
    }
    return config;
}

} // namespace

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга TOML: {}", e.what())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    // Явно указанный файл обязан существовать
    if (path.has_value()) {
        return load(path.value());
    }

    std::vector<std::filesystem::path> search_paths;
    search_paths.push_back("qtc.toml");
    search_paths.push_back("/etc/qtc/qtc.toml");

    // Домашняя директория пользователя
    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "qtc" / "qtc.toml"
        );
    }

    // Ищем первый существующий файл
    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (auto params = core::ChainParams::for_network(node.network); !params) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Неизвестная сеть '{}' (mainnet или regtest)", node.network)
        );
    }

    if (node.data_dir.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Не указан каталог данных (node.data_dir)");
    }

    if (node.query_timeout_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Таймаут запросов не может быть 0");
    }

    if (mempool.max_transactions == 0 || mempool.max_bytes == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Лимиты mempool не могут быть 0");
    }

    if (mempool.expiry_seconds == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Время жизни транзакций не может быть 0");
    }

    if (auto level = log::parse_level(logging.level); !level) {
        return std::unexpected(level.error());
    }

    if (mining.enabled) {
        if (mining.payout_address.empty()) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                "Адрес для выплаты не указан (mining.payout_address)"
            );
        }
        if (auto lock = core::decode_address(mining.payout_address); !lock) {
            return Err<void>(
                ErrorCode::ConfigInvalidValue,
                std::format("Некорректный mining.payout_address: {}", lock.error().message)
            );
        }
    }

    return {};
}

} // namespace qtc
