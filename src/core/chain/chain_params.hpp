/**
 * @file chain_params.hpp
 * @brief Параметры консенсуса QTC
 *
 * Единственный авторитетный источник экономической политики и
 * лимитов консенсуса. Валидаторы, майнер и интерфейс запросов читают
 * значения только отсюда.
 */

#pragma once

#include "../types.hpp"
#include "../constants.hpp"

#include <string>
#include <string_view>
#include <cstdint>

namespace qtc::core {

struct Block;

/**
 * @brief Сеть
 */
enum class Network {
    Mainnet,
    Regtest,
};

/**
 * @brief Параметры сложности
 */
struct DifficultyParams {
    /// @brief Целевое время блока (секунды)
    uint32_t target_spacing{600};

    /// @brief Интервал пересчёта сложности (в блоках)
    uint32_t adjustment_interval{2016};

    /// @brief Минимальная сложность (nBits формат)
    uint32_t pow_limit_bits{0x1d00ffff};

    /// @brief Максимальный множитель изменения target за один пересчёт
    uint32_t max_adjustment_factor{4};

    /// @brief Количество блоков для Median Time Past
    uint32_t mtp_window{static_cast<uint32_t>(constants::MTP_BLOCK_COUNT)};

    /// @brief Максимальное опережение timestamp относительно времени узла (секунды)
    int64_t max_future_drift{2 * 60 * 60};

    /**
     * @brief Ожидаемое время одного интервала пересчёта
     */
    [[nodiscard]] constexpr int64_t expected_timespan() const noexcept {
        return static_cast<int64_t>(target_spacing) * adjustment_interval;
    }
};

/**
 * @brief Параметры эмиссии
 */
struct RewardParams {
    /// @brief Максимальная эмиссия (22 000 000 QTC)
    Amount max_supply{22'000'000 * constants::COIN};

    /// @brief Награда за блок в первой эре
    Amount initial_subsidy{0};

    /// @brief Интервал halving в блоках
    uint32_t halving_interval{105'120};

    /// @brief Premine (должен быть нулевым)
    Amount premine{0};

    /// @brief Время созревания coinbase (в блоках)
    uint32_t coinbase_maturity{100};
};

/**
 * @brief Лимиты размеров блока и транзакций
 */
struct BlockLimits {
    std::size_t max_block_size{1'000'000};
    std::size_t max_block_transactions{10'000};
    std::size_t max_tx_size{100'000};
    std::size_t max_tx_inputs{250};
    std::size_t max_tx_outputs{1'000};
};

/**
 * @brief Параметры genesis блока
 */
struct GenesisParams {
    uint32_t timestamp{0};
    uint32_t nonce{0};
};

/**
 * @brief Параметры цепочки
 */
struct ChainParams {
    /// @brief Название сети ("mainnet", "regtest")
    std::string name;

    /// @brief Тикер
    std::string ticker{"QTC"};

    Network network{Network::Mainnet};
    DifficultyParams difficulty;
    RewardParams rewards;
    BlockLimits limits;
    GenesisParams genesis;

    /// @brief Порог пыли: выходы меньше этой суммы не ретранслируются
    Amount dust_threshold{546};

    /**
     * @brief Параметры mainnet
     */
    [[nodiscard]] static const ChainParams& mainnet();

    /**
     * @brief Параметры regtest (тривиальный proof-of-work)
     */
    [[nodiscard]] static const ChainParams& regtest();

    /**
     * @brief Найти параметры по имени сети
     */
    [[nodiscard]] static Result<ChainParams> for_network(std::string_view name);

    /**
     * @brief Проверить внутреннюю согласованность политики
     *
     * Нулевой premine, сумма геометрического ряда наград не превышает
     * max_supply, ненулевые интервалы, корректный pow limit.
     */
    [[nodiscard]] Result<void> validate() const;

    [[nodiscard]] bool is_money_range(Amount amount) const noexcept {
        return amount >= 0 && amount <= rewards.max_supply;
    }
};

/**
 * @brief Начальная награда, при которой сумма эмиссии не превышает лимит
 *
 * initial = floor(max_supply / (2 × halving_interval)).
 */
[[nodiscard]] constexpr Amount initial_subsidy_for(Amount max_supply, uint32_t halving_interval) noexcept {
    return halving_interval == 0 ? 0 : max_supply / (2 * static_cast<Amount>(halving_interval));
}

/**
 * @brief Построить genesis блок сети
 *
 * Coinbase genesis не имеет ни входов, ни выходов: premine отсутствует.
 */
[[nodiscard]] Block make_genesis_block(const ChainParams& params);

} // namespace qtc::core
