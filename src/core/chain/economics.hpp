/**
 * @file economics.hpp
 * @brief График эмиссии QTC
 *
 * subsidy(h) = initial_subsidy >> (h / halving_interval).
 * Дополнительно награда ограничена остатком до max_supply с учётом
 * фактически выпущенной суммы, а не только высоты.
 */

#pragma once

#include "chain_params.hpp"

#include <cstdint>
#include <optional>

namespace qtc::core {

/**
 * @brief Номинальная награда на высоте по графику halving
 *
 * Монотонно не возрастает, равна нулю начиная с 64-й эры.
 */
[[nodiscard]] Amount block_subsidy(const ChainParams& params, uint32_t height) noexcept;

/**
 * @brief Награда с учётом лимита эмиссии
 *
 * @param minted_before Сумма, выпущенная до этого блока
 * @return min(block_subsidy(height), max_supply - minted_before), не меньше 0
 */
[[nodiscard]] Amount capped_subsidy(
    const ChainParams& params,
    uint32_t height,
    Amount minted_before
) noexcept;

/**
 * @brief Сумма наград по графику за блоки 1..height (genesis ничего не выпускает)
 */
[[nodiscard]] Amount scheduled_supply(const ChainParams& params, uint32_t height) noexcept;

/**
 * @brief Высота следующего halving после height
 *
 * @return nullopt если награда уже нулевая
 */
[[nodiscard]] std::optional<uint32_t> next_halving_height(
    const ChainParams& params,
    uint32_t height
) noexcept;

/**
 * @brief Состояние эмиссии на высоте
 */
struct IssuanceInfo {
    uint32_t height{0};

    /// @brief Номер эры (количество прошедших halving)
    uint32_t era{0};

    /// @brief Награда блока на этой высоте
    Amount subsidy{0};

    /// @brief Выпущено по графику к этой высоте включительно
    Amount emitted{0};

    /// @brief Остаток до max_supply
    Amount remaining{0};

    std::optional<uint32_t> next_halving_height;
};

/**
 * @brief Вычислить состояние эмиссии на высоте
 */
[[nodiscard]] IssuanceInfo issuance_at(const ChainParams& params, uint32_t height) noexcept;

} // namespace qtc::core
