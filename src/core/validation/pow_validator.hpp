/**
 * @file pow_validator.hpp
 * @brief Валидатор Proof-of-Work и пересчёт сложности
 */

#pragma once

#include "../chain/chain_params.hpp"
#include "../primitives/block_header.hpp"

namespace qtc::core::validation {

/**
 * @brief Валидатор Proof-of-Work
 *
 * Проверяет:
 * - Корректность nBits (не отрицательный, не нулевой, не выше pow limit)
 * - hash(header) <= target
 *
 * Вычисляет target следующего интервала.
 */
class PowValidator {
public:
    /**
     * @brief Создать валидатор для цепочки
     *
     * @param params Параметры цепочки (должны пережить валидатор)
     */
    explicit PowValidator(const ChainParams& params);

    /**
     * @brief Проверить proof-of-work заголовка
     *
     * @return true если bits допустимы и hash <= target
     */
    [[nodiscard]] bool validate_pow(const BlockHeader& header) const noexcept;

    /**
     * @brief Проверить валидность nBits
     *
     * @return true если bits в допустимых пределах
     */
    [[nodiscard]] bool validate_bits(uint32_t bits) const noexcept;

    /**
     * @brief Является ли высота высотой пересчёта
     *
     * Пересчёт происходит на высотах h > interval, где (h - 1) % interval == 0.
     * Окно пересчёта: от блока h - 1 - interval до родителя (h - 1),
     * то есть ровно interval промежутков между блоками.
     */
    [[nodiscard]] bool is_retarget_height(uint32_t height) const noexcept;

    /**
     * @brief Ближайшая высота пересчёта, строго большая height
     */
    [[nodiscard]] uint32_t next_retarget_height(uint32_t height) const noexcept;

    /**
     * @brief Вычислить следующий target
     *
     * new = old × actual / expected; actual ограничивается диапазоном
     * [expected / factor, expected × factor]; результат не выше pow limit.
     *
     * @param last_bits Текущий compact target
     * @param actual_timespan Фактическое время интервала (секунды)
     * @return uint32_t Новый compact target
     */
    [[nodiscard]] uint32_t calculate_next_target(
        uint32_t last_bits,
        int64_t actual_timespan
    ) const noexcept;

    /**
     * @brief Ожидаемое время интервала пересчёта
     */
    [[nodiscard]] int64_t get_expected_timespan() const noexcept;

private:
    const ChainParams& params_;
};

} // namespace qtc::core::validation
