/**
 * @file mtp_calculator.hpp
 * @brief Вычисление Median Time Past (MTP)
 *
 * MTP - медиана timestamps последних N блоков (N = 11). Timestamp нового
 * блока должен быть строго больше MTP его родителя.
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"
#include "primitives/block_header.hpp"

#include <cstdint>
#include <vector>

namespace qtc::core {

/**
 * @brief Калькулятор Median Time Past
 *
 * Хранит timestamps последних window блоков (кольцевой буфер).
 * При неполном окне медиана берётся по имеющимся блокам.
 */
class MtpCalculator {
public:
    /**
     * @param window Размер окна (количество блоков)
     */
    explicit MtpCalculator(std::size_t window = constants::MTP_BLOCK_COUNT);

    /**
     * @brief Добавить timestamp блока
     */
    void push_timestamp(uint32_t timestamp);

    /**
     * @brief Добавить заголовок блока
     */
    void push_header(const BlockHeader& header);

    /**
     * @brief Вычислить MTP
     *
     * @return uint32_t Медиана или 0 если timestamps нет
     */
    [[nodiscard]] uint32_t get_mtp() const;

    /**
     * @brief Минимально допустимый timestamp следующего блока (MTP + 1)
     */
    [[nodiscard]] uint32_t get_min_timestamp() const;

    /**
     * @brief Заполнено ли окно полностью
     */
    [[nodiscard]] bool has_sufficient_data() const noexcept;

    [[nodiscard]] std::size_t count() const noexcept;

private:
    std::vector<uint32_t> timestamps_;
    std::size_t window_;
    std::size_t head_{0};  // Позиция для следующей записи
};

} // namespace qtc::core
