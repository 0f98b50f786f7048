/**
 * @file uint256.hpp
 * @brief 256-битное беззнаковое целое число
 *
 * Используется для targets, сравнения proof-of-work и накопленной
 * работы цепочки. Арифметика нужна для пересчёта сложности
 * (target × actual / expected) и для работы блока (2^256 / (target + 1)).
 */

#pragma once

#include "../types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <compare>
#include <optional>

namespace qtc::core {

/**
 * @brief 256-битное беззнаковое целое число
 *
 * Хранится в little-endian формате, байт 0 - младший.
 */
class uint256 {
public:
    /// @brief Размер в байтах
    static constexpr std::size_t SIZE = 32;

    /// @brief Конструктор по умолчанию (нулевое значение)
    constexpr uint256() noexcept : data_{} {}

    /// @brief Конструктор из массива байт
    constexpr explicit uint256(const Hash256& hash) noexcept : data_(hash) {}

    /// @brief Конструктор из 64-битного числа
    constexpr explicit uint256(uint64_t value) noexcept : data_{} {
        for (std::size_t i = 0; i < 8; ++i) {
            data_[i] = static_cast<uint8_t>(value >> (8 * i));
        }
    }

    // =========================================================================
    // Доступ к данным
    // =========================================================================

    [[nodiscard]] constexpr const uint8_t* data() const noexcept {
        return data_.data();
    }

    [[nodiscard]] constexpr uint8_t* data() noexcept {
        return data_.data();
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept {
        return SIZE;
    }

    [[nodiscard]] constexpr uint8_t operator[](std::size_t i) const noexcept {
        return data_[i];
    }

    [[nodiscard]] constexpr uint8_t& operator[](std::size_t i) noexcept {
        return data_[i];
    }

    [[nodiscard]] constexpr const Hash256& to_hash256() const noexcept {
        return data_;
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /**
     * @brief Младшие 64 бита
     */
    [[nodiscard]] uint64_t low64() const noexcept;

    /**
     * @brief Количество значащих бит (0 для нуля)
     */
    [[nodiscard]] unsigned bits() const noexcept;

    /**
     * @brief Приближённое значение в double (для отображения сложности)
     */
    [[nodiscard]] double to_double() const noexcept;

    // =========================================================================
    // Арифметика
    // =========================================================================

    /// @brief Сложение по модулю 2^256
    [[nodiscard]] uint256 operator+(const uint256& other) const noexcept;

    /// @brief Вычитание по модулю 2^256
    [[nodiscard]] uint256 operator-(const uint256& other) const noexcept;

    /// @brief Побитовое отрицание
    [[nodiscard]] uint256 operator~() const noexcept;

    [[nodiscard]] uint256 operator<<(unsigned shift) const noexcept;
    [[nodiscard]] uint256 operator>>(unsigned shift) const noexcept;

    /**
     * @brief Целочисленное деление
     *
     * @param divisor Делитель; деление на ноль возвращает ноль
     */
    [[nodiscard]] uint256 operator/(const uint256& divisor) const noexcept;

    uint256& operator+=(const uint256& other) noexcept {
        *this = *this + other;
        return *this;
    }

    /**
     * @brief Вычислить this × numerator / denominator без потери точности
     *
     * Промежуточное произведение хранится в 320 битах.
     *
     * @return Результат или nullopt если он не помещается в 256 бит
     *         или denominator == 0
     */
    [[nodiscard]] std::optional<uint256> mul_div(
        uint64_t numerator,
        uint64_t denominator
    ) const noexcept;

    // =========================================================================
    // Сравнение
    // =========================================================================

    /**
     * @brief Оператор сравнения (трёхстороннее)
     *
     * Сравнивает числа со старших байтов.
     */
    [[nodiscard]] constexpr std::strong_ordering operator<=>(
        const uint256& other
    ) const noexcept {
        for (std::size_t i = SIZE; i-- > 0;) {
            if (data_[i] < other.data_[i]) return std::strong_ordering::less;
            if (data_[i] > other.data_[i]) return std::strong_ordering::greater;
        }
        return std::strong_ordering::equal;
    }

    [[nodiscard]] constexpr bool operator==(const uint256& other) const noexcept {
        return data_ == other.data_;
    }

    // =========================================================================
    // Строковое представление
    // =========================================================================

    /**
     * @brief Преобразовать в hex строку (старший байт первым)
     */
    [[nodiscard]] std::string to_hex() const;

    /**
     * @brief Создать из hex строки (старший байт первым)
     *
     * @throws std::invalid_argument при неверной длине или символе
     */
    [[nodiscard]] static uint256 from_hex(std::string_view hex);

    // =========================================================================
    // Статические константы
    // =========================================================================

    [[nodiscard]] static constexpr uint256 zero() noexcept {
        return uint256{};
    }

    [[nodiscard]] static constexpr uint256 max() noexcept {
        uint256 result;
        for (auto& b : result.data_) {
            b = 0xFF;
        }
        return result;
    }

    [[nodiscard]] static constexpr uint256 one() noexcept {
        return uint256{1ULL};
    }

private:
    using Limbs = std::array<uint64_t, 4>;

    [[nodiscard]] Limbs to_limbs() const noexcept;
    [[nodiscard]] static uint256 from_limbs(const Limbs& limbs) noexcept;

    Hash256 data_;
};

} // namespace qtc::core
