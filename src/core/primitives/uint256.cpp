/**
 * @file uint256.cpp
 * @brief Реализация 256-битного целого числа
 */

#include "uint256.hpp"
#include "../byte_order.hpp"

#include <stdexcept>

namespace qtc::core {

namespace {

[[nodiscard]] inline uint8_t hex_char_to_int(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw std::invalid_argument("Invalid hex character");
}

} // namespace

// =============================================================================
// Конвертация в 64-битные слова
// =============================================================================

uint256::Limbs uint256::to_limbs() const noexcept {
    Limbs limbs{};
    for (std::size_t i = 0; i < 4; ++i) {
        limbs[i] = read_le64(data_.data() + i * 8);
    }
    return limbs;
}

uint256 uint256::from_limbs(const Limbs& limbs) noexcept {
    uint256 result;
    for (std::size_t i = 0; i < 4; ++i) {
        write_le64(result.data_.data() + i * 8, limbs[i]);
    }
    return result;
}

uint64_t uint256::low64() const noexcept {
    return read_le64(data_.data());
}

unsigned uint256::bits() const noexcept {
    for (std::size_t i = SIZE; i-- > 0;) {
        if (data_[i] != 0) {
            unsigned bit = 8;
            while (bit > 0 && (data_[i] & (1u << (bit - 1))) == 0) {
                --bit;
            }
            return static_cast<unsigned>(i * 8) + bit;
        }
    }
    return 0;
}

double uint256::to_double() const noexcept {
    double result = 0.0;
    for (std::size_t i = SIZE; i-- > 0;) {
        result = result * 256.0 + static_cast<double>(data_[i]);
    }
    return result;
}

// =============================================================================
// Арифметика
// =============================================================================

uint256 uint256::operator+(const uint256& other) const noexcept {
    auto a = to_limbs();
    auto b = other.to_limbs();
    Limbs r{};
    unsigned __int128 carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        carry += static_cast<unsigned __int128>(a[i]) + b[i];
        r[i] = static_cast<uint64_t>(carry);
        carry >>= 64;
    }
    return from_limbs(r);
}

uint256 uint256::operator-(const uint256& other) const noexcept {
    return *this + (~other + one());
}

uint256 uint256::operator~() const noexcept {
    uint256 result;
    for (std::size_t i = 0; i < SIZE; ++i) {
        result.data_[i] = static_cast<uint8_t>(~data_[i]);
    }
    return result;
}

uint256 uint256::operator<<(unsigned shift) const noexcept {
    if (shift >= 256) return zero();
    auto a = to_limbs();
    Limbs r{};
    const unsigned words = shift / 64;
    const unsigned rem = shift % 64;
    for (std::size_t i = 4; i-- > words;) {
        uint64_t v = a[i - words] << rem;
        if (rem != 0 && i - words > 0) {
            v |= a[i - words - 1] >> (64 - rem);
        }
        r[i] = v;
    }
    return from_limbs(r);
}

uint256 uint256::operator>>(unsigned shift) const noexcept {
    if (shift >= 256) return zero();
    auto a = to_limbs();
    Limbs r{};
    const unsigned words = shift / 64;
    const unsigned rem = shift % 64;
    for (std::size_t i = 0; i + words < 4; ++i) {
        uint64_t v = a[i + words] >> rem;
        if (rem != 0 && i + words + 1 < 4) {
            v |= a[i + words + 1] << (64 - rem);
        }
        r[i] = v;
    }
    return from_limbs(r);
}

uint256 uint256::operator/(const uint256& divisor) const noexcept {
    if (divisor.is_zero() || *this < divisor) {
        return zero();
    }

    // Деление сдвигом и вычитанием, начиная со старшего совпадающего бита
    uint256 remainder = *this;
    uint256 quotient;
    const unsigned shift = bits() - divisor.bits();
    uint256 shifted = divisor << shift;

    for (unsigned i = shift + 1; i-- > 0;) {
        if (remainder >= shifted) {
            remainder = remainder - shifted;
            quotient.data_[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
        }
        shifted = shifted >> 1;
    }
    return quotient;
}

std::optional<uint256> uint256::mul_div(
    uint64_t numerator,
    uint64_t denominator
) const noexcept {
    if (denominator == 0) {
        return std::nullopt;
    }

    // 320-битное произведение: 5 слов
    auto a = to_limbs();
    std::array<uint64_t, 5> product{};
    unsigned __int128 carry = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        carry += static_cast<unsigned __int128>(a[i]) * numerator;
        product[i] = static_cast<uint64_t>(carry);
        carry >>= 64;
    }
    product[4] = static_cast<uint64_t>(carry);

    // Деление 320-битного числа на 64-битное, со старшего слова
    unsigned __int128 rem = 0;
    std::array<uint64_t, 5> quotient{};
    for (std::size_t i = 5; i-- > 0;) {
        unsigned __int128 cur = (rem << 64) | product[i];
        quotient[i] = static_cast<uint64_t>(cur / denominator);
        rem = cur % denominator;
    }

    if (quotient[4] != 0) {
        return std::nullopt;
    }
    return from_limbs({quotient[0], quotient[1], quotient[2], quotient[3]});
}

// =============================================================================
// Строковое представление
// =============================================================================

std::string uint256::to_hex() const {
    return hash_to_hex(data_);
}

uint256 uint256::from_hex(std::string_view hex) {
    if (hex.size() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length");
    }

    uint256 result;
    for (std::size_t i = 0; i < SIZE; ++i) {
        std::size_t hex_idx = (SIZE - 1 - i) * 2;
        result.data_[i] = static_cast<uint8_t>(
            (hex_char_to_int(hex[hex_idx]) << 4) | hex_char_to_int(hex[hex_idx + 1]));
    }
    return result;
}

} // namespace qtc::core
