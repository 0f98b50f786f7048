/**
 * @file types.cpp
 * @brief Hex утилиты
 */

#include "types.hpp"
#include "constants.hpp"

#include <format>

namespace qtc {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(ByteSpan data) {
    std::string result;
    result.reserve(data.size() * 2);
    for (uint8_t b : data) {
        result.push_back(HEX_DIGITS[b >> 4]);
        result.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return result;
}

std::string hash_to_hex(const Hash256& hash) {
    std::string result;
    result.reserve(64);
    // Старший байт первым (как в explorer)
    for (std::size_t i = hash.size(); i-- > 0;) {
        result.push_back(HEX_DIGITS[hash[i] >> 4]);
        result.push_back(HEX_DIGITS[hash[i] & 0x0F]);
    }
    return result;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(ErrorCode::DecodeMalformed, "Нечётная длина hex строки");
    }

    Bytes result;
    result.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<Bytes>(
                ErrorCode::DecodeMalformed,
                std::format("Недопустимый hex символ в позиции {}", i)
            );
        }
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return result;
}

std::string format_amount(Amount amount) {
    const bool negative = amount < 0;
    const uint64_t magnitude = negative
        ? static_cast<uint64_t>(-(amount + 1)) + 1
        : static_cast<uint64_t>(amount);
    const auto coin = static_cast<uint64_t>(constants::COIN);
    return std::format("{}{}.{:08}", negative ? "-" : "", magnitude / coin, magnitude % coin);
}

} // namespace qtc
