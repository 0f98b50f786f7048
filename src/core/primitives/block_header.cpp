/**
 * @file block_header.cpp
 * @brief Реализация заголовка блока
 */

#include "block_header.hpp"
#include "../byte_order.hpp"
#include "../../crypto/sha256.hpp"

#include <cstring>

namespace qtc::core {

std::array<uint8_t, BLOCK_HEADER_SIZE> BlockHeader::serialize() const noexcept {
    std::array<uint8_t, BLOCK_HEADER_SIZE> result{};
    uint8_t* out = result.data();

    write_le32(out, static_cast<uint32_t>(version));
    std::memcpy(out + 4, prev_hash.data(), 32);
    std::memcpy(out + 36, merkle_root.data(), 32);
    write_le32(out + 68, timestamp);
    write_le32(out + 72, bits);
    write_le32(out + 76, nonce);

    return result;
}

BlockHeader BlockHeader::deserialize(
    std::span<const uint8_t, BLOCK_HEADER_SIZE> data
) noexcept {
    BlockHeader header;
    const uint8_t* in = data.data();

    header.version = static_cast<int32_t>(read_le32(in));
    std::memcpy(header.prev_hash.data(), in + 4, 32);
    std::memcpy(header.merkle_root.data(), in + 36, 32);
    header.timestamp = read_le32(in + 68);
    header.bits = read_le32(in + 72);
    header.nonce = read_le32(in + 76);

    return header;
}

Hash256 BlockHeader::hash() const noexcept {
    auto serialized = serialize();
    return crypto::sha256d(serialized);
}

uint256 BlockHeader::get_target() const noexcept {
    return bits_to_target(bits);
}

bool BlockHeader::check_pow() const noexcept {
    auto target = get_target();
    if (target.is_zero()) {
        return false;
    }
    return uint256{hash()} <= target;
}

double BlockHeader::get_difficulty() const noexcept {
    return bits_to_difficulty(bits);
}

uint256 bits_to_target(uint32_t bits) noexcept {
    uint256 target;

    uint32_t exponent = bits >> 24;
    uint32_t mantissa = bits & 0x007FFFFF;

    // Отрицательный флаг недопустим
    if (bits & 0x00800000) {
        return uint256::zero();
    }

    if (exponent <= 3) {
        mantissa >>= 8 * (3 - exponent);
        return uint256{static_cast<uint64_t>(mantissa)};
    }

    // Мантисса занимает байты [exponent-3, exponent-1]
    const std::size_t shift = exponent - 3;
    for (std::size_t k = 0; k < 3; ++k) {
        auto byte = static_cast<uint8_t>(mantissa >> (8 * k));
        if (shift + k < uint256::SIZE) {
            target[shift + k] = byte;
        } else if (byte != 0) {
            return uint256::zero();
        }
    }

    return target;
}

uint32_t target_to_bits(const uint256& target) noexcept {
    // Находим старший ненулевой байт
    int i = 31;
    while (i > 0 && target[static_cast<std::size_t>(i)] == 0) {
        --i;
    }

    auto byte_at = [&](int idx) -> uint32_t {
        return idx >= 0 ? static_cast<uint32_t>(target[static_cast<std::size_t>(idx)]) : 0u;
    };

    uint32_t mantissa = (byte_at(i) << 16) | (byte_at(i - 1) << 8) | byte_at(i - 2);
    uint32_t exponent = static_cast<uint32_t>(i + 1);

    // Старший бит мантиссы - знак, сдвигаем
    if (mantissa & 0x00800000) {
        mantissa >>= 8;
        exponent++;
    }

    if (target.is_zero()) {
        return 0;
    }
    return (exponent << 24) | mantissa;
}

double bits_to_difficulty(uint32_t bits) noexcept {
    constexpr uint32_t DIFF1_BITS = 0x1d00ffff;

    double target = bits_to_target(bits).to_double();
    if (target == 0.0) {
        return 0.0;
    }
    return bits_to_target(DIFF1_BITS).to_double() / target;
}

uint256 block_work(uint32_t bits) noexcept {
    auto target = bits_to_target(bits);
    if (target.is_zero()) {
        return uint256::zero();
    }
    // 2^256 / (target + 1) = (2^256 - target - 1) / (target + 1) + 1
    return (~target / (target + uint256::one())) + uint256::one();
}

} // namespace qtc::core
