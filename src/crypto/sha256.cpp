/**
 * @file sha256.cpp
 * @brief Программная реализация SHA256
 *
 * Алгоритм соответствует FIPS 180-4.
 */

#include "sha256.hpp"
#include "../core/byte_order.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace qtc::crypto {

namespace {

// Функции SHA256 (FIPS 180-4, секция 4.1.2)

[[nodiscard]] constexpr uint32_t ch(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr uint32_t maj(uint32_t x, uint32_t y, uint32_t z) noexcept {
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr uint32_t big_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr uint32_t big_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr uint32_t small_sigma0(uint32_t x) noexcept {
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3);
}

[[nodiscard]] constexpr uint32_t small_sigma1(uint32_t x) noexcept {
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10);
}

} // namespace

// =============================================================================
// SHA256 Transform
// =============================================================================

void sha256_transform(Sha256State& state, const uint8_t* block) noexcept {
    // Расписание сообщения
    std::array<uint32_t, 64> w;
    for (std::size_t i = 0; i < 16; ++i) {
        w[i] = read_be32(block + i * 4);
    }
    for (std::size_t i = 16; i < 64; ++i) {
        w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
    }

    uint32_t a = state[0], b = state[1], c = state[2], d = state[3];
    uint32_t e = state[4], f = state[5], g = state[6], h = state[7];

    for (std::size_t i = 0; i < 64; ++i) {
        uint32_t t1 = h + big_sigma1(e) + ch(e, f, g) + constants::SHA256_K[i] + w[i];
        uint32_t t2 = big_sigma0(a) + maj(a, b, c);
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    state[0] += a;
    state[1] += b;
    state[2] += c;
    state[3] += d;
    state[4] += e;
    state[5] += f;
    state[6] += g;
    state[7] += h;
}

// =============================================================================
// Sha256 (инкрементальный)
// =============================================================================

Sha256::Sha256() noexcept {
    reset();
}

void Sha256::reset() noexcept {
    state_ = constants::SHA256_INIT;
    buffered_ = 0;
    total_len_ = 0;
}

Sha256& Sha256::update(ByteSpan data) noexcept {
    const uint8_t* ptr = data.data();
    std::size_t len = data.size();
    total_len_ += len;

    // Дополняем буфер до полного блока
    if (buffered_ > 0) {
        std::size_t take = std::min(len, buffer_.size() - buffered_);
        std::memcpy(buffer_.data() + buffered_, ptr, take);
        buffered_ += take;
        ptr += take;
        len -= take;
        if (buffered_ < buffer_.size()) {
            return *this;
        }
        sha256_transform(state_, buffer_.data());
        buffered_ = 0;
    }

    // Полные блоки напрямую из входа
    while (len >= constants::SHA256_BLOCK_SIZE) {
        sha256_transform(state_, ptr);
        ptr += constants::SHA256_BLOCK_SIZE;
        len -= constants::SHA256_BLOCK_SIZE;
    }

    if (len > 0) {
        std::memcpy(buffer_.data(), ptr, len);
        buffered_ = len;
    }
    return *this;
}

Hash256 Sha256::finalize() noexcept {
    const uint64_t bit_len = total_len_ * 8;

    // 0x80, нули, затем длина в битах (big-endian) в последних 8 байтах
    std::array<uint8_t, 72> padding{};
    padding[0] = 0x80;
    std::size_t pad_len = (buffered_ < 56) ? (56 - buffered_) : (120 - buffered_);
    write_be32(padding.data() + pad_len, static_cast<uint32_t>(bit_len >> 32));
    write_be32(padding.data() + pad_len + 4, static_cast<uint32_t>(bit_len));

    update(ByteSpan(padding.data(), pad_len + 8));

    Hash256 result;
    for (std::size_t i = 0; i < 8; ++i) {
        write_be32(result.data() + i * 4, state_[i]);
    }

    reset();
    return result;
}

// =============================================================================
// Полные SHA256 функции
// =============================================================================

Hash256 sha256(ByteSpan data) noexcept {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Hash256 sha256d(ByteSpan data) noexcept {
    Hash256 first = sha256(data);
    return sha256(ByteSpan(first.data(), first.size()));
}

} // namespace qtc::crypto
