/**
 * @file test_sha256.cpp
 * @brief Тесты SHA256 реализации
 *
 * Проверяет корректность SHA256 и SHA256d для известных тестовых векторов
 * и совпадение инкрементального и однократного хеширования.
 */

#include <gtest/gtest.h>
#include <array>
#include <string>
#include <span>

#include "crypto/sha256.hpp"
#include "core/types.hpp"

namespace qtc::tests {

namespace {

ByteSpan as_bytes(const std::string& text) {
    return ByteSpan{reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // namespace

/**
 * @brief Класс тестов для SHA256
 */
class SHA256Test : public ::testing::Test {
};

/**
 * @brief Тест: пустое сообщение
 *
 * SHA256("") = e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855
 */
TEST_F(SHA256Test, EmptyMessage) {
    auto hash = crypto::sha256(ByteSpan{});

    constexpr Hash256 expected = {{
        0xe3, 0xb0, 0xc4, 0x42, 0x98, 0xfc, 0x1c, 0x14,
        0x9a, 0xfb, 0xf4, 0xc8, 0x99, 0x6f, 0xb9, 0x24,
        0x27, 0xae, 0x41, 0xe4, 0x64, 0x9b, 0x93, 0x4c,
        0xa4, 0x95, 0x99, 0x1b, 0x78, 0x52, 0xb8, 0x55
    }};

    EXPECT_EQ(hash, expected);
}

/**
 * @brief Тест: "abc"
 *
 * SHA256("abc") = ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad
 */
TEST_F(SHA256Test, SimpleMessage) {
    auto hash = crypto::sha256(as_bytes("abc"));

    constexpr Hash256 expected = {{
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea,
        0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
        0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
        0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad
    }};

    EXPECT_EQ(hash, expected);
}

/**
 * @brief Тест: 448 бит (padding уходит во второй блок)
 */
TEST_F(SHA256Test, TwoBlockMessage) {
    auto hash = crypto::sha256(as_bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"));

    constexpr Hash256 expected = {{
        0x24, 0x8d, 0x6a, 0x61, 0xd2, 0x06, 0x38, 0xb8,
        0xe5, 0xc0, 0x26, 0x93, 0x0c, 0x3e, 0x60, 0x39,
        0xa3, 0x3c, 0xe4, 0x59, 0x64, 0xff, 0x21, 0x67,
        0xf6, 0xec, 0xed, 0xd4, 0x19, 0xdb, 0x06, 0xc1
    }};

    EXPECT_EQ(hash, expected);
}

/**
 * @brief Тест: SHA256d (хеш блоков, txid, lock)
 */
TEST_F(SHA256Test, DoubleSHA256) {
    auto hash = crypto::sha256d(as_bytes("hello"));

    // SHA256(SHA256("hello"))
    constexpr Hash256 expected = {{
        0x95, 0x95, 0xc9, 0xdf, 0x90, 0x07, 0x51, 0x48,
        0xeb, 0x06, 0x86, 0x03, 0x65, 0xdf, 0x33, 0x58,
        0x4b, 0x75, 0xbf, 0xf7, 0x82, 0xa5, 0x10, 0xc6,
        0xcd, 0x48, 0x83, 0xa4, 0x19, 0x83, 0x3d, 0x50
    }};

    EXPECT_EQ(hash, expected);
}

/**
 * @brief Тест: инкрементальное хеширование кусками разной длины
 */
TEST_F(SHA256Test, IncrementalMatchesOneShot) {
    std::array<uint8_t, 200> data{};
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i * 7);
    }

    crypto::Sha256 hasher;
    hasher.update(ByteSpan{data.data(), 1});
    hasher.update(ByteSpan{data.data() + 1, 63});
    hasher.update(ByteSpan{data.data() + 64, 100});
    hasher.update(ByteSpan{data.data() + 164, 36});

    EXPECT_EQ(hasher.finalize(), crypto::sha256(ByteSpan{data.data(), data.size()}));
}

/**
 * @brief Тест: reset() возвращает хешер в начальное состояние
 */
TEST_F(SHA256Test, ResetRestartsHash) {
    crypto::Sha256 hasher;
    hasher.update(as_bytes("garbage"));
    hasher.reset();
    hasher.update(as_bytes("abc"));

    EXPECT_EQ(hasher.finalize(), crypto::sha256(as_bytes("abc")));
}

} // namespace qtc::tests
