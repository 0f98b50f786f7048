/**
 * @file dilithium.hpp
 * @brief Подписи Dilithium2 (liboqs)
 *
 * Пост-квантовая схема подписи, которой авторизуются входы транзакций.
 * Подписывается 32-байтный Transaction::signature_hash().
 */

#pragma once

#include "../core/types.hpp"

#include <cstddef>

namespace qtc::crypto {

/// @brief Размер публичного ключа Dilithium2
inline constexpr std::size_t DILITHIUM2_PUBLIC_KEY_SIZE = 1312;

/// @brief Размер секретного ключа Dilithium2
inline constexpr std::size_t DILITHIUM2_SECRET_KEY_SIZE = 2528;

/// @brief Максимальный размер подписи Dilithium2
inline constexpr std::size_t DILITHIUM2_SIGNATURE_SIZE = 2420;

/**
 * @brief Секретный ключ, который затирается при уничтожении
 */
class SecretKey {
public:
    SecretKey() = default;
    explicit SecretKey(Bytes bytes) noexcept : bytes_(std::move(bytes)) {}
    ~SecretKey();

    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;
    SecretKey(SecretKey&& other) noexcept;
    SecretKey& operator=(SecretKey&& other) noexcept;

    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

private:
    void wipe() noexcept;

    Bytes bytes_;
};

/**
 * @brief Пара ключей Dilithium2
 */
struct KeyPair {
    Bytes public_key;
    SecretKey secret_key;
};

/**
 * @brief Сгенерировать пару ключей
 */
[[nodiscard]] Result<KeyPair> generate_keypair();

/**
 * @brief Подписать сообщение
 *
 * @param secret_key Секретный ключ
 * @param message Сообщение (обычно хеш подписи транзакции)
 * @return Result<Bytes> Подпись или ошибка
 */
[[nodiscard]] Result<Bytes> sign(const SecretKey& secret_key, ByteSpan message);

/**
 * @brief Проверить подпись
 *
 * Ключ и подпись неверной длины отвергаются без обращения к liboqs.
 *
 * @return true если подпись верна
 */
[[nodiscard]] bool verify(ByteSpan public_key, ByteSpan message, ByteSpan signature) noexcept;

/**
 * @brief Имя алгоритма подписи в liboqs
 */
[[nodiscard]] std::string_view algorithm_name() noexcept;

} // namespace qtc::crypto
