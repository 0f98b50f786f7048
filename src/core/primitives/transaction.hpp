/**
 * @file transaction.hpp
 * @brief Транзакция QTC
 *
 * Транзакция расходует ранее созданные выходы (UTXO) и создаёт новые.
 * Каждый вход несёт публичный ключ Dilithium2 и подпись; выход
 * запирается хешем публичного ключа (lock = SHA256d(public_key)).
 *
 * Каноническая кодировка:
 * - version:   4 байта (int32_t, little-endian)
 * - inputs:    VarInt count, затем для каждого:
 *              txid[32] + index[4] + VarBytes(public_key) + VarBytes(signature)
 * - outputs:   VarInt count, затем для каждого: amount[8] + lock[32]
 * - lock_time: 4 байта (uint32_t, little-endian)
 */

#pragma once

#include "../types.hpp"
#include "../constants.hpp"
#include "../serialization/stream.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace qtc::core {

/// @brief Предел размера публичного ключа при декодировании
inline constexpr std::size_t MAX_PUBLIC_KEY_SIZE = 4096;

/// @brief Предел размера подписи при декодировании
inline constexpr std::size_t MAX_SIGNATURE_SIZE = 8192;

/// @brief Предел количества входов/выходов при декодировании
inline constexpr std::size_t MAX_TX_ITEMS = 100'000;

/**
 * @brief Ссылка на выход транзакции
 */
struct OutPoint {
    /// @brief Идентификатор транзакции
    Hash256 txid{};

    /// @brief Индекс выхода
    uint32_t index{0};

    [[nodiscard]] bool operator==(const OutPoint&) const noexcept = default;
};

/**
 * @brief Вход транзакции
 */
struct TxIn {
    /// @brief Расходуемый выход
    OutPoint prevout;

    /// @brief Публичный ключ Dilithium2 владельца
    Bytes public_key;

    /// @brief Подпись Dilithium2 над signature_hash()
    Bytes signature;

    [[nodiscard]] bool operator==(const TxIn&) const noexcept = default;
};

/**
 * @brief Выход транзакции
 */
struct TxOut {
    /// @brief Сумма в минимальных единицах
    Amount amount{0};

    /// @brief Условие запирания: SHA256d(public_key) владельца
    Hash256 lock{};

    [[nodiscard]] bool operator==(const TxOut&) const noexcept = default;
};

/**
 * @brief Транзакция
 *
 * Coinbase не имеет входов; её lock_time равен высоте блока, что делает
 * txid coinbase уникальным в пределах цепочки.
 */
struct Transaction {
    int32_t version{constants::TX_VERSION};
    std::vector<TxIn> inputs;
    std::vector<TxOut> outputs;
    uint32_t lock_time{0};

    /**
     * @brief Является ли транзакция coinbase
     */
    [[nodiscard]] bool is_coinbase() const noexcept {
        return inputs.empty();
    }

    // =========================================================================
    // Сериализация
    // =========================================================================

    /**
     * @brief Записать каноническую кодировку в поток
     */
    void write(serialization::WriteStream& stream) const;

    /**
     * @brief Каноническая кодировка
     */
    [[nodiscard]] Bytes serialize() const;

    /**
     * @brief Прочитать транзакцию из потока
     *
     * @throws serialization::StreamError при некорректных данных
     */
    [[nodiscard]] static Transaction read(serialization::ReadStream& stream);

    /**
     * @brief Декодировать транзакцию из байт
     *
     * @return Result<Transaction> Транзакция или ошибка декодирования;
     *         лишние байты после транзакции считаются ошибкой
     */
    [[nodiscard]] static Result<Transaction> decode(ByteSpan data);

    /**
     * @brief Размер канонической кодировки в байтах
     */
    [[nodiscard]] std::size_t serialized_size() const;

    // =========================================================================
    // Хеши
    // =========================================================================

    /**
     * @brief Идентификатор транзакции: SHA256d(serialize())
     */
    [[nodiscard]] Hash256 txid() const;

    /**
     * @brief Хеш, который подписывает каждый вход
     *
     * SHA256d кодировки, в которой поля signature всех входов пусты.
     * Публичные ключи, расходуемые выходы и все выходы покрыты подписью.
     */
    [[nodiscard]] Hash256 signature_hash() const;

    /**
     * @brief Сумма выходов
     *
     * @return Сумма или nullopt при отрицательном выходе или переполнении
     */
    [[nodiscard]] std::optional<Amount> total_output() const noexcept;

    [[nodiscard]] bool operator==(const Transaction&) const noexcept = default;
};

} // namespace qtc::core

template<>
struct std::hash<qtc::core::OutPoint> {
    std::size_t operator()(const qtc::core::OutPoint& op) const noexcept {
        return std::hash<qtc::Hash256>{}(op.txid) ^
               (static_cast<std::size_t>(op.index) * 0x9E3779B97F4A7C15ULL);
    }
};
