/**
 * @file types.hpp
 * @brief Базовые типы для QTC node
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (block hash, txid, lock)
 * - Amount: сумма в минимальных единицах (без плавающей точки)
 * - Bytes: динамический массив байт
 * - Result<T>: обёртка std::expected для обработки ошибок
 */

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <system_error>

namespace qtc {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - Block hash
 * - Transaction ID (txid)
 * - Merkle root
 * - Lock (хеш публичного ключа владельца выхода)
 *
 * Хранится в little-endian формате.
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Сумма в минимальных единицах (1 QTC = 100 000 000 единиц)
 */
using Amount = int64_t;

/**
 * @brief Динамический массив байт
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/**
 * @brief Изменяемое представление на массив байт
 */
using MutableByteSpan = std::span<uint8_t>;

// =============================================================================
// Коды ошибок QTC
// =============================================================================

/**
 * @brief Перечисление системных кодов ошибок
 *
 * Отказы консенсуса и валидации описываются отдельными перечислениями
 * (chain/errors.hpp). Здесь только ошибки окружения: конфигурация,
 * хранилище, криптография, запросы.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки хранилища (200-299)
    StorageOpenFailed = 200,
    StorageWriteFailed = 201,
    StorageReadFailed = 202,
    StorageCorrupted = 203,
    StorageHalted = 204,

    // Ошибки кодирования (300-399)
    DecodeTruncated = 300,
    DecodeMalformed = 301,
    DecodeTrailingData = 302,

    // Ошибки запросов (400-499)
    QueryTimeout = 400,
    QueryNotFound = 401,

    // Ошибки адресов (600-699)
    AddressInvalidPrefix = 600,
    AddressInvalidLength = 601,
    AddressBadChecksum = 602,

    // Криптографические ошибки (700-799)
    CryptoKeygenFailed = 700,
    CryptoSignFailed = 701,
    CryptoInvalidLength = 702,

    // Системные ошибки (800-899)
    ChainNotInitialized = 800,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::StorageOpenFailed: return "Не удалось открыть хранилище";
        case ErrorCode::StorageWriteFailed: return "Ошибка записи в хранилище";
        case ErrorCode::StorageReadFailed: return "Ошибка чтения из хранилища";
        case ErrorCode::StorageCorrupted: return "Хранилище повреждено";
        case ErrorCode::StorageHalted: return "Узел остановлен после ошибки хранилища";
        case ErrorCode::DecodeTruncated: return "Данные обрезаны";
        case ErrorCode::DecodeMalformed: return "Некорректная кодировка";
        case ErrorCode::DecodeTrailingData: return "Лишние данные после объекта";
        case ErrorCode::QueryTimeout: return "Таймаут запроса";
        case ErrorCode::QueryNotFound: return "Объект не найден";
        case ErrorCode::AddressInvalidPrefix: return "Некорректный префикс адреса";
        case ErrorCode::AddressInvalidLength: return "Некорректная длина адреса";
        case ErrorCode::AddressBadChecksum: return "Неверная контрольная сумма адреса";
        case ErrorCode::CryptoKeygenFailed: return "Ошибка генерации ключа";
        case ErrorCode::CryptoSignFailed: return "Ошибка подписи";
        case ErrorCode::CryptoInvalidLength: return "Некорректная длина данных";
        case ErrorCode::ChainNotInitialized: return "Цепочка не инициализирована";
        default: return "Неизвестная ошибка";
    }
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    explicit Error(ErrorCode c)
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Hex утилиты
// =============================================================================

/**
 * @brief Преобразовать байты в hex строку (в порядке хранения)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Преобразовать хеш в hex строку для отображения (старший байт первым)
 */
[[nodiscard]] std::string hash_to_hex(const Hash256& hash);

/**
 * @brief Разобрать hex строку в байты
 *
 * @return Result<Bytes> Байты или ошибка при нечётной длине/недопустимом символе
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

/**
 * @brief Сумма в QTC с 8 знаками после точки ("12.50000000")
 */
[[nodiscard]] std::string format_amount(Amount amount);

} // namespace qtc

// =============================================================================
// Хеш-функция для Hash256 (для unordered_map)
// =============================================================================

template<>
struct std::hash<qtc::Hash256> {
    std::size_t operator()(const qtc::Hash256& h) const noexcept {
        // Хеш уже равномерно распределён, используем первые 8 байт
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};
