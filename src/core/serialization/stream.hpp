/**
 * @file stream.hpp
 * @brief Потоки чтения/записи для канонической кодировки QTC
 *
 * Все числа кодируются в little-endian, длины и счётчики - VarInt.
 * Ошибки чтения выбрасывают StreamError; публичные decode-функции
 * (Transaction::decode, Block::decode) преобразуют их в Result.
 */

#pragma once

#include "../types.hpp"

#include <span>
#include <cstdint>
#include <vector>
#include <stdexcept>

namespace qtc::core::serialization {

/**
 * @brief Исключение при ошибке чтения
 */
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Поток для чтения бинарных данных
 */
class ReadStream {
public:
    explicit ReadStream(ByteSpan data) noexcept
        : data_(data), pos_(0) {}

    explicit ReadStream(const Bytes& data) noexcept
        : data_(data), pos_(0) {}

    // =========================================================================
    // Чтение примитивов
    // =========================================================================

    [[nodiscard]] uint8_t read_u8();
    [[nodiscard]] uint16_t read_u16_le();
    [[nodiscard]] uint32_t read_u32_le();
    [[nodiscard]] uint64_t read_u64_le();
    [[nodiscard]] int32_t read_i32_le();
    [[nodiscard]] int64_t read_i64_le();

    /**
     * @brief Прочитать VarInt
     *
     * Неминимальная кодировка отвергается: у каждого значения
     * ровно одно представление.
     */
    [[nodiscard]] uint64_t read_varint();

    /**
     * @brief Прочитать счётчик элементов с верхней границей
     *
     * @param max Максимально допустимое значение
     * @throws StreamError если счётчик превышает max
     */
    [[nodiscard]] std::size_t read_count(std::size_t max);

    /**
     * @brief Прочитать массив байт фиксированной длины
     */
    [[nodiscard]] Bytes read_bytes(std::size_t count);

    /**
     * @brief Прочитать массив байт с префиксом длины (VarInt)
     *
     * @param max_size Максимальная допустимая длина
     */
    [[nodiscard]] Bytes read_var_bytes(std::size_t max_size);

    /**
     * @brief Прочитать Hash256
     */
    [[nodiscard]] Hash256 read_hash256();

    // =========================================================================
    // Состояние
    // =========================================================================

    [[nodiscard]] std::size_t remaining() const noexcept;
    [[nodiscard]] std::size_t position() const noexcept;
    [[nodiscard]] bool eof() const noexcept;

private:
    const uint8_t* take(std::size_t count);

    ByteSpan data_;
    std::size_t pos_;
};

/**
 * @brief Поток для записи бинарных данных
 */
class WriteStream {
public:
    WriteStream() = default;

    /**
     * @brief Создать поток с предварительно выделенной памятью
     */
    explicit WriteStream(std::size_t reserve_size);

    // =========================================================================
    // Запись примитивов
    // =========================================================================

    void write_u8(uint8_t value);
    void write_u16_le(uint16_t value);
    void write_u32_le(uint32_t value);
    void write_u64_le(uint64_t value);
    void write_i32_le(int32_t value);
    void write_i64_le(int64_t value);
    void write_varint(uint64_t value);
    void write_bytes(ByteSpan data);

    /**
     * @brief Записать массив байт с префиксом длины (VarInt)
     */
    void write_var_bytes(ByteSpan data);

    void write_hash256(const Hash256& hash);

    // =========================================================================
    // Результат
    // =========================================================================

    [[nodiscard]] const Bytes& data() const noexcept;
    [[nodiscard]] Bytes take_data() noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    Bytes data_;
};

// =============================================================================
// VarInt утилиты
// =============================================================================

/**
 * @brief Размер VarInt для данного значения
 */
[[nodiscard]] inline std::size_t varint_size(uint64_t value) noexcept {
    if (value < 0xFD) return 1;
    if (value <= 0xFFFF) return 3;
    if (value <= 0xFFFFFFFF) return 5;
    return 9;
}

} // namespace qtc::core::serialization
