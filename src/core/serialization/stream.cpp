/**
 * @file stream.cpp
 * @brief Реализация потоков сериализации
 */

#include "stream.hpp"
#include "../byte_order.hpp"

#include <cstring>
#include <format>

namespace qtc::core::serialization {

// =============================================================================
// ReadStream
// =============================================================================

const uint8_t* ReadStream::take(std::size_t count) {
    if (count > data_.size() - pos_) {
        throw StreamError(std::format(
            "Неожиданный конец потока: нужно {} байт, осталось {}",
            count, data_.size() - pos_));
    }
    const uint8_t* ptr = data_.data() + pos_;
    pos_ += count;
    return ptr;
}

uint8_t ReadStream::read_u8() {
    return *take(1);
}

uint16_t ReadStream::read_u16_le() {
    const uint8_t* p = take(2);
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t ReadStream::read_u32_le() {
    return read_le32(take(4));
}

uint64_t ReadStream::read_u64_le() {
    return read_le64(take(8));
}

int32_t ReadStream::read_i32_le() {
    return static_cast<int32_t>(read_u32_le());
}

int64_t ReadStream::read_i64_le() {
    return static_cast<int64_t>(read_u64_le());
}

uint64_t ReadStream::read_varint() {
    uint8_t first = read_u8();
    uint64_t value = 0;
    uint64_t min_value = 0;

    switch (first) {
        case 0xFD:
            value = read_u16_le();
            min_value = 0xFD;
            break;
        case 0xFE:
            value = read_u32_le();
            min_value = 0x10000;
            break;
        case 0xFF:
            value = read_u64_le();
            min_value = 0x100000000ULL;
            break;
        default:
            return first;
    }

    if (value < min_value) {
        throw StreamError("Неминимальная кодировка VarInt");
    }
    return value;
}

std::size_t ReadStream::read_count(std::size_t max) {
    uint64_t count = read_varint();
    if (count > max) {
        throw StreamError(std::format("Счётчик {} превышает предел {}", count, max));
    }
    return static_cast<std::size_t>(count);
}

Bytes ReadStream::read_bytes(std::size_t count) {
    const uint8_t* ptr = take(count);
    return Bytes(ptr, ptr + count);
}

Bytes ReadStream::read_var_bytes(std::size_t max_size) {
    return read_bytes(read_count(max_size));
}

Hash256 ReadStream::read_hash256() {
    Hash256 result;
    std::memcpy(result.data(), take(32), 32);
    return result;
}

std::size_t ReadStream::remaining() const noexcept {
    return data_.size() - pos_;
}

std::size_t ReadStream::position() const noexcept {
    return pos_;
}

bool ReadStream::eof() const noexcept {
    return pos_ >= data_.size();
}

// =============================================================================
// WriteStream
// =============================================================================

WriteStream::WriteStream(std::size_t reserve_size) {
    data_.reserve(reserve_size);
}

void WriteStream::write_u8(uint8_t value) {
    data_.push_back(value);
}

void WriteStream::write_u16_le(uint16_t value) {
    data_.push_back(static_cast<uint8_t>(value));
    data_.push_back(static_cast<uint8_t>(value >> 8));
}

void WriteStream::write_u32_le(uint32_t value) {
    uint8_t buf[4];
    write_le32(buf, value);
    data_.insert(data_.end(), buf, buf + 4);
}

void WriteStream::write_u64_le(uint64_t value) {
    uint8_t buf[8];
    write_le64(buf, value);
    data_.insert(data_.end(), buf, buf + 8);
}

void WriteStream::write_i32_le(int32_t value) {
    write_u32_le(static_cast<uint32_t>(value));
}

void WriteStream::write_i64_le(int64_t value) {
    write_u64_le(static_cast<uint64_t>(value));
}

void WriteStream::write_varint(uint64_t value) {
    if (value < 0xFD) {
        write_u8(static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        write_u8(0xFD);
        write_u16_le(static_cast<uint16_t>(value));
    } else if (value <= 0xFFFFFFFF) {
        write_u8(0xFE);
        write_u32_le(static_cast<uint32_t>(value));
    } else {
        write_u8(0xFF);
        write_u64_le(value);
    }
}

void WriteStream::write_bytes(ByteSpan data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void WriteStream::write_var_bytes(ByteSpan data) {
    write_varint(data.size());
    write_bytes(data);
}

void WriteStream::write_hash256(const Hash256& hash) {
    data_.insert(data_.end(), hash.begin(), hash.end());
}

const Bytes& WriteStream::data() const noexcept {
    return data_;
}

Bytes WriteStream::take_data() noexcept {
    return std::move(data_);
}

std::size_t WriteStream::size() const noexcept {
    return data_.size();
}

} // namespace qtc::core::serialization
