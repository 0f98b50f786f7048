/**
 * @file address.cpp
 * @brief Реализация адресов QTC
 */

#include "address.hpp"
#include "../constants.hpp"
#include "../../crypto/sha256.hpp"

#include <algorithm>
#include <cstring>
#include <format>

namespace qtc::core {

namespace {

[[nodiscard]] std::array<uint8_t, constants::ADDRESS_CHECKSUM_SIZE> checksum(
    const Hash256& lock
) noexcept {
    auto digest = crypto::sha256d(lock);
    std::array<uint8_t, constants::ADDRESS_CHECKSUM_SIZE> result;
    std::memcpy(result.data(), digest.data(), result.size());
    return result;
}

} // namespace

Hash256 lock_from_public_key(ByteSpan public_key) noexcept {
    return crypto::sha256d(public_key);
}

std::string encode_address(const Hash256& lock) {
    auto sum = checksum(lock);
    return std::string(constants::ADDRESS_PREFIX) + to_hex(lock) + to_hex(sum);
}

Result<Hash256> decode_address(std::string_view address) {
    if (!address.starts_with(constants::ADDRESS_PREFIX)) {
        return Err<Hash256>(
            ErrorCode::AddressInvalidPrefix,
            std::format("Адрес должен начинаться с '{}'", constants::ADDRESS_PREFIX)
        );
    }

    if (address.size() != ADDRESS_LENGTH) {
        return Err<Hash256>(
            ErrorCode::AddressInvalidLength,
            std::format("Длина адреса {} вместо {}", address.size(), ADDRESS_LENGTH)
        );
    }

    auto payload = from_hex(address.substr(constants::ADDRESS_PREFIX.size()));
    if (!payload) {
        return std::unexpected(payload.error());
    }

    Hash256 lock;
    std::memcpy(lock.data(), payload->data(), lock.size());

    auto expected = checksum(lock);
    if (!std::equal(expected.begin(), expected.end(), payload->begin() + 32)) {
        return Err<Hash256>(ErrorCode::AddressBadChecksum);
    }

    return lock;
}

bool is_valid_address(std::string_view address) {
    return decode_address(address).has_value();
}

} // namespace qtc::core
