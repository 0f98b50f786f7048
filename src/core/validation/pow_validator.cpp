/**
 * @file pow_validator.cpp
 * @brief Реализация валидатора PoW
 */

#include "pow_validator.hpp"

#include <algorithm>

namespace qtc::core::validation {

PowValidator::PowValidator(const ChainParams& params)
    : params_(params) {}

bool PowValidator::validate_pow(const BlockHeader& header) const noexcept {
    if (!validate_bits(header.bits)) {
        return false;
    }
    return header.check_pow();
}

bool PowValidator::validate_bits(uint32_t bits) const noexcept {
    // Negative bit не должен быть установлен
    if (bits & 0x00800000) {
        return false;
    }

    auto target = bits_to_target(bits);
    if (target.is_zero()) {
        return false;
    }

    return target <= bits_to_target(params_.difficulty.pow_limit_bits);
}

bool PowValidator::is_retarget_height(uint32_t height) const noexcept {
    const uint32_t interval = params_.difficulty.adjustment_interval;
    return height > interval && (height - 1) % interval == 0;
}

uint32_t PowValidator::next_retarget_height(uint32_t height) const noexcept {
    const uint32_t interval = params_.difficulty.adjustment_interval;
    if (height <= interval) {
        return interval + 1;
    }
    return ((height - 1) / interval + 1) * interval + 1;
}

uint32_t PowValidator::calculate_next_target(
    uint32_t last_bits,
    int64_t actual_timespan
) const noexcept {
    const int64_t expected = get_expected_timespan();
    const int64_t factor = params_.difficulty.max_adjustment_factor;

    actual_timespan = std::clamp(actual_timespan, expected / factor, expected * factor);

    auto limit = bits_to_target(params_.difficulty.pow_limit_bits);
    auto adjusted = bits_to_target(last_bits).mul_div(
        static_cast<uint64_t>(actual_timespan),
        static_cast<uint64_t>(expected)
    );

    if (!adjusted || *adjusted > limit) {
        return target_to_bits(limit);
    }
    if (adjusted->is_zero()) {
        return target_to_bits(uint256::one());
    }
    return target_to_bits(*adjusted);
}

int64_t PowValidator::get_expected_timespan() const noexcept {
    return params_.difficulty.expected_timespan();
}

} // namespace qtc::core::validation
