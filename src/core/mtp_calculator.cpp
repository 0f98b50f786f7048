/**
 * @file mtp_calculator.cpp
 * @brief Реализация вычисления Median Time Past
 */

#include "mtp_calculator.hpp"

#include <algorithm>

namespace qtc::core {

MtpCalculator::MtpCalculator(std::size_t window)
    : window_(window == 0 ? 1 : window) {
    timestamps_.reserve(window_);
}

void MtpCalculator::push_timestamp(uint32_t timestamp) {
    if (timestamps_.size() < window_) {
        timestamps_.push_back(timestamp);
    } else {
        timestamps_[head_] = timestamp;
    }
    head_ = (head_ + 1) % window_;
}

void MtpCalculator::push_header(const BlockHeader& header) {
    push_timestamp(header.timestamp);
}

uint32_t MtpCalculator::get_mtp() const {
    if (timestamps_.empty()) {
        return 0;
    }

    std::vector<uint32_t> sorted = timestamps_;
    std::sort(sorted.begin(), sorted.end());
    return sorted[sorted.size() / 2];
}

uint32_t MtpCalculator::get_min_timestamp() const {
    return get_mtp() + 1;
}

bool MtpCalculator::has_sufficient_data() const noexcept {
    return timestamps_.size() >= window_;
}

std::size_t MtpCalculator::count() const noexcept {
    return timestamps_.size();
}

} // namespace qtc::core
