/**
 * @file network_time.cpp
 * @brief Реализация скорректированного времени
 */

#include "network_time.hpp"

#include <algorithm>
#include <chrono>

namespace qtc::core {

namespace {

constexpr std::size_t MIN_SAMPLES = 5;

int64_t system_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace

NetworkTime::NetworkTime(Clock clock)
    : clock_(clock ? std::move(clock) : Clock{system_now}) {}

void NetworkTime::add_sample(int64_t offset_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.size() >= MAX_SAMPLES) {
        samples_.erase(samples_.begin());
    }
    samples_.push_back(offset_seconds);
}

int64_t NetworkTime::offset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.size() < MIN_SAMPLES) {
        return 0;
    }

    std::vector<int64_t> sorted = samples_;
    std::sort(sorted.begin(), sorted.end());
    int64_t median = sorted[sorted.size() / 2];

    if (median > MAX_OFFSET || median < -MAX_OFFSET) {
        return 0;
    }
    return median;
}

int64_t NetworkTime::local_now() const {
    return clock_();
}

int64_t NetworkTime::now() const {
    return local_now() + offset();
}

} // namespace qtc::core
