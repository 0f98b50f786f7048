/**
 * @file economics.cpp
 * @brief Реализация графика эмиссии
 */

#include "economics.hpp"

#include <algorithm>

namespace qtc::core {

namespace {

/// @brief После 63 сдвигов любое int64 значение равно нулю
constexpr uint32_t MAX_ERA = 63;

} // namespace

Amount block_subsidy(const ChainParams& params, uint32_t height) noexcept {
    const uint32_t era = height / params.rewards.halving_interval;
    if (era >= MAX_ERA) {
        return 0;
    }
    return params.rewards.initial_subsidy >> era;
}

Amount capped_subsidy(
    const ChainParams& params,
    uint32_t height,
    Amount minted_before
) noexcept {
    const Amount remaining = std::max<Amount>(0, params.rewards.max_supply - minted_before);
    return std::min(block_subsidy(params, height), remaining);
}

Amount scheduled_supply(const ChainParams& params, uint32_t height) noexcept {
    const uint64_t interval = params.rewards.halving_interval;
    Amount total = 0;

    for (uint32_t era = 0; era < MAX_ERA; ++era) {
        const uint64_t first = std::max<uint64_t>(era * interval, 1);
        const uint64_t last = std::min<uint64_t>((era + 1) * interval - 1, height);
        if (first > height) {
            break;
        }
        if (last >= first) {
            total += static_cast<Amount>(last - first + 1) * (params.rewards.initial_subsidy >> era);
        }
    }

    return std::min(total, params.rewards.max_supply);
}

std::optional<uint32_t> next_halving_height(
    const ChainParams& params,
    uint32_t height
) noexcept {
    if (block_subsidy(params, height) == 0) {
        return std::nullopt;
    }
    const uint64_t next = (static_cast<uint64_t>(height) / params.rewards.halving_interval + 1) *
                          params.rewards.halving_interval;
    if (next > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(next);
}

IssuanceInfo issuance_at(const ChainParams& params, uint32_t height) noexcept {
    IssuanceInfo info;
    info.height = height;
    info.era = height / params.rewards.halving_interval;
    info.subsidy = height == 0 ? 0 : block_subsidy(params, height);
    info.emitted = scheduled_supply(params, height);
    info.remaining = params.rewards.max_supply - info.emitted;
    info.next_halving_height = next_halving_height(params, height);
    return info;
}

} // namespace qtc::core
