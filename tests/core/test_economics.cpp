/**
 * @file test_economics.cpp
 * @brief Тесты графика эмиссии
 */

#include <gtest/gtest.h>

#include "core/chain/economics.hpp"

#include <limits>

namespace qtc::core::test {

namespace {

const ChainParams& mainnet() {
    return ChainParams::mainnet();
}

constexpr uint32_t HALVING = 105'120;

} // namespace

// =============================================================================
// Награда за блок
// =============================================================================

TEST(EconomicsTest, SubsidyHalvesEachEra) {
    const Amount initial = mainnet().rewards.initial_subsidy;

    EXPECT_EQ(block_subsidy(mainnet(), 1), initial);
    EXPECT_EQ(block_subsidy(mainnet(), HALVING - 1), initial);
    EXPECT_EQ(block_subsidy(mainnet(), HALVING), initial >> 1);
    EXPECT_EQ(block_subsidy(mainnet(), 2 * HALVING), initial >> 2);
    EXPECT_EQ(block_subsidy(mainnet(), 10 * HALVING + 7), initial >> 10);
}

TEST(EconomicsTest, SubsidyEventuallyZero) {
    EXPECT_EQ(block_subsidy(mainnet(), 40 * HALVING), 0);
    EXPECT_EQ(block_subsidy(mainnet(), 63 * HALVING), 0);
    EXPECT_EQ(block_subsidy(mainnet(), std::numeric_limits<uint32_t>::max()), 0);
}

TEST(EconomicsTest, SubsidyNeverIncreases) {
    Amount previous = block_subsidy(mainnet(), 1);
    for (uint32_t era = 1; era < 40; ++era) {
        const Amount current = block_subsidy(mainnet(), era * HALVING);
        EXPECT_LE(current, previous) << "эра " << era;
        previous = current;
    }
}

TEST(EconomicsTest, CappedSubsidy) {
    const Amount initial = mainnet().rewards.initial_subsidy;
    const Amount max_supply = mainnet().rewards.max_supply;

    EXPECT_EQ(capped_subsidy(mainnet(), 1, 0), initial);
    EXPECT_EQ(capped_subsidy(mainnet(), 1, max_supply - 100), 100);
    EXPECT_EQ(capped_subsidy(mainnet(), 1, max_supply), 0);
    EXPECT_EQ(capped_subsidy(mainnet(), 1, max_supply + 1), 0);
}

// =============================================================================
// Суммарная эмиссия
// =============================================================================

TEST(EconomicsTest, ScheduledSupply) {
    const Amount initial = mainnet().rewards.initial_subsidy;

    // Genesis ничего не выпускает
    EXPECT_EQ(scheduled_supply(mainnet(), 0), 0);
    EXPECT_EQ(scheduled_supply(mainnet(), 1), initial);
    EXPECT_EQ(scheduled_supply(mainnet(), 1000), 1000 * initial);
    EXPECT_EQ(scheduled_supply(mainnet(), HALVING - 1), (HALVING - 1) * initial);
    EXPECT_EQ(scheduled_supply(mainnet(), HALVING), (HALVING - 1) * initial + (initial >> 1));
}

TEST(EconomicsTest, ScheduledSupplyBelowMaxSupply) {
    const Amount max_supply = mainnet().rewards.max_supply;
    const Amount total = scheduled_supply(mainnet(), std::numeric_limits<uint32_t>::max());

    EXPECT_LE(total, max_supply);
    // Недовыпуск складывается из пропущенной награды genesis и округления сдвигов
    EXPECT_GT(total, max_supply - 2 * mainnet().rewards.initial_subsidy);
}

TEST(EconomicsTest, NextHalvingHeight) {
    EXPECT_EQ(next_halving_height(mainnet(), 0), HALVING);
    EXPECT_EQ(next_halving_height(mainnet(), 1), HALVING);
    EXPECT_EQ(next_halving_height(mainnet(), HALVING - 1), HALVING);
    EXPECT_EQ(next_halving_height(mainnet(), HALVING), 2 * HALVING);
    EXPECT_EQ(next_halving_height(mainnet(), 63 * HALVING), std::nullopt);
}

TEST(EconomicsTest, IssuanceAtGenesis) {
    auto info = issuance_at(mainnet(), 0);

    EXPECT_EQ(info.height, 0u);
    EXPECT_EQ(info.era, 0u);
    EXPECT_EQ(info.subsidy, 0);
    EXPECT_EQ(info.emitted, 0);
    EXPECT_EQ(info.remaining, mainnet().rewards.max_supply);
    EXPECT_EQ(info.next_halving_height, HALVING);
}

TEST(EconomicsTest, IssuanceAfterHalving) {
    const Amount initial = mainnet().rewards.initial_subsidy;
    auto info = issuance_at(mainnet(), HALVING);

    EXPECT_EQ(info.era, 1u);
    EXPECT_EQ(info.subsidy, initial >> 1);
    EXPECT_EQ(info.emitted, scheduled_supply(mainnet(), HALVING));
    EXPECT_EQ(info.emitted + info.remaining, mainnet().rewards.max_supply);
    EXPECT_EQ(info.next_halving_height, 2 * HALVING);
}

TEST(EconomicsTest, RegtestSharesSchedule) {
    const auto& regtest = ChainParams::regtest();
    EXPECT_EQ(block_subsidy(regtest, 5), block_subsidy(mainnet(), 5));
    EXPECT_EQ(scheduled_supply(regtest, 5), 5 * regtest.rewards.initial_subsidy);
}

} // namespace qtc::core::test
