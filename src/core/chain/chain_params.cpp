/**
 * @file chain_params.cpp
 * @brief Параметры mainnet и regtest
 */

#include "chain_params.hpp"
#include "../primitives/block.hpp"
#include "../primitives/block_header.hpp"

#include <format>

namespace qtc::core {

namespace {

ChainParams build_mainnet() {
    ChainParams params;
    params.name = "mainnet";
    params.network = Network::Mainnet;

    params.difficulty.target_spacing = 600;
    params.difficulty.adjustment_interval = 2016;
    params.difficulty.pow_limit_bits = 0x1d00ffff;
    params.difficulty.max_adjustment_factor = 4;

    params.rewards.max_supply = 22'000'000 * constants::COIN;
    params.rewards.halving_interval = 105'120;
    params.rewards.initial_subsidy = initial_subsidy_for(
        params.rewards.max_supply, params.rewards.halving_interval);
    params.rewards.premine = 0;
    params.rewards.coinbase_maturity = 100;

    params.genesis.timestamp = 1'735'689'600;  // 2025-01-01 00:00:00 UTC
    params.genesis.nonce = 0;
    return params;
}

ChainParams build_regtest() {
    ChainParams params = build_mainnet();
    params.name = "regtest";
    params.network = Network::Regtest;

    // Хеш ниже 0x7fffff << 232 находится примерно за 2 попытки
    params.difficulty.pow_limit_bits = 0x207fffff;
    params.difficulty.adjustment_interval = 10;
    params.rewards.coinbase_maturity = 0;

    params.genesis.timestamp = 1'700'000'000;
    return params;
}

} // namespace

const ChainParams& ChainParams::mainnet() {
    static const ChainParams params = build_mainnet();
    return params;
}

const ChainParams& ChainParams::regtest() {
    static const ChainParams params = build_regtest();
    return params;
}

Result<ChainParams> ChainParams::for_network(std::string_view name) {
    if (name == "mainnet") {
        return mainnet();
    }
    if (name == "regtest") {
        return regtest();
    }
    return Err<ChainParams>(
        ErrorCode::ConfigInvalidValue,
        std::format("Неизвестная сеть '{}'", name)
    );
}

Result<void> ChainParams::validate() const {
    if (rewards.premine != 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Premine должен быть нулевым");
    }
    if (rewards.halving_interval == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "halving_interval не может быть 0");
    }
    if (rewards.max_supply <= 0 || rewards.initial_subsidy <= 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Эмиссия должна быть положительной");
    }
    // Сумма ряда initial × interval × (1 + 1/2 + ...) < 2 × initial × interval
    if (rewards.initial_subsidy > initial_subsidy_for(rewards.max_supply, rewards.halving_interval)) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            std::format("Награда {} даёт эмиссию больше лимита {}",
                        rewards.initial_subsidy, rewards.max_supply)
        );
    }
    if (difficulty.target_spacing == 0 || difficulty.adjustment_interval == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Интервалы сложности не могут быть 0");
    }
    if (difficulty.max_adjustment_factor < 1) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "max_adjustment_factor должен быть >= 1");
    }
    if (bits_to_target(difficulty.pow_limit_bits).is_zero()) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Некорректный pow_limit_bits");
    }
    if (difficulty.mtp_window == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "mtp_window не может быть 0");
    }
    return {};
}

Block make_genesis_block(const ChainParams& params) {
    Transaction coinbase;
    coinbase.version = constants::TX_VERSION;
    coinbase.lock_time = 0;

    Block genesis;
    genesis.transactions.push_back(std::move(coinbase));
    genesis.header.version = constants::BLOCK_VERSION;
    genesis.header.prev_hash = Hash256{};
    genesis.header.merkle_root = genesis.compute_merkle_root();
    genesis.header.timestamp = params.genesis.timestamp;
    genesis.header.bits = params.difficulty.pow_limit_bits;
    genesis.header.nonce = params.genesis.nonce;
    return genesis;
}

} // namespace qtc::core
