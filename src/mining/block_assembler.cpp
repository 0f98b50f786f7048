/**
 * @file block_assembler.cpp
 * @brief Реализация сборщика блоков
 */

#include "block_assembler.hpp"
#include "../core/chain/economics.hpp"

#include <algorithm>
#include <limits>

namespace qtc::mining {

namespace {

/// @brief Запас под varint количества транзакций
constexpr std::size_t TX_COUNT_RESERVE = 9;

} // namespace

BlockAssembler::BlockAssembler(const core::ChainParams& params, AssemblerOptions options)
    : params_(params)
    , options_(options) {}

std::size_t BlockAssembler::max_block_bytes() const noexcept {
    const auto consensus_max = params_.limits.max_block_size;
    if (options_.max_block_bytes == 0) {
        return consensus_max;
    }
    return std::min(options_.max_block_bytes, consensus_max);
}

BlockTemplate BlockAssembler::assemble(
    const chain::ChainState& state,
    const chain::Mempool& mempool,
    const Hash256& payout_lock,
    int64_t adjusted_now
) const {
    // Coinbase с максимальной суммой: размер не зависит от значения
    core::Transaction probe;
    probe.outputs.push_back(core::TxOut{params_.rewards.max_supply, payout_lock});
    probe.lock_time = state.height + 1;

    const std::size_t reserved = core::BLOCK_HEADER_SIZE + TX_COUNT_RESERVE + probe.serialized_size();
    const std::size_t budget = max_block_bytes() > reserved ? max_block_bytes() - reserved : 0;
    const std::size_t max_count = params_.limits.max_block_transactions > 0
        ? params_.limits.max_block_transactions - 1
        : 0;

    auto selected = mempool.select_for_block(budget, max_count);

    Amount fees = 0;
    for (const auto& tx : selected) {
        if (const auto* entry = mempool.get(tx.txid()); entry != nullptr) {
            fees += entry->fee;
        }
    }
    return assemble(state, std::move(selected), fees, payout_lock, adjusted_now);
}

BlockTemplate BlockAssembler::assemble(
    const chain::ChainState& state,
    std::vector<core::Transaction> transactions,
    Amount fees,
    const Hash256& payout_lock,
    int64_t adjusted_now
) const {
    BlockTemplate result;
    result.height = state.height + 1;
    result.subsidy = core::capped_subsidy(params_, result.height, state.total_minted);
    result.fees = fees;

    core::Transaction coinbase;
    coinbase.lock_time = result.height;
    const Amount reward = result.subsidy + result.fees;
    if (reward > 0) {
        coinbase.outputs.push_back(core::TxOut{reward, payout_lock});
    }

    auto& block = result.block;
    block.transactions.reserve(transactions.size() + 1);
    block.transactions.push_back(std::move(coinbase));
    for (auto& tx : transactions) {
        block.transactions.push_back(std::move(tx));
    }

    const int64_t min_time = static_cast<int64_t>(state.median_time_past) + 1;
    const int64_t timestamp = std::clamp<int64_t>(
        std::max(min_time, adjusted_now), 0, std::numeric_limits<uint32_t>::max());

    block.header.version = constants::BLOCK_VERSION;
    block.header.prev_hash = state.tip_hash;
    block.header.merkle_root = block.compute_merkle_root();
    block.header.timestamp = static_cast<uint32_t>(timestamp);
    block.header.bits = state.next_bits;
    block.header.nonce = 0;
    return result;
}

SearchResult BlockAssembler::search(
    core::Block& block,
    const std::atomic<bool>& cancel,
    uint64_t max_hashes
) {
    auto& header = block.header;
    const auto target = header.get_target();
    if (target.is_zero()) {
        return SearchResult::Exhausted;
    }

    for (uint64_t hashes = 0; max_hashes == 0 || hashes < max_hashes; ++hashes) {
        if (cancel.load(std::memory_order_relaxed)) {
            return SearchResult::Cancelled;
        }
        if (core::uint256{header.hash()} <= target) {
            return SearchResult::Found;
        }
        if (++header.nonce == 0) {
            ++header.timestamp;
        }
    }
    return SearchResult::Exhausted;
}

} // namespace qtc::mining
