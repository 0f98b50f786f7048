/**
 * @file utxo_set.cpp
 * @brief Реализация UTXO set
 */

#include "utxo_set.hpp"

#include <algorithm>

namespace qtc::chain {

// =============================================================================
// UtxoOverlay
// =============================================================================

std::optional<Coin> UtxoOverlay::lookup(const OutPoint& outpoint) const {
    if (spent_.contains(outpoint)) {
        return std::nullopt;
    }
    if (auto it = created_.find(outpoint); it != created_.end()) {
        return it->second;
    }
    return base_.lookup(outpoint);
}

bool UtxoOverlay::spend(const OutPoint& outpoint) {
    if (auto it = created_.find(outpoint); it != created_.end()) {
        created_.erase(it);
        // Выход мог заменить одноимённый выход базы
        if (base_.lookup(outpoint)) {
            spent_.insert(outpoint);
        }
        return true;
    }
    if (spent_.contains(outpoint) || !base_.lookup(outpoint)) {
        return false;
    }
    spent_.insert(outpoint);
    return true;
}

void UtxoOverlay::add(const OutPoint& outpoint, const Coin& coin) {
    spent_.erase(outpoint);
    created_.insert_or_assign(outpoint, coin);
}

bool UtxoOverlay::apply(const Transaction& tx, uint32_t height) {
    for (const auto& input : tx.inputs) {
        if (!lookup(input.prevout)) {
            return false;
        }
    }
    for (const auto& input : tx.inputs) {
        spend(input.prevout);
    }

    const auto txid = tx.txid();
    for (uint32_t i = 0; i < tx.outputs.size(); ++i) {
        add(OutPoint{txid, i}, Coin{tx.outputs[i], height, tx.is_coinbase()});
    }
    return true;
}

// =============================================================================
// UtxoSet
// =============================================================================

std::optional<Coin> UtxoSet::lookup(const OutPoint& outpoint) const {
    if (auto it = coins_.find(outpoint); it != coins_.end()) {
        return it->second;
    }
    return std::nullopt;
}

UtxoSet::DeltaResult UtxoSet::prepare(const core::Block& block, uint32_t height) const {
    UtxoDelta delta;

    // Выходы этого блока: позиция в delta.created, стёртые помечаются в removed
    std::unordered_map<OutPoint, std::size_t> created_index;
    std::vector<bool> removed;
    std::unordered_set<OutPoint> spent_existing;

    for (const auto& tx : block.transactions) {
        for (const auto& input : tx.inputs) {
            const auto& prevout = input.prevout;

            if (auto it = created_index.find(prevout); it != created_index.end()) {
                removed[it->second] = true;
                created_index.erase(it);
                continue;
            }

            auto coin = coins_.find(prevout);
            if (coin == coins_.end() || spent_existing.contains(prevout)) {
                return std::unexpected(ConsensusError::DoubleSpend);
            }
            spent_existing.insert(prevout);
            delta.spent.push_back(CoinEntry{prevout, coin->second});
        }

        const auto txid = tx.txid();
        for (uint32_t i = 0; i < tx.outputs.size(); ++i) {
            OutPoint outpoint{txid, i};
            const bool exists = (coins_.contains(outpoint) && !spent_existing.contains(outpoint)) ||
                                created_index.contains(outpoint);
            if (exists) {
                return std::unexpected(ConsensusError::DuplicateOutput);
            }
            created_index.emplace(outpoint, delta.created.size());
            removed.push_back(false);
            delta.created.push_back(CoinEntry{outpoint, Coin{tx.outputs[i], height, tx.is_coinbase()}});
        }
    }

    std::vector<CoinEntry> created;
    created.reserve(delta.created.size());
    for (std::size_t i = 0; i < delta.created.size(); ++i) {
        if (!removed[i]) {
            created.push_back(std::move(delta.created[i]));
        }
    }
    delta.created = std::move(created);
    return delta;
}

UtxoSet::DeltaResult UtxoSet::prepare_revert(
    const core::Block& block,
    uint32_t height,
    const BlockUndo& undo
) const {
    // Выходы блока, не потраченные внутри него же
    std::vector<OutPoint> order;
    std::unordered_set<OutPoint> net_created;
    std::size_t external_inputs = 0;

    for (const auto& tx : block.transactions) {
        for (const auto& input : tx.inputs) {
            if (net_created.erase(input.prevout) == 0) {
                ++external_inputs;
            }
        }
        const auto txid = tx.txid();
        for (uint32_t i = 0; i < tx.outputs.size(); ++i) {
            OutPoint outpoint{txid, i};
            net_created.insert(outpoint);
            order.push_back(outpoint);
        }
    }

    if (external_inputs != undo.spent.size()) {
        return std::unexpected(ConsensusError::UndoMismatch);
    }

    UtxoDelta delta;
    for (const auto& outpoint : order) {
        if (!net_created.contains(outpoint)) {
            continue;
        }
        auto it = coins_.find(outpoint);
        if (it == coins_.end() || it->second.height != height) {
            return std::unexpected(ConsensusError::UndoMismatch);
        }
        delta.spent.push_back(CoinEntry{outpoint, it->second});
    }

    for (const auto& entry : undo.spent) {
        if (coins_.contains(entry.outpoint) && !net_created.contains(entry.outpoint)) {
            return std::unexpected(ConsensusError::UndoMismatch);
        }
    }
    delta.created = undo.spent;
    return delta;
}

void UtxoSet::commit(const UtxoDelta& delta) {
    for (const auto& entry : delta.spent) {
        coins_.erase(entry.outpoint);
    }
    for (const auto& entry : delta.created) {
        coins_.insert_or_assign(entry.outpoint, entry.coin);
    }
}

UtxoSet::ApplyResult UtxoSet::apply(const core::Block& block, uint32_t height) {
    auto delta = prepare(block, height);
    if (!delta) {
        return std::unexpected(delta.error());
    }
    commit(*delta);
    return undo_from_delta(*delta);
}

std::expected<void, ConsensusError> UtxoSet::revert(
    const core::Block& block,
    uint32_t height,
    const BlockUndo& undo
) {
    auto delta = prepare_revert(block, height, undo);
    if (!delta) {
        return std::unexpected(delta.error());
    }
    commit(*delta);
    return {};
}

// =============================================================================
// Запросы
// =============================================================================

Amount UtxoSet::balance(const Hash256& lock) const {
    Amount total = 0;
    for (const auto& [outpoint, coin] : coins_) {
        if (coin.out.lock == lock) {
            total += coin.out.amount;
        }
    }
    return total;
}

std::vector<CoinEntry> UtxoSet::unspent_for(const Hash256& lock) const {
    std::vector<CoinEntry> result;
    for (const auto& [outpoint, coin] : coins_) {
        if (coin.out.lock == lock) {
            result.push_back(CoinEntry{outpoint, coin});
        }
    }
    std::sort(result.begin(), result.end(), [](const CoinEntry& a, const CoinEntry& b) {
        if (a.coin.height != b.coin.height) return a.coin.height < b.coin.height;
        if (a.outpoint.txid != b.outpoint.txid) return a.outpoint.txid < b.outpoint.txid;
        return a.outpoint.index < b.outpoint.index;
    });
    return result;
}

Amount UtxoSet::total_value() const {
    Amount total = 0;
    for (const auto& [outpoint, coin] : coins_) {
        total += coin.out.amount;
    }
    return total;
}

void UtxoSet::for_each(const std::function<void(const OutPoint&, const Coin&)>& visitor) const {
    for (const auto& [outpoint, coin] : coins_) {
        visitor(outpoint, coin);
    }
}

} // namespace qtc::chain
