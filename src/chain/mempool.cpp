/**
 * @file mempool.cpp
 * @brief Реализация пула транзакций
 */

#include "mempool.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace qtc::chain {

// =============================================================================
// Представление пула
// =============================================================================

class Mempool::View final : public UtxoView {
public:
    View(const Mempool& pool, const UtxoView& confirmed, uint32_t next_height)
        : pool_(pool), confirmed_(confirmed), next_height_(next_height) {}

    [[nodiscard]] std::optional<Coin> lookup(const OutPoint& outpoint) const override {
        if (pool_.spenders_.contains(outpoint)) {
            return std::nullopt;
        }
        if (auto it = pool_.entries_.find(outpoint.txid); it != pool_.entries_.end()) {
            const auto& outputs = it->second.tx.outputs;
            if (outpoint.index >= outputs.size()) {
                return std::nullopt;
            }
            return Coin{outputs[outpoint.index], next_height_, false};
        }
        return confirmed_.lookup(outpoint);
    }

private:
    const Mempool& pool_;
    const UtxoView& confirmed_;
    uint32_t next_height_;
};

// =============================================================================
// Mempool
// =============================================================================

Mempool::Mempool(const core::ChainParams& params, MempoolPolicy policy)
    : params_(params)
    , policy_(policy)
    , validator_(params) {}

Mempool::AdmitResult Mempool::admit(
    const Transaction& tx,
    const UtxoView& confirmed,
    uint32_t next_height,
    int64_t now,
    bool signatures_verified
) {
    return admit_entry(tx, confirmed, next_height, now, signatures_verified);
}

Mempool::AdmitResult Mempool::admit_entry(
    const Transaction& tx,
    const UtxoView& confirmed,
    uint32_t next_height,
    int64_t entry_time,
    bool signatures_verified
) {
    const auto txid = tx.txid();
    if (entries_.contains(txid)) {
        return std::unexpected(MempoolReject::make(MempoolRejectCode::AlreadyPresent));
    }

    if (auto structure = validator_.check_structure(tx); !structure) {
        return std::unexpected(MempoolReject::invalid(structure.error()));
    }

    for (const auto& input : tx.inputs) {
        if (spenders_.contains(input.prevout)) {
            return std::unexpected(MempoolReject::make(MempoolRejectCode::Conflict));
        }
    }

    View view(*this, confirmed, next_height);
    auto fee = signatures_verified
        ? validator_.check_inputs(tx, view, next_height)
        : validator_.validate(tx, view, next_height);
    if (!fee) {
        return std::unexpected(MempoolReject::invalid(fee.error()));
    }

    for (const auto& out : tx.outputs) {
        if (out.amount < params_.dust_threshold) {
            return std::unexpected(MempoolReject::make(MempoolRejectCode::Dust));
        }
    }

    const std::size_t size = tx.serialized_size();
    const Amount fee_rate = *fee * static_cast<Amount>(constants::FEE_RATE_UNIT_BYTES) /
                            static_cast<Amount>(size);
    if (fee_rate < policy_.min_fee_rate) {
        return std::unexpected(MempoolReject::make(MempoolRejectCode::InsufficientFee));
    }

    const bool full = entries_.size() + 1 > policy_.max_transactions ||
                      total_bytes_ + size > policy_.max_bytes;
    if (full) {
        auto victims = plan_eviction(tx, size, fee_rate);
        if (!victims) {
            return std::unexpected(MempoolReject::make(MempoolRejectCode::MempoolFull));
        }
        for (const auto& victim : *victims) {
            remove_entry(victim);
        }
    }

    MempoolEntry entry;
    entry.tx = tx;
    entry.txid = txid;
    entry.fee = *fee;
    entry.size = size;
    entry.fee_rate = fee_rate;
    entry.entry_time = entry_time;
    entry.sequence = next_sequence_++;

    for (const auto& input : tx.inputs) {
        spenders_.emplace(input.prevout, txid);
    }
    by_fee_.insert(FeeKey{entry.fee_rate, entry.sequence, txid});
    total_bytes_ += size;
    entries_.emplace(txid, std::move(entry));
    return txid;
}

std::optional<std::vector<Hash256>> Mempool::plan_eviction(
    const Transaction& tx,
    std::size_t size,
    Amount fee_rate
) const {
    if (size > policy_.max_bytes || policy_.max_transactions == 0) {
        return std::nullopt;
    }

    // Предки новой транзакции в пуле не могут быть вытеснены
    std::unordered_set<Hash256> ancestors;
    std::vector<Hash256> stack;
    for (const auto& input : tx.inputs) {
        stack.push_back(input.prevout.txid);
    }
    while (!stack.empty()) {
        auto txid = stack.back();
        stack.pop_back();
        auto it = entries_.find(txid);
        if (it == entries_.end() || !ancestors.insert(txid).second) {
            continue;
        }
        for (const auto& input : it->second.tx.inputs) {
            stack.push_back(input.prevout.txid);
        }
    }

    std::size_t count = entries_.size();
    std::size_t bytes = total_bytes_;
    std::unordered_set<Hash256> chosen;
    std::vector<Hash256> victims;

    for (const auto& key : by_fee_) {
        if (count + 1 <= policy_.max_transactions && bytes + size <= policy_.max_bytes) {
            break;
        }
        if (key.fee_rate >= fee_rate) {
            return std::nullopt;
        }
        if (chosen.contains(key.txid)) {
            continue;
        }

        std::vector<Hash256> group;
        collect_descendants(key.txid, group);
        const bool touches_ancestor = std::any_of(group.begin(), group.end(),
            [&](const Hash256& id) { return ancestors.contains(id); });
        if (touches_ancestor) {
            continue;
        }

        for (const auto& id : group) {
            if (chosen.insert(id).second) {
                victims.push_back(id);
                --count;
                bytes -= entries_.at(id).size;
            }
        }
    }

    if (count + 1 > policy_.max_transactions || bytes + size > policy_.max_bytes) {
        return std::nullopt;
    }
    return victims;
}

void Mempool::collect_descendants(const Hash256& txid, std::vector<Hash256>& out) const {
    std::unordered_set<Hash256> visited;
    std::vector<Hash256> stack{txid};
    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        auto it = entries_.find(current);
        if (it == entries_.end() || !visited.insert(current).second) {
            continue;
        }
        out.push_back(current);
        for (uint32_t i = 0; i < it->second.tx.outputs.size(); ++i) {
            if (auto child = spenders_.find(OutPoint{current, i}); child != spenders_.end()) {
                stack.push_back(child->second);
            }
        }
    }
}

void Mempool::remove_entry(const Hash256& txid) {
    auto it = entries_.find(txid);
    if (it == entries_.end()) {
        return;
    }
    const auto& entry = it->second;
    for (const auto& input : entry.tx.inputs) {
        auto spender = spenders_.find(input.prevout);
        if (spender != spenders_.end() && spender->second == txid) {
            spenders_.erase(spender);
        }
    }
    by_fee_.erase(FeeKey{entry.fee_rate, entry.sequence, txid});
    total_bytes_ -= entry.size;
    entries_.erase(it);
}

std::size_t Mempool::evict(const Hash256& txid) {
    std::vector<Hash256> group;
    collect_descendants(txid, group);
    for (const auto& id : group) {
        remove_entry(id);
    }
    return group.size();
}

void Mempool::remove_for_block(const core::Block& block) {
    for (const auto& tx : block.transactions) {
        remove_entry(tx.txid());
    }
    for (const auto& tx : block.transactions) {
        for (const auto& input : tx.inputs) {
            if (auto spender = spenders_.find(input.prevout); spender != spenders_.end()) {
                evict(spender->second);
            }
        }
    }
}

std::size_t Mempool::expire(int64_t now) {
    std::vector<Hash256> expired;
    for (const auto& [txid, entry] : entries_) {
        if (now - entry.entry_time > policy_.expiry_seconds) {
            expired.push_back(txid);
        }
    }
    std::size_t removed = 0;
    for (const auto& txid : expired) {
        removed += evict(txid);
    }
    return removed;
}

std::size_t Mempool::revalidate(const UtxoView& confirmed, uint32_t next_height) {
    std::vector<MempoolEntry> pending;
    pending.reserve(entries_.size());
    for (auto& [txid, entry] : entries_) {
        pending.push_back(std::move(entry));
    }
    std::sort(pending.begin(), pending.end(), [](const MempoolEntry& a, const MempoolEntry& b) {
        return a.sequence < b.sequence;
    });

    const std::size_t before = pending.size();
    entries_.clear();
    by_fee_.clear();
    spenders_.clear();
    total_bytes_ = 0;

    // Родитель может оказаться позже потомка (вернулся в пул после reorg),
    // поэтому повторяем проходы, пока принимается хотя бы одна запись
    bool progress = true;
    while (progress && !pending.empty()) {
        progress = false;
        std::vector<MempoolEntry> retry;
        for (auto& entry : pending) {
            auto result = admit_entry(entry.tx, confirmed, next_height, entry.entry_time, true);
            if (result) {
                progress = true;
            } else if (result.error().code == MempoolRejectCode::Invalid &&
                       result.error().reason == InvalidReason::UnknownInput) {
                retry.push_back(std::move(entry));
            }
        }
        pending = std::move(retry);
    }

    return before - entries_.size();
}

MempoolSummary Mempool::summary(std::size_t top_count) const {
    MempoolSummary result;
    result.count = entries_.size();
    result.bytes = total_bytes_;
    for (const auto& [txid, entry] : entries_) {
        result.total_fees += entry.fee;
    }
    if (!by_fee_.empty()) {
        result.min_fee_rate = by_fee_.begin()->fee_rate;
        result.max_fee_rate = by_fee_.rbegin()->fee_rate;
    }
    for (auto it = by_fee_.rbegin(); it != by_fee_.rend() && result.top.size() < top_count; ++it) {
        result.top.push_back(it->txid);
    }
    return result;
}

std::vector<Transaction> Mempool::select_for_block(std::size_t max_bytes, std::size_t max_count) const {
    std::vector<const MempoolEntry*> candidates;
    candidates.reserve(by_fee_.size());
    for (auto it = by_fee_.rbegin(); it != by_fee_.rend(); ++it) {
        candidates.push_back(&entries_.at(it->txid));
    }

    std::vector<Transaction> selected;
    std::unordered_set<Hash256> included;
    std::unordered_set<OutPoint> spent;
    std::size_t used = 0;

    // Кандидаты, ждущие родителя из пула: txid родителя -> позиции
    std::unordered_map<Hash256, std::vector<std::size_t>> waiting;
    // Разблокированные кандидаты позади курсора, меньшая позиция - больший fee-rate
    std::priority_queue<std::size_t, std::vector<std::size_t>, std::greater<>> ready;
    std::size_t cursor = 0;

    auto missing_parent = [&](const MempoolEntry& entry) -> std::optional<Hash256> {
        for (const auto& input : entry.tx.inputs) {
            if (entries_.contains(input.prevout.txid) && !included.contains(input.prevout.txid)) {
                return input.prevout.txid;
            }
        }
        return std::nullopt;
    };

    while (selected.size() < max_count) {
        std::size_t i = 0;
        if (!ready.empty()) {
            i = ready.top();
            ready.pop();
        } else if (cursor < candidates.size()) {
            i = cursor++;
        } else {
            break;
        }

        const auto& entry = *candidates[i];
        if (used + entry.size > max_bytes) {
            continue;
        }
        if (auto parent = missing_parent(entry)) {
            waiting[*parent].push_back(i);
            continue;
        }
        const bool conflicts = std::any_of(entry.tx.inputs.begin(), entry.tx.inputs.end(),
            [&](const auto& input) { return spent.contains(input.prevout); });
        if (conflicts) {
            continue;
        }

        for (const auto& input : entry.tx.inputs) {
            spent.insert(input.prevout);
        }
        included.insert(entry.txid);
        selected.push_back(entry.tx);
        used += entry.size;

        if (auto it = waiting.find(entry.txid); it != waiting.end()) {
            for (auto child : it->second) {
                ready.push(child);
            }
            waiting.erase(it);
        }
    }
    return selected;
}

bool Mempool::contains(const Hash256& txid) const {
    return entries_.contains(txid);
}

const MempoolEntry* Mempool::get(const Hash256& txid) const {
    auto it = entries_.find(txid);
    return it != entries_.end() ? &it->second : nullptr;
}

std::optional<Hash256> Mempool::spender_of(const OutPoint& outpoint) const {
    if (auto it = spenders_.find(outpoint); it != spenders_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace qtc::chain
