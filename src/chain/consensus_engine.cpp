/**
 * @file consensus_engine.cpp
 * @brief Реализация движка консенсуса
 */

#include "consensus_engine.hpp"
#include "../core/chain/economics.hpp"
#include "../core/mtp_calculator.hpp"
#include "../log/logger.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace qtc::chain {

namespace {

constexpr const char* COMPONENT = "Consensus";

/**
 * @brief Общий предок двух записей индекса
 */
BlockIndexEntry* find_fork(BlockIndexEntry* a, BlockIndexEntry* b) {
    while (a != nullptr && b != nullptr && a != b) {
        if (a->height > b->height) {
            a = a->parent;
        } else if (b->height > a->height) {
            b = b->parent;
        } else {
            a = a->parent;
            b = b->parent;
        }
    }
    return a == b ? a : nullptr;
}

std::string short_hash(const Hash256& hash) {
    return hash_to_hex(hash).substr(0, 16);
}

} // namespace

ConsensusEngine::ConsensusEngine(
    const core::ChainParams& params,
    ChainStore& store,
    const core::NetworkTime& time,
    OrphanPolicy orphans
)
    : params_(params)
    , store_(store)
    , time_(time)
    , orphan_policy_(orphans)
    , validator_(params)
    , pow_(params) {}

// =============================================================================
// Инициализация
// =============================================================================

Result<void> ConsensusEngine::initialize() {
    if (initialized()) {
        return {};
    }

    auto stored = store_.recover();
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (!stored->meta) {
        return init_genesis();
    }
    return restore(std::move(*stored));
}

Result<void> ConsensusEngine::init_genesis() {
    const auto genesis = core::make_genesis_block(params_);
    const auto hash = genesis.hash();

    if (auto stored = store_.put_block(genesis); !stored) {
        return std::unexpected(halt(stored.error()));
    }

    auto delta = utxo_.prepare(genesis, 0);
    if (!delta) {
        return Err<void>(ErrorCode::StorageCorrupted, "Некорректный genesis блок");
    }

    auto& entry = add_entry(hash, genesis.header, nullptr);
    const Amount minted = genesis.transactions.front().total_output().value_or(0);

    CommitRecord record;
    record.kind = CommitKind::Connect;
    record.block_hash = hash;
    record.height = 0;
    record.delta = *delta;
    record.meta = ChainMeta{hash, 0, entry.chain_work, minted};
    if (auto committed = store_.commit(record); !committed) {
        return std::unexpected(halt(committed.error()));
    }

    utxo_.commit(*delta);
    entry.validity = BlockValidity::Connected;
    entry.total_minted = minted;
    main_chain_.push_back(&entry);
    update_state();

    log::info(COMPONENT, std::format("Создан genesis блок {} ({})", hash_to_hex(hash), params_.name));
    return {};
}

Result<void> ConsensusEngine::restore(StoredChain stored) {
    const auto genesis_hash = core::make_genesis_block(params_).hash();

    if (stored.blocks.empty() || stored.blocks.front() != genesis_hash) {
        return Err<void>(ErrorCode::StorageCorrupted, "Хранилище принадлежит другой сети");
    }

    for (const auto& hash : stored.blocks) {
        auto block = store_.read_block(hash);
        if (!block) {
            return std::unexpected(block.error());
        }

        BlockIndexEntry* parent = nullptr;
        if (hash != genesis_hash) {
            parent = find_entry(block->header.prev_hash);
            if (parent == nullptr) {
                return Err<void>(
                    ErrorCode::StorageCorrupted,
                    std::format("Нет родителя для блока {}", hash_to_hex(hash))
                );
            }
        }
        add_entry(hash, block->header, parent);
    }

    for (const auto& hash : stored.invalid) {
        if (auto* entry = find_entry(hash); entry != nullptr && entry->validity != BlockValidity::Invalid) {
            invalidate_subtree(*entry, RejectReason::make(RejectCode::InvalidAncestor, "помечен при восстановлении"));
        }
    }

    if (stored.main_chain.empty() || stored.main_chain.size() != stored.main_minted.size()) {
        return Err<void>(ErrorCode::StorageCorrupted, "Индекс основной цепочки повреждён");
    }
    for (std::size_t height = 0; height < stored.main_chain.size(); ++height) {
        auto* entry = find_entry(stored.main_chain[height]);
        if (entry == nullptr || entry->height != height ||
            (height > 0 && entry->parent != main_chain_.back())) {
            return Err<void>(
                ErrorCode::StorageCorrupted,
                std::format("Основная цепочка разорвана на высоте {}", height)
            );
        }
        entry->validity = BlockValidity::Connected;
        entry->total_minted = stored.main_minted[height];
        main_chain_.push_back(entry);
    }

    const auto& meta = *stored.meta;
    if (main_chain_.back()->hash != meta.tip_hash || main_chain_.back()->height != meta.height) {
        return Err<void>(ErrorCode::StorageCorrupted, "Метаданные не соответствуют основной цепочке");
    }

    utxo_ = std::move(stored.utxo);
    if (utxo_.total_value() != meta.total_minted) {
        return Err<void>(
            ErrorCode::StorageCorrupted,
            std::format("Сумма UTXO {} не равна эмиссии {}", utxo_.total_value(), meta.total_minted)
        );
    }

    update_state();
    log::info(COMPONENT, std::format(
        "Цепочка восстановлена: высота {}, tip {}, {} выходов, {} блоков в индексе",
        state_.height, short_hash(state_.tip_hash), utxo_.size(), index_.size()));

    // Завершить прерванный reorg, если лучшая ветка не активна
    BlockOutcome outcome;
    return activate_best_chain(outcome);
}

// =============================================================================
// Приём блоков
// =============================================================================

Result<BlockOutcome> ConsensusEngine::submit_block(const core::Block& block) {
    if (halted_) {
        return Err<BlockOutcome>(ErrorCode::StorageHalted);
    }
    if (!initialized()) {
        return Err<BlockOutcome>(ErrorCode::ChainNotInitialized);
    }

    BlockOutcome outcome;
    outcome.hash = block.hash();

    if (index_.contains(outcome.hash) || orphans_.contains(outcome.hash)) {
        outcome.status = BlockStatus::Duplicate;
        return outcome;
    }

    if (auto checked = validator_.check_block(block); !checked) {
        log::debug(COMPONENT, std::format("Блок {} отвергнут: {}",
            short_hash(outcome.hash), checked.error().to_string()));
        outcome.status = BlockStatus::Rejected;
        outcome.reason = checked.error();
        return outcome;
    }

    const int64_t now = time_.now();
    expire_orphans(now);

    auto* parent = find_entry(block.header.prev_hash);
    if (parent == nullptr) {
        add_orphan(block, now);
        outcome.status = BlockStatus::Orphan;
        outcome.reason = RejectReason::make(RejectCode::OrphanParent);
        log::debug(COMPONENT, std::format("Блок-сирота {}, родитель {}",
            short_hash(outcome.hash), short_hash(block.header.prev_hash)));
        return outcome;
    }

    const Hash256 old_tip = state_.tip_hash;

    auto accepted = accept_block(block, *parent, outcome);
    if (!accepted) {
        return std::unexpected(accepted.error());
    }
    outcome.status = accepted->status;
    outcome.reason = accepted->reason;

    // Сироты, ожидавшие этот блок или его потомков
    std::vector<Hash256> queue{outcome.hash};
    while (!queue.empty()) {
        const auto parent_hash = queue.back();
        queue.pop_back();
        for (const auto& orphan : take_orphans_of(parent_hash)) {
            auto* orphan_parent = find_entry(parent_hash);
            if (orphan_parent == nullptr) {
                continue;
            }
            auto result = accept_block(orphan, *orphan_parent, outcome);
            if (!result) {
                return std::unexpected(result.error());
            }
            log::debug(COMPONENT, std::format("Сирота {} обработана: {}",
                short_hash(orphan.hash()), to_string(result->status)));
            queue.push_back(orphan.hash());
        }
    }

    // Итоговый статус блока мог измениться при подключении сирот
    if (const auto* entry = find(outcome.hash); entry != nullptr) {
        if (entry->validity == BlockValidity::Invalid) {
            outcome.status = BlockStatus::Rejected;
            outcome.reason = entry->failure;
        } else {
            outcome.status = is_main(*entry) ? BlockStatus::ExtendMain : BlockStatus::ExtendFork;
            outcome.reason.reset();
        }
    }

    if (outcome.reorganized) {
        std::unordered_set<Hash256> confirmed;
        for (const auto& connected : outcome.connected) {
            for (const auto& tx : connected.transactions) {
                confirmed.insert(tx.txid());
            }
        }
        for (const auto& disconnected : outcome.disconnected) {
            for (const auto& tx : disconnected.transactions) {
                if (!tx.is_coinbase() && confirmed.insert(tx.txid()).second) {
                    outcome.displaced.push_back(tx);
                }
            }
        }
        log::warn(COMPONENT, std::format(
            "Reorg: отключено {} блоков, подключено {}, новый tip {} на высоте {}",
            outcome.disconnected.size(), outcome.connected.size(),
            short_hash(state_.tip_hash), state_.height));
    }

    if (outcome.status == BlockStatus::Rejected && outcome.reason) {
        log::debug(COMPONENT, std::format("Блок {} отвергнут: {}",
            short_hash(outcome.hash), outcome.reason->to_string()));
    }

    if (state_.tip_hash != old_tip && on_tip_changed_) {
        on_tip_changed_(state_);
    }
    return outcome;
}

Result<ConsensusEngine::AcceptResult> ConsensusEngine::accept_block(
    const core::Block& block,
    BlockIndexEntry& parent,
    BlockOutcome& outcome
) {
    if (parent.validity == BlockValidity::Invalid) {
        return AcceptResult{BlockStatus::Rejected, RejectReason::make(RejectCode::InvalidAncestor)};
    }

    BlockContext context;
    context.height = parent.height + 1;
    context.required_bits = required_bits(parent);
    context.median_time_past = median_time_past(parent);
    context.adjusted_time = time_.now();

    if (auto header = validator_.check_header(block, context); !header) {
        return AcceptResult{BlockStatus::Rejected, header.error()};
    }

    if (auto stored = store_.put_block(block); !stored) {
        return std::unexpected(halt(stored.error()));
    }
    auto& entry = add_entry(block.hash(), block.header, &parent);

    if (auto activated = activate_best_chain(outcome); !activated) {
        return std::unexpected(activated.error());
    }

    if (entry.validity != BlockValidity::Invalid && !is_main(entry)) {
        if (auto checked = check_fork_block(entry, block); !checked) {
            return std::unexpected(checked.error());
        }
    }

    if (entry.validity == BlockValidity::Invalid) {
        return AcceptResult{BlockStatus::Rejected, entry.failure};
    }
    return AcceptResult{is_main(entry) ? BlockStatus::ExtendMain : BlockStatus::ExtendFork, std::nullopt};
}

// =============================================================================
// Выбор цепочки
// =============================================================================

Result<void> ConsensusEngine::activate_best_chain(BlockOutcome& outcome) {
    while (true) {
        auto* best = best_tip();
        auto* current = tip();
        // При равной работе побеждает блок, полученный раньше
        const bool better = best != nullptr && best != current &&
            (best->chain_work > current->chain_work ||
             (best->chain_work == current->chain_work && best->sequence < current->sequence));
        if (!better) {
            return {};
        }

        auto* fork = find_fork(current, best);
        if (fork == nullptr) {
            return std::unexpected(halt(Error{ErrorCode::StorageCorrupted, "Ветки без общего предка"}));
        }

        while (tip() != fork) {
            if (auto disconnected = disconnect_tip(outcome); !disconnected) {
                return disconnected;
            }
            outcome.reorganized = true;
        }

        std::vector<BlockIndexEntry*> path;
        for (auto* entry = best; entry != fork; entry = entry->parent) {
            path.push_back(entry);
        }
        std::reverse(path.begin(), path.end());

        for (auto* entry : path) {
            bool rejected = false;
            if (auto connected = connect_block(*entry, outcome, rejected); !connected) {
                return connected;
            }
            if (rejected) {
                // Ветка невалидна: выбираем заново
                break;
            }
        }
    }
}

// =============================================================================
// Боковые ветки
// =============================================================================

Result<void> ConsensusEngine::check_fork_block(BlockIndexEntry& entry, const core::Block& block) {
    UtxoOverlay view(utxo_);
    auto minted = rewind_view(*entry.parent, view);
    if (!minted) {
        return std::unexpected(minted.error());
    }

    const Amount allowed = core::capped_subsidy(params_, entry.height, *minted);
    if (auto fees = validator_.check_transactions(block, entry.height, view, allowed); !fees) {
        return mark_invalid(entry, fees.error());
    }
    return {};
}

Result<Amount> ConsensusEngine::rewind_view(BlockIndexEntry& target, UtxoOverlay& view) {
    auto* fork = find_fork(tip(), &target);
    if (fork == nullptr) {
        return std::unexpected(halt(Error{ErrorCode::StorageCorrupted, "Ветки без общего предка"}));
    }

    const auto mismatch = [this](const Hash256& hash) {
        return halt(Error{
            ErrorCode::StorageCorrupted,
            std::format("Блок {} не согласуется с UTXO ветки", hash_to_hex(hash))
        });
    };

    // Откат основной цепочки до точки ветвления
    for (auto* entry = tip(); entry != fork; entry = entry->parent) {
        auto block = store_.read_block(entry->hash);
        if (!block) {
            return std::unexpected(halt(block.error()));
        }
        auto undo = store_.read_undo(entry->hash);
        if (!undo) {
            return std::unexpected(halt(undo.error()));
        }

        for (auto tx = block->transactions.rbegin(); tx != block->transactions.rend(); ++tx) {
            const auto txid = tx->txid();
            for (uint32_t i = 0; i < tx->outputs.size(); ++i) {
                // Выходы, потраченные внутри того же блока, в view уже отсутствуют
                static_cast<void>(view.spend(OutPoint{txid, i}));
            }
        }
        for (const auto& spent : undo->spent) {
            view.add(spent.outpoint, spent.coin);
        }
    }

    std::vector<BlockIndexEntry*> path;
    for (auto* entry = &target; entry != fork; entry = entry->parent) {
        path.push_back(entry);
    }
    std::reverse(path.begin(), path.end());

    // Повтор ветки: каждый её блок проверен при получении
    Amount minted = fork->total_minted;
    for (auto* entry : path) {
        auto block = store_.read_block(entry->hash);
        if (!block) {
            return std::unexpected(halt(block.error()));
        }

        Amount fees = 0;
        for (const auto& tx : block->transactions) {
            if (!tx.is_coinbase()) {
                Amount input_total = 0;
                for (const auto& input : tx.inputs) {
                    auto coin = view.lookup(input.prevout);
                    if (!coin) {
                        return std::unexpected(mismatch(entry->hash));
                    }
                    input_total += coin->out.amount;
                }
                fees += input_total - tx.total_output().value_or(0);
            }
            if (!view.apply(tx, entry->height)) {
                return std::unexpected(mismatch(entry->hash));
            }
        }
        minted += block->transactions.front().total_output().value_or(0) - fees;
    }
    return minted;
}

Result<void> ConsensusEngine::connect_block(BlockIndexEntry& entry, BlockOutcome& outcome, bool& rejected) {
    auto block = store_.read_block(entry.hash);
    if (!block) {
        return std::unexpected(halt(block.error()));
    }

    const uint32_t height = entry.height;
    const Amount minted_before = state_.total_minted;
    const Amount allowed = core::capped_subsidy(params_, height, minted_before);

    auto fees = validator_.check_transactions(*block, height, utxo_, allowed);
    if (!fees) {
        rejected = true;
        return mark_invalid(entry, fees.error());
    }

    auto delta = utxo_.prepare(*block, height);
    if (!delta) {
        rejected = true;
        return mark_invalid(entry, RejectReason::make(
            RejectCode::BadStructure, std::string(to_string(delta.error()))));
    }

    const Amount coinbase_total = block->transactions.front().total_output().value_or(0);
    const Amount minted = minted_before + coinbase_total - *fees;

    CommitRecord record;
    record.kind = CommitKind::Connect;
    record.block_hash = entry.hash;
    record.height = height;
    record.delta = std::move(*delta);
    record.meta = ChainMeta{entry.hash, height, entry.chain_work, minted};
    if (auto committed = store_.commit(record); !committed) {
        return std::unexpected(halt(committed.error()));
    }

    utxo_.commit(record.delta);
    entry.validity = BlockValidity::Connected;
    entry.total_minted = minted;
    main_chain_.push_back(&entry);
    update_state();

    log::info(COMPONENT, std::format("Блок принят: высота {}, {} транзакций, комиссии {}, {}",
        height, block->transactions.size(), *fees, short_hash(entry.hash)));
    outcome.connected.push_back(std::move(*block));
    return {};
}

Result<void> ConsensusEngine::disconnect_tip(BlockOutcome& outcome) {
    auto* entry = tip();
    if (entry->parent == nullptr) {
        return std::unexpected(halt(Error{ErrorCode::StorageCorrupted, "Попытка отключить genesis"}));
    }

    auto block = store_.read_block(entry->hash);
    if (!block) {
        return std::unexpected(halt(block.error()));
    }
    auto undo = store_.read_undo(entry->hash);
    if (!undo) {
        return std::unexpected(halt(undo.error()));
    }

    auto delta = utxo_.prepare_revert(*block, entry->height, *undo);
    if (!delta) {
        return std::unexpected(halt(Error{
            ErrorCode::StorageCorrupted,
            std::format("Данные отката блока {} не соответствуют UTXO: {}",
                hash_to_hex(entry->hash), to_string(delta.error()))
        }));
    }

    const auto* parent = entry->parent;
    CommitRecord record;
    record.kind = CommitKind::Disconnect;
    record.block_hash = entry->hash;
    record.height = entry->height;
    record.delta = std::move(*delta);
    record.meta = ChainMeta{parent->hash, parent->height, parent->chain_work, parent->total_minted};
    if (auto committed = store_.commit(record); !committed) {
        return std::unexpected(halt(committed.error()));
    }

    utxo_.commit(record.delta);
    main_chain_.pop_back();
    update_state();

    log::info(COMPONENT, std::format("Блок отключён: высота {}, {}", entry->height, short_hash(entry->hash)));
    outcome.disconnected.push_back(std::move(*block));
    return {};
}

Result<void> ConsensusEngine::mark_invalid(BlockIndexEntry& entry, const RejectReason& reason) {
    log::warn(COMPONENT, std::format("Блок {} на высоте {} невалиден: {}",
        short_hash(entry.hash), entry.height, reason.to_string()));
    invalidate_subtree(entry, reason);

    if (auto marked = store_.mark_invalid(entry.hash); !marked) {
        return std::unexpected(halt(marked.error()));
    }
    return {};
}

void ConsensusEngine::invalidate_subtree(BlockIndexEntry& entry, const RejectReason& reason) {
    entry.failure = reason;

    std::vector<BlockIndexEntry*> stack{&entry};
    while (!stack.empty()) {
        auto* current = stack.back();
        stack.pop_back();
        current->validity = BlockValidity::Invalid;
        if (!current->failure) {
            current->failure = RejectReason::make(RejectCode::InvalidAncestor);
        }
        tips_.erase(current);
        for (auto* child : current->children) {
            stack.push_back(child);
        }
    }

    auto* parent = entry.parent;
    if (parent != nullptr && parent->validity != BlockValidity::Invalid) {
        const bool has_valid_child = std::any_of(parent->children.begin(), parent->children.end(),
            [](const BlockIndexEntry* child) { return child->validity != BlockValidity::Invalid; });
        if (!has_valid_child) {
            tips_.insert(parent);
        }
    }
}

// =============================================================================
// Индекс
// =============================================================================

BlockIndexEntry& ConsensusEngine::add_entry(
    const Hash256& hash,
    const core::BlockHeader& header,
    BlockIndexEntry* parent
) {
    auto entry = std::make_unique<BlockIndexEntry>();
    entry->hash = hash;
    entry->header = header;
    entry->parent = parent;
    entry->height = parent != nullptr ? parent->height + 1 : 0;
    entry->chain_work = core::block_work(header.bits);
    if (parent != nullptr) {
        entry->chain_work += parent->chain_work;
    }
    entry->sequence = next_sequence_++;

    auto* raw = entry.get();
    index_.emplace(hash, std::move(entry));

    if (parent != nullptr) {
        parent->children.push_back(raw);
        tips_.erase(parent);
    }
    tips_.insert(raw);
    return *raw;
}

const BlockIndexEntry* ConsensusEngine::find(const Hash256& hash) const {
    auto it = index_.find(hash);
    return it != index_.end() ? it->second.get() : nullptr;
}

BlockIndexEntry* ConsensusEngine::find_entry(const Hash256& hash) {
    auto it = index_.find(hash);
    return it != index_.end() ? it->second.get() : nullptr;
}

const BlockIndexEntry* ConsensusEngine::main_at(uint32_t height) const {
    return height < main_chain_.size() ? main_chain_[height] : nullptr;
}

bool ConsensusEngine::is_main(const BlockIndexEntry& entry) const {
    return entry.height < main_chain_.size() && main_chain_[entry.height] == &entry;
}

BlockIndexEntry* ConsensusEngine::tip() const {
    return main_chain_.back();
}

BlockIndexEntry* ConsensusEngine::best_tip() const {
    BlockIndexEntry* best = nullptr;
    for (auto* candidate : tips_) {
        if (best == nullptr ||
            candidate->chain_work > best->chain_work ||
            (candidate->chain_work == best->chain_work && candidate->sequence < best->sequence)) {
            best = candidate;
        }
    }
    return best;
}

std::vector<const BlockIndexEntry*> ConsensusEngine::tips() const {
    std::vector<const BlockIndexEntry*> result(tips_.begin(), tips_.end());
    std::sort(result.begin(), result.end(), [](const BlockIndexEntry* a, const BlockIndexEntry* b) {
        return a->sequence < b->sequence;
    });
    return result;
}

const BlockIndexEntry* ConsensusEngine::ancestor(const BlockIndexEntry& entry, uint32_t height) const {
    if (height > entry.height) {
        return nullptr;
    }
    if (is_main(entry)) {
        return main_chain_[height];
    }
    const BlockIndexEntry* current = &entry;
    while (current != nullptr && current->height > height) {
        current = current->parent;
    }
    return current;
}

uint32_t ConsensusEngine::required_bits(const BlockIndexEntry& parent) const {
    const uint32_t height = parent.height + 1;
    if (!pow_.is_retarget_height(height)) {
        return parent.header.bits;
    }

    const uint32_t interval = params_.difficulty.adjustment_interval;
    const auto* first = ancestor(parent, parent.height - interval);
    const int64_t actual = static_cast<int64_t>(parent.header.timestamp) -
                           static_cast<int64_t>(first->header.timestamp);
    return pow_.calculate_next_target(parent.header.bits, actual);
}

uint32_t ConsensusEngine::median_time_past(const BlockIndexEntry& entry) const {
    core::MtpCalculator calculator(params_.difficulty.mtp_window);
    const BlockIndexEntry* current = &entry;
    for (uint32_t i = 0; i < params_.difficulty.mtp_window && current != nullptr; ++i) {
        calculator.push_header(current->header);
        current = current->parent;
    }
    return calculator.get_mtp();
}

void ConsensusEngine::update_state() {
    const auto* current = tip();
    state_.tip_hash = current->hash;
    state_.height = current->height;
    state_.chain_work = current->chain_work;
    state_.tip_bits = current->header.bits;
    state_.next_bits = required_bits(*current);
    state_.next_retarget_height = pow_.next_retarget_height(current->height);
    state_.total_minted = current->total_minted;
    state_.next_subsidy = core::capped_subsidy(params_, current->height + 1, current->total_minted);
    state_.median_time_past = median_time_past(*current);
}

Error ConsensusEngine::halt(const Error& error) {
    halted_ = true;
    log::error(COMPONENT, std::format("Ошибка хранилища, приём блоков остановлен: {}", error.message));
    return error;
}

// =============================================================================
// Сироты
// =============================================================================

void ConsensusEngine::add_orphan(const core::Block& block, int64_t now) {
    if (orphan_policy_.max_blocks == 0) {
        return;
    }
    while (orphans_.size() >= orphan_policy_.max_blocks) {
        auto oldest = std::min_element(orphans_.begin(), orphans_.end(), [](const auto& a, const auto& b) {
            return a.second.received < b.second.received;
        });
        log::debug(COMPONENT, std::format("Буфер сирот полон, вытеснен {}", short_hash(oldest->first)));
        orphans_.erase(oldest);
    }
    orphans_.emplace(block.hash(), OrphanBlock{block, now});
}

std::vector<core::Block> ConsensusEngine::take_orphans_of(const Hash256& parent) {
    std::vector<std::pair<int64_t, core::Block>> found;
    for (auto it = orphans_.begin(); it != orphans_.end();) {
        if (it->second.block.header.prev_hash == parent) {
            found.emplace_back(it->second.received, std::move(it->second.block));
            it = orphans_.erase(it);
        } else {
            ++it;
        }
    }
    std::stable_sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });

    std::vector<core::Block> blocks;
    blocks.reserve(found.size());
    for (auto& [received, block] : found) {
        blocks.push_back(std::move(block));
    }
    return blocks;
}

std::size_t ConsensusEngine::expire_orphans(int64_t now) {
    return std::erase_if(orphans_, [&](const auto& item) {
        return now - item.second.received > orphan_policy_.ttl_seconds;
    });
}

} // namespace qtc::chain
