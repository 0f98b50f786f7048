/**
 * @file chain_store.cpp
 * @brief Индексы хранилища и хранилище в памяти
 */

#include "chain_store.hpp"

#include <format>

namespace qtc::chain {

// =============================================================================
// StoreIndex
// =============================================================================

void StoreIndex::add_block(const Hash256& hash) {
    if (known_.insert(hash).second) {
        blocks_.push_back(hash);
    }
}

void StoreIndex::apply_commit(const CommitRecord& record, bool apply_utxo) {
    if (record.kind == CommitKind::Connect) {
        main_chain_.resize(record.height);
        main_minted_.resize(record.height);
        main_chain_.push_back(record.block_hash);
        main_minted_.push_back(record.meta.total_minted);
        undo_[record.block_hash] = undo_from_delta(record.delta);
    } else {
        if (main_chain_.size() > record.height) {
            main_chain_.resize(record.height);
            main_minted_.resize(record.height);
        }
    }

    if (apply_utxo) {
        utxo_.commit(record.delta);
    }
    meta_ = record.meta;
}

void StoreIndex::add_invalid(const Hash256& hash) {
    invalid_.insert(hash);
}

std::optional<Hash256> StoreIndex::hash_at(uint32_t height) const {
    if (height >= main_chain_.size()) {
        return std::nullopt;
    }
    return main_chain_[height];
}

Result<BlockUndo> StoreIndex::undo(const Hash256& hash) const {
    auto it = undo_.find(hash);
    if (it == undo_.end()) {
        return Err<BlockUndo>(
            ErrorCode::QueryNotFound,
            std::format("Нет данных отката для блока {}", hash_to_hex(hash))
        );
    }
    return it->second;
}

StoredChain StoreIndex::snapshot() const {
    StoredChain state;
    state.meta = meta_;
    state.utxo = utxo_;
    state.blocks = blocks_;
    state.main_chain = main_chain_;
    state.main_minted = main_minted_;
    state.invalid = invalid_;
    return state;
}

void StoreIndex::restore(UtxoSet utxo, std::optional<ChainMeta> meta) {
    utxo_ = std::move(utxo);
    meta_ = std::move(meta);
}

void StoreIndex::clear() {
    meta_.reset();
    utxo_.clear();
    blocks_.clear();
    known_.clear();
    main_chain_.clear();
    main_minted_.clear();
    undo_.clear();
    invalid_.clear();
}

// =============================================================================
// MemoryChainStore
// =============================================================================

Result<void> MemoryChainStore::put_block(const core::Block& block) {
    if (fail_writes_) {
        return Err<void>(ErrorCode::StorageWriteFailed);
    }
    const auto hash = block.hash();
    if (index_.has_block(hash)) {
        return {};
    }
    blocks_.emplace(hash, block);
    index_.add_block(hash);
    return {};
}

Result<void> MemoryChainStore::commit(const CommitRecord& record) {
    if (fail_writes_) {
        return Err<void>(ErrorCode::StorageWriteFailed);
    }
    index_.apply_commit(record);
    return {};
}

Result<void> MemoryChainStore::mark_invalid(const Hash256& hash) {
    if (fail_writes_) {
        return Err<void>(ErrorCode::StorageWriteFailed);
    }
    index_.add_invalid(hash);
    return {};
}

std::optional<ChainMeta> MemoryChainStore::read_tip() const {
    return index_.meta();
}

Result<core::Block> MemoryChainStore::read_block(const Hash256& hash) const {
    auto it = blocks_.find(hash);
    if (it == blocks_.end()) {
        return Err<core::Block>(
            ErrorCode::QueryNotFound,
            std::format("Блок {} не найден", hash_to_hex(hash))
        );
    }
    return it->second;
}

Result<core::Block> MemoryChainStore::read_block(uint32_t height) const {
    auto hash = index_.hash_at(height);
    if (!hash) {
        return Err<core::Block>(
            ErrorCode::QueryNotFound,
            std::format("Нет блока на высоте {}", height)
        );
    }
    return read_block(*hash);
}

Result<BlockUndo> MemoryChainStore::read_undo(const Hash256& hash) const {
    return index_.undo(hash);
}

Result<StoredChain> MemoryChainStore::recover() {
    return index_.snapshot();
}

} // namespace qtc::chain
