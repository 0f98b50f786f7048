/**
 * @file node.cpp
 * @brief Реализация фасада узла
 */

#include "node.hpp"
#include "../core/primitives/address.hpp"
#include "../core/primitives/block_header.hpp"
#include "../log/logger.hpp"

#include <format>

namespace qtc::node {

namespace {

constexpr const char* COMPONENT = "Node";

} // namespace

Node::Node(
    const core::ChainParams& params,
    chain::ChainStore& store,
    const core::NetworkTime& time,
    NodeOptions options
)
    : params_(params)
    , store_(store)
    , time_(time)
    , options_(options)
    , engine_(params, store, time, options.orphans)
    , mempool_(params, options.mempool)
    , assembler_(params, options.assembler) {
    engine_.set_tip_callback([this](const chain::ChainState&) {
        if (miner_) {
            miner_->notify_tip();
        }
    });
}

Node::~Node() {
    stop();
}

Result<void> Node::start() {
    {
        std::unique_lock<std::shared_timed_mutex> lock(mutex_);
        if (auto initialized = engine_.initialize(); !initialized) {
            return initialized;
        }

        const auto& state = engine_.state();
        log::info(COMPONENT, std::format("Сеть {}: высота {}, tip {}, выпущено {}",
            params_.name, state.height, hash_to_hex(state.tip_hash), state.total_minted));

        if (options_.mining_enabled && !miner_) {
            miner_ = std::make_unique<mining::Miner>(
                options_.miner,
                [this]() { return block_template(options_.payout_lock); },
                [this](const core::Block& block, uint64_t generation) { on_miner_block(block, generation); }
            );
        }
    }

    if (miner_ && !miner_->is_running()) {
        miner_->start();
        log::info(COMPONENT, std::format("Майнинг на адрес {}", core::encode_address(options_.payout_lock)));
    }
    return {};
}

void Node::stop() {
    if (miner_) {
        miner_->stop();
    }
}

void Node::set_fatal_handler(FatalHandler handler) {
    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    fatal_handler_ = std::move(handler);
}

std::unique_lock<std::shared_timed_mutex> Node::exclusive_lock() {
    return std::unique_lock<std::shared_timed_mutex>(mutex_);
}

Result<Node::SharedLock> Node::lock_shared() const {
    SharedLock lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(options_.query_timeout)) {
        return Err<SharedLock>(
            ErrorCode::QueryTimeout,
            std::format("Блокировка узла не получена за {} мс", options_.query_timeout.count())
        );
    }
    if (!engine_.initialized()) {
        return Err<SharedLock>(ErrorCode::ChainNotInitialized);
    }
    return lock;
}

// =============================================================================
// Изменения
// =============================================================================

std::expected<Hash256, chain::MempoolReject> Node::submit_transaction(const core::Transaction& tx) {
    // Проверка без блокировки: структура и подписи не зависят от UTXO
    const auto& validator = engine_.validator().tx_validator();
    if (auto structure = validator.check_structure(tx); !structure) {
        return std::unexpected(chain::MempoolReject::invalid(structure.error()));
    }
    if (auto signatures = validator.verify_signatures(tx); !signatures) {
        return std::unexpected(chain::MempoolReject::invalid(signatures.error()));
    }

    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    const auto& state = engine_.state();
    auto admitted = mempool_.admit(tx, engine_.utxo(), state.height + 1, time_.now(), true);
    if (!admitted) {
        log::debug(COMPONENT, std::format("Транзакция отвергнута: {}", admitted.error().to_string()));
        return admitted;
    }

    log::debug(COMPONENT, std::format("Транзакция {} принята в mempool", hash_to_hex(*admitted)));
    return admitted;
}

Result<chain::BlockOutcome> Node::submit_block(const core::Block& block) {
    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    return submit_block_locked(block);
}

Result<chain::BlockOutcome> Node::submit_block_locked(const core::Block& block) {
    auto outcome = engine_.submit_block(block);
    if (!outcome) {
        if (engine_.halted()) {
            fatal(outcome.error());
        }
        return outcome;
    }

    if (!outcome->connected.empty() || !outcome->disconnected.empty()) {
        update_mempool(*outcome);
    }
    return outcome;
}

void Node::update_mempool(const chain::BlockOutcome& outcome) {
    for (const auto& block : outcome.connected) {
        mempool_.remove_for_block(block);
    }

    const uint32_t next_height = engine_.state().height + 1;
    const int64_t now = time_.now();

    std::size_t restored = 0;
    for (const auto& tx : outcome.displaced) {
        auto admitted = mempool_.admit(tx, engine_.utxo(), next_height, now);
        if (admitted) {
            ++restored;
        } else {
            log::debug(COMPONENT, std::format("Транзакция {} не возвращена в mempool: {}",
                hash_to_hex(tx.txid()), admitted.error().to_string()));
        }
    }

    const std::size_t dropped = mempool_.revalidate(engine_.utxo(), next_height);
    if (restored > 0 || dropped > 0) {
        log::info(COMPONENT, std::format("Mempool: возвращено {}, удалено после перепроверки {}",
            restored, dropped));
    }
}

void Node::expire_stale() {
    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    const int64_t now = time_.now();
    const auto transactions = mempool_.expire(now);
    const auto orphans = engine_.expire_orphans(now);
    if (transactions > 0 || orphans > 0) {
        log::debug(COMPONENT, std::format("Просрочено: {} транзакций, {} сирот", transactions, orphans));
    }
}

void Node::on_miner_block(const core::Block& block, uint64_t generation) {
    std::unique_lock<std::shared_timed_mutex> lock(mutex_);
    if (!miner_ || !miner_->is_current(generation)) {
        log::debug(COMPONENT, "Блок майнера устарел, не отправлен");
        return;
    }

    auto outcome = submit_block_locked(block);
    if (!outcome) {
        log::error(COMPONENT, std::format("Блок майнера не принят: {}", outcome.error().message));
        return;
    }
    if (outcome->status != chain::BlockStatus::ExtendMain) {
        log::warn(COMPONENT, std::format("Блок майнера: {}{}", chain::to_string(outcome->status),
            outcome->reason ? " (" + outcome->reason->to_string() + ")" : std::string{}));
    }
}

void Node::fatal(const Error& error) {
    if (fatal_reported_.exchange(true)) {
        return;
    }
    log::error(COMPONENT, std::format("Фатальная ошибка хранилища: {}", error.message));
    if (fatal_handler_) {
        fatal_handler_(error);
    }
}

// =============================================================================
// Запросы
// =============================================================================

Result<ChainInfo> Node::chain_info() const {
    auto lock = lock_shared();
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const auto& state = engine_.state();
    ChainInfo info;
    info.network = params_.name;
    info.height = state.height;
    info.tip_hash = state.tip_hash;
    info.chain_work = state.chain_work;
    info.difficulty = core::bits_to_difficulty(state.tip_bits);
    info.bits = state.tip_bits;
    info.next_bits = state.next_bits;
    info.next_retarget_height = state.next_retarget_height;
    info.median_time_past = state.median_time_past;
    info.total_minted = state.total_minted;
    info.next_subsidy = state.next_subsidy;
    info.mempool_size = mempool_.size();
    info.orphan_count = engine_.orphan_count();
    return info;
}

Result<Amount> Node::balance(std::string_view address) const {
    auto lock = core::decode_address(address);
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return balance(*lock);
}

Result<Amount> Node::balance(const Hash256& lock) const {
    auto guard = lock_shared();
    if (!guard) {
        return std::unexpected(guard.error());
    }
    return engine_.utxo().balance(lock);
}

Result<std::vector<chain::CoinEntry>> Node::unspent(const Hash256& lock) const {
    auto guard = lock_shared();
    if (!guard) {
        return std::unexpected(guard.error());
    }
    return engine_.utxo().unspent_for(lock);
}

BlockInfo Node::make_block_info(core::Block block, const chain::BlockIndexEntry& entry) const {
    BlockInfo info;
    info.block = std::move(block);
    info.hash = entry.hash;
    info.height = entry.height;
    info.main_chain = engine_.is_main(entry);
    info.confirmations = info.main_chain ? engine_.state().height - entry.height + 1 : 0;
    return info;
}

Result<BlockInfo> Node::block_by_height(uint32_t height) const {
    auto lock = lock_shared();
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const auto* entry = engine_.main_at(height);
    if (entry == nullptr) {
        return Err<BlockInfo>(
            ErrorCode::QueryNotFound,
            std::format("Нет блока на высоте {} (tip {})", height, engine_.state().height)
        );
    }
    auto block = store_.read_block(entry->hash);
    if (!block) {
        return std::unexpected(block.error());
    }
    return make_block_info(std::move(*block), *entry);
}

Result<BlockInfo> Node::block_by_hash(const Hash256& hash) const {
    auto lock = lock_shared();
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const auto* entry = engine_.find(hash);
    if (entry == nullptr) {
        return Err<BlockInfo>(
            ErrorCode::QueryNotFound,
            std::format("Блок {} не найден", hash_to_hex(hash))
        );
    }
    auto block = store_.read_block(hash);
    if (!block) {
        return std::unexpected(block.error());
    }
    return make_block_info(std::move(*block), *entry);
}

Result<chain::MempoolSummary> Node::mempool_summary(std::size_t top_count) const {
    auto lock = lock_shared();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    return mempool_.summary(top_count);
}

Result<EconomicsInfo> Node::economics() const {
    auto lock = lock_shared();
    if (!lock) {
        return std::unexpected(lock.error());
    }

    const auto& state = engine_.state();
    EconomicsInfo info;
    info.max_supply = params_.rewards.max_supply;
    info.current_subsidy = state.next_subsidy;
    info.halving_interval = params_.rewards.halving_interval;
    info.target_block_interval = params_.difficulty.target_spacing;
    info.next_halving_height = core::next_halving_height(params_, state.height);
    info.total_minted = state.total_minted;
    info.scheduled_supply = core::scheduled_supply(params_, state.height);
    return info;
}

core::IssuanceInfo Node::issuance_schedule(uint32_t height) const {
    return core::issuance_at(params_, height);
}

Result<mining::BlockTemplate> Node::block_template(const Hash256& payout_lock) const {
    auto lock = lock_shared();
    if (!lock) {
        return std::unexpected(lock.error());
    }
    if (engine_.halted()) {
        return Err<mining::BlockTemplate>(ErrorCode::StorageHalted);
    }
    return assembler_.assemble(engine_.state(), mempool_, payout_lock, time_.now());
}

} // namespace qtc::node
