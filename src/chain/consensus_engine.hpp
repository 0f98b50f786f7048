/**
 * @file consensus_engine.hpp
 * @brief Движок консенсуса: индекс блоков, выбор цепочки, reorg
 *
 * Жизненный цикл блока:
 * @code
 * submit -> check_block -> [родитель неизвестен] -> Orphan
 *                       -> check_header -> сохранение -> activate_best_chain
 *                                                      -> ExtendMain | ExtendFork | Rejected
 * @endcode
 *
 * Транзакции каждого блока проверяются относительно UTXO его родителя:
 * для блока боковой ветки это состояние строится поверх текущего UTXO
 * откатом основной цепочки до точки ветвления и повтором ветки.
 * Каждое подключение и отключение блока - отдельная атомарная фиксация
 * в хранилище; состояние в памяти изменяется только после неё.
 */

#pragma once

#include "block_validator.hpp"
#include "chain_store.hpp"
#include "errors.hpp"
#include "utxo_set.hpp"
#include "../core/chain/chain_params.hpp"
#include "../core/network_time.hpp"
#include "../core/primitives/block.hpp"
#include "../core/primitives/uint256.hpp"
#include "../core/validation/pow_validator.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace qtc::chain {

// =============================================================================
// Состояние цепочки
// =============================================================================

/**
 * @brief Состояние активной цепочки
 *
 * Изменяется только после успешной фиксации в хранилище.
 */
struct ChainState {
    Hash256 tip_hash{};
    uint32_t height{0};
    core::uint256 chain_work;

    /// @brief bits tip блока
    uint32_t tip_bits{0};

    /// @brief bits, требуемые от следующего блока
    uint32_t next_bits{0};

    /// @brief Ближайшая высота пересчёта сложности
    uint32_t next_retarget_height{0};

    /// @brief Выпущено к tip включительно
    Amount total_minted{0};

    /// @brief Награда следующего блока (с учётом лимита эмиссии)
    Amount next_subsidy{0};

    /// @brief Median Time Past для следующего блока
    uint32_t median_time_past{0};
};

// =============================================================================
// Индекс блоков
// =============================================================================

/**
 * @brief Степень проверки блока в индексе
 */
enum class BlockValidity : uint8_t {
    /// @brief Блок проверен и сохранён, но не подключён
    Stored,
    /// @brief Блок был подключён: транзакции проверены
    Connected,
    /// @brief Блок или его предок невалиден
    Invalid,
};

/**
 * @brief Запись индекса блоков
 */
struct BlockIndexEntry {
    Hash256 hash{};
    core::BlockHeader header;
    uint32_t height{0};

    /// @brief Суммарная работа от genesis до этого блока
    core::uint256 chain_work;

    /// @brief Родитель (nullptr для genesis)
    BlockIndexEntry* parent{nullptr};

    std::vector<BlockIndexEntry*> children;

    BlockValidity validity{BlockValidity::Stored};

    /// @brief Выпущено к этому блоку включительно (известно после подключения)
    Amount total_minted{0};

    /// @brief Порядок получения (для выбора при равной работе)
    uint64_t sequence{0};

    /// @brief Причина невалидности
    std::optional<RejectReason> failure;
};

// =============================================================================
// Результат приёма блока
// =============================================================================

/**
 * @brief Итог приёма блока
 */
enum class BlockStatus {
    /// @brief Родитель неизвестен, блок в буфере сирот
    Orphan,
    /// @brief Блок стал частью основной цепочки (в том числе после reorg)
    ExtendMain,
    /// @brief Блок сохранён в боковой ветке
    ExtendFork,
    /// @brief Блок отвергнут
    Rejected,
    /// @brief Блок уже известен
    Duplicate,
};

[[nodiscard]] constexpr std::string_view to_string(BlockStatus status) noexcept {
    switch (status) {
        case BlockStatus::Orphan: return "orphan";
        case BlockStatus::ExtendMain: return "extend-main";
        case BlockStatus::ExtendFork: return "extend-fork";
        case BlockStatus::Rejected: return "rejected";
        case BlockStatus::Duplicate: return "duplicate";
    }
    return "unknown";
}

/**
 * @brief Результат submit_block
 */
struct BlockOutcome {
    BlockStatus status{BlockStatus::Rejected};
    Hash256 hash{};

    /// @brief Причина (для Rejected и Orphan)
    std::optional<RejectReason> reason;

    /// @brief Были отключены блоки основной цепочки
    bool reorganized{false};

    /// @brief Подключённые блоки в порядке подключения
    std::vector<core::Block> connected;

    /// @brief Отключённые блоки в порядке отключения
    std::vector<core::Block> disconnected;

    /// @brief Транзакции отключённых блоков, отсутствующие в новой цепочке
    std::vector<Transaction> displaced;
};

/**
 * @brief Настройки буфера сирот
 */
struct OrphanPolicy {
    std::size_t max_blocks{100};
    int64_t ttl_seconds{20 * 60};
};

// =============================================================================
// ConsensusEngine
// =============================================================================

/**
 * @brief Движок консенсуса
 *
 * Не thread-safe: синхронизацию обеспечивает node::Node.
 */
class ConsensusEngine {
public:
    /// @brief Вызывается после смены tip
    using TipCallback = std::function<void(const ChainState&)>;

    /**
     * @param params Параметры цепочки
     * @param store Хранилище
     * @param time Источник скорректированного времени
     *
     * Все аргументы должны пережить движок.
     */
    ConsensusEngine(
        const core::ChainParams& params,
        ChainStore& store,
        const core::NetworkTime& time,
        OrphanPolicy orphans = {}
    );

    ConsensusEngine(const ConsensusEngine&) = delete;
    ConsensusEngine& operator=(const ConsensusEngine&) = delete;

    /**
     * @brief Создать genesis или восстановить состояние из хранилища
     */
    [[nodiscard]] Result<void> initialize();

    /**
     * @brief Принять блок
     *
     * @return Итог или ошибка хранилища (после неё движок остановлен)
     */
    [[nodiscard]] Result<BlockOutcome> submit_block(const core::Block& block);

    /**
     * @brief Удалить просроченные блоки-сироты
     *
     * @return Количество удалённых
     */
    std::size_t expire_orphans(int64_t now);

    // =========================================================================
    // Запросы
    // =========================================================================

    [[nodiscard]] bool initialized() const noexcept { return !main_chain_.empty(); }
    [[nodiscard]] bool halted() const noexcept { return halted_; }

    [[nodiscard]] const ChainState& state() const noexcept { return state_; }
    [[nodiscard]] const UtxoSet& utxo() const noexcept { return utxo_; }
    [[nodiscard]] const core::ChainParams& params() const noexcept { return params_; }
    [[nodiscard]] const BlockValidator& validator() const noexcept { return validator_; }
    [[nodiscard]] const ChainStore& store() const noexcept { return store_; }

    [[nodiscard]] const BlockIndexEntry* find(const Hash256& hash) const;

    /**
     * @brief Запись основной цепочки на высоте
     */
    [[nodiscard]] const BlockIndexEntry* main_at(uint32_t height) const;

    [[nodiscard]] bool is_main(const BlockIndexEntry& entry) const;

    /**
     * @brief bits, требуемые от потомка блока
     */
    [[nodiscard]] uint32_t required_bits(const BlockIndexEntry& parent) const;

    /**
     * @brief Median Time Past последних 11 блоков, заканчивая entry
     */
    [[nodiscard]] uint32_t median_time_past(const BlockIndexEntry& entry) const;

    /**
     * @brief Листья дерева блоков без невалидных
     */
    [[nodiscard]] std::vector<const BlockIndexEntry*> tips() const;

    [[nodiscard]] std::size_t orphan_count() const noexcept { return orphans_.size(); }
    [[nodiscard]] bool has_orphan(const Hash256& hash) const { return orphans_.contains(hash); }

    void set_tip_callback(TipCallback callback) {
        on_tip_changed_ = std::move(callback);
    }

private:
    struct OrphanBlock {
        core::Block block;
        int64_t received{0};
    };

    /// @brief Итог одного шага принятия (без обработки сирот)
    struct AcceptResult {
        BlockStatus status{BlockStatus::Rejected};
        std::optional<RejectReason> reason;
    };

    [[nodiscard]] Result<void> init_genesis();
    [[nodiscard]] Result<void> restore(StoredChain stored);

    /**
     * @brief Проверить блок с известным родителем, сохранить и активировать
     */
    [[nodiscard]] Result<AcceptResult> accept_block(
        const core::Block& block,
        BlockIndexEntry& parent,
        BlockOutcome& outcome
    );

    /**
     * @brief Переключиться на ветку с наибольшей работой
     */
    [[nodiscard]] Result<void> activate_best_chain(BlockOutcome& outcome);

    /**
     * @brief Проверить транзакции блока вне основной цепочки
     *
     * При ошибке блок и его потомки помечаются невалидными.
     */
    [[nodiscard]] Result<void> check_fork_block(BlockIndexEntry& entry, const core::Block& block);

    /**
     * @brief Привести view к состоянию UTXO после блока target
     *
     * @return Выпущено к target включительно
     */
    [[nodiscard]] Result<Amount> rewind_view(BlockIndexEntry& target, UtxoOverlay& view);

    [[nodiscard]] Result<void> connect_block(BlockIndexEntry& entry, BlockOutcome& outcome, bool& rejected);
    [[nodiscard]] Result<void> disconnect_tip(BlockOutcome& outcome);

    [[nodiscard]] Result<void> mark_invalid(BlockIndexEntry& entry, const RejectReason& reason);

    /**
     * @brief Пометить блок и всех потомков невалидными (только в памяти)
     */
    void invalidate_subtree(BlockIndexEntry& entry, const RejectReason& reason);

    BlockIndexEntry& add_entry(const Hash256& hash, const core::BlockHeader& header, BlockIndexEntry* parent);

    [[nodiscard]] BlockIndexEntry* find_entry(const Hash256& hash);
    [[nodiscard]] BlockIndexEntry* best_tip() const;
    [[nodiscard]] BlockIndexEntry* tip() const;
    [[nodiscard]] const BlockIndexEntry* ancestor(const BlockIndexEntry& entry, uint32_t height) const;

    void add_orphan(const core::Block& block, int64_t now);
    [[nodiscard]] std::vector<core::Block> take_orphans_of(const Hash256& parent);

    void update_state();

    /**
     * @brief Перевести движок в остановленное состояние после ошибки записи
     */
    [[nodiscard]] Error halt(const Error& error);

    const core::ChainParams& params_;
    ChainStore& store_;
    const core::NetworkTime& time_;
    OrphanPolicy orphan_policy_;
    BlockValidator validator_;
    core::validation::PowValidator pow_;

    std::unordered_map<Hash256, std::unique_ptr<BlockIndexEntry>> index_;
    std::set<BlockIndexEntry*> tips_;
    std::vector<BlockIndexEntry*> main_chain_;
    uint64_t next_sequence_{0};

    std::unordered_map<Hash256, OrphanBlock> orphans_;

    UtxoSet utxo_;
    ChainState state_;
    bool halted_{false};
    TipCallback on_tip_changed_;
};

} // namespace qtc::chain
