/**
 * @file node.hpp
 * @brief Фасад узла: запросы и изменения состояния
 *
 * Все изменения (блоки, транзакции, блоки майнера) выполняются под
 * эксклюзивной блокировкой std::shared_timed_mutex. Запросы берут
 * разделяемую блокировку с таймаутом и возвращают QueryTimeout вместо
 * бесконечного ожидания.
 *
 * Подписи транзакций проверяются до взятия блокировки; входы повторно
 * проверяются под ней.
 */

#pragma once

#include "../chain/chain_store.hpp"
#include "../chain/consensus_engine.hpp"
#include "../chain/mempool.hpp"
#include "../core/chain/chain_params.hpp"
#include "../core/chain/economics.hpp"
#include "../core/network_time.hpp"
#include "../mining/block_assembler.hpp"
#include "../mining/miner.hpp"

#include <atomic>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace qtc::node {

// =============================================================================
// Настройки
// =============================================================================

/**
 * @brief Настройки узла
 */
struct NodeOptions {
    /// @brief Таймаут ожидания разделяемой блокировки для запросов
    std::chrono::milliseconds query_timeout{2000};

    chain::MempoolPolicy mempool;
    chain::OrphanPolicy orphans;

    /// @brief Запустить встроенный майнер
    bool mining_enabled{false};

    /// @brief Получатель награды майнера
    Hash256 payout_lock{};

    mining::AssemblerOptions assembler;
    mining::MinerConfig miner;
};

// =============================================================================
// Результаты запросов
// =============================================================================

/**
 * @brief Сводка состояния цепочки
 */
struct ChainInfo {
    std::string network;
    uint32_t height{0};
    Hash256 tip_hash{};
    core::uint256 chain_work;

    /// @brief Сложность tip относительно difficulty 1
    double difficulty{0.0};

    uint32_t bits{0};
    uint32_t next_bits{0};
    uint32_t next_retarget_height{0};
    uint32_t median_time_past{0};
    Amount total_minted{0};
    Amount next_subsidy{0};
    std::size_t mempool_size{0};
    std::size_t orphan_count{0};
};

/**
 * @brief Экономические параметры и состояние эмиссии
 */
struct EconomicsInfo {
    Amount max_supply{0};

    /// @brief Награда следующего блока
    Amount current_subsidy{0};

    uint32_t halving_interval{0};

    /// @brief Целевой интервал блоков (секунды)
    uint32_t target_block_interval{0};

    std::optional<uint32_t> next_halving_height;

    /// @brief Фактически выпущено к tip
    Amount total_minted{0};

    /// @brief Выпуск по графику к высоте tip
    Amount scheduled_supply{0};
};

/**
 * @brief Блок с положением в цепочке
 */
struct BlockInfo {
    core::Block block;
    Hash256 hash{};
    uint32_t height{0};
    bool main_chain{false};

    /// @brief Подтверждений (0 вне основной цепочки)
    uint32_t confirmations{0};
};

/**
 * @brief Обработчик фатальной ошибки хранилища
 */
using FatalHandler = std::function<void(const Error& error)>;

// =============================================================================
// Node
// =============================================================================

/**
 * @brief Узел QTC
 *
 * Thread-safe.
 */
class Node {
public:
    /**
     * @param params Параметры цепочки
     * @param store Хранилище
     * @param time Источник скорректированного времени
     *
     * Аргументы должны пережить узел.
     */
    Node(
        const core::ChainParams& params,
        chain::ChainStore& store,
        const core::NetworkTime& time,
        NodeOptions options = {}
    );

    ~Node();

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    /**
     * @brief Восстановить цепочку и запустить майнер (если включён)
     */
    [[nodiscard]] Result<void> start();

    /**
     * @brief Остановить майнер
     */
    void stop();

    /**
     * @brief Установить обработчик фатальной ошибки хранилища
     *
     * Вызывается один раз, под эксклюзивной блокировкой узла.
     */
    void set_fatal_handler(FatalHandler handler);

    // =========================================================================
    // Изменения
    // =========================================================================

    /**
     * @brief Принять транзакцию в mempool
     */
    [[nodiscard]] std::expected<Hash256, chain::MempoolReject> submit_transaction(
        const core::Transaction& tx
    );

    /**
     * @brief Принять блок
     *
     * При смене основной цепочки подтверждённые транзакции удаляются из
     * mempool, вытесненные reorg возвращаются, пул перепроверяется.
     *
     * @return Итог или ошибка хранилища (фатальна)
     */
    [[nodiscard]] Result<chain::BlockOutcome> submit_block(const core::Block& block);

    /**
     * @brief Удалить просроченные транзакции и блоки-сироты
     */
    void expire_stale();

    // =========================================================================
    // Запросы (QueryTimeout при занятой блокировке)
    // =========================================================================

    [[nodiscard]] Result<ChainInfo> chain_info() const;

    /**
     * @brief Баланс по адресу "qtc1..."
     */
    [[nodiscard]] Result<Amount> balance(std::string_view address) const;

    /**
     * @brief Баланс по lock
     */
    [[nodiscard]] Result<Amount> balance(const Hash256& lock) const;

    [[nodiscard]] Result<std::vector<chain::CoinEntry>> unspent(const Hash256& lock) const;

    [[nodiscard]] Result<BlockInfo> block_by_height(uint32_t height) const;
    [[nodiscard]] Result<BlockInfo> block_by_hash(const Hash256& hash) const;

    [[nodiscard]] Result<chain::MempoolSummary> mempool_summary(std::size_t top_count = 10) const;

    [[nodiscard]] Result<EconomicsInfo> economics() const;

    /**
     * @brief Состояние эмиссии по графику на высоте
     *
     * Зависит только от ChainParams, блокировка не требуется.
     */
    [[nodiscard]] core::IssuanceInfo issuance_schedule(uint32_t height) const;

    /**
     * @brief Шаблон блока поверх текущего tip
     */
    [[nodiscard]] Result<mining::BlockTemplate> block_template(const Hash256& payout_lock) const;

    [[nodiscard]] const core::ChainParams& params() const noexcept { return params_; }

    /**
     * @brief Майнер (nullptr если выключен)
     */
    [[nodiscard]] const mining::Miner* miner() const noexcept { return miner_.get(); }

    /**
     * @brief Взять эксклюзивную блокировку узла
     *
     * Для обслуживания хранилища; пока блокировка удерживается, запросы
     * завершаются по таймауту.
     */
    [[nodiscard]] std::unique_lock<std::shared_timed_mutex> exclusive_lock();

private:
    using SharedLock = std::shared_lock<std::shared_timed_mutex>;

    /**
     * @brief Разделяемая блокировка с таймаутом
     */
    [[nodiscard]] Result<SharedLock> lock_shared() const;

    [[nodiscard]] Result<chain::BlockOutcome> submit_block_locked(const core::Block& block);

    /**
     * @brief Обновить mempool после изменения основной цепочки
     */
    void update_mempool(const chain::BlockOutcome& outcome);

    [[nodiscard]] BlockInfo make_block_info(core::Block block, const chain::BlockIndexEntry& entry) const;

    void on_miner_block(const core::Block& block, uint64_t generation);

    void fatal(const Error& error);

    const core::ChainParams& params_;
    chain::ChainStore& store_;
    const core::NetworkTime& time_;
    NodeOptions options_;

    mutable std::shared_timed_mutex mutex_;
    chain::ConsensusEngine engine_;
    chain::Mempool mempool_;
    mining::BlockAssembler assembler_;
    std::unique_ptr<mining::Miner> miner_;

    FatalHandler fatal_handler_;
    std::atomic<bool> fatal_reported_{false};
};

} // namespace qtc::node
