/**
 * @file mempool.hpp
 * @brief Пул неподтверждённых транзакций
 *
 * Транзакции проверяются относительно подтверждённого UTXO set, поверх
 * которого наложены выходы уже принятых неподтверждённых транзакций,
 * поэтому цепочки неподтверждённых транзакций допустимы.
 *
 * Политика приёма:
 * - конфликт: вход уже потрачен другой транзакцией пула
 * - fee-rate (единиц на 1000 байт) не ниже min_fee_rate
 * - нет выходов меньше порога пыли
 * - при нехватке места вытесняются записи с меньшим fee-rate вместе
 *   с потомками
 */

#pragma once

#include "errors.hpp"
#include "tx_validator.hpp"
#include "utxo_set.hpp"
#include "../core/chain/chain_params.hpp"
#include "../core/primitives/block.hpp"

#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace qtc::chain {

/**
 * @brief Настройки пула
 */
struct MempoolPolicy {
    /// @brief Максимальное количество транзакций
    std::size_t max_transactions{100'000};

    /// @brief Максимальный суммарный размер (байт)
    std::size_t max_bytes{300'000'000};

    /// @brief Время жизни записи (секунды)
    int64_t expiry_seconds{14 * 24 * 60 * 60};

    /// @brief Минимальный fee-rate (единиц на 1000 байт)
    Amount min_fee_rate{1000};
};

/**
 * @brief Запись пула
 */
struct MempoolEntry {
    Transaction tx;
    Hash256 txid{};
    Amount fee{0};
    std::size_t size{0};

    /// @brief Комиссия за 1000 байт
    Amount fee_rate{0};

    /// @brief Время поступления (Unix time)
    int64_t entry_time{0};

    /// @brief Порядковый номер поступления
    uint64_t sequence{0};
};

/**
 * @brief Сводка состояния пула
 */
struct MempoolSummary {
    std::size_t count{0};
    std::size_t bytes{0};
    Amount total_fees{0};
    Amount min_fee_rate{0};
    Amount max_fee_rate{0};

    /// @brief txid с наибольшим fee-rate
    std::vector<Hash256> top;
};

/**
 * @brief Пул транзакций
 *
 * Не thread-safe: синхронизацию обеспечивает node::Node.
 */
class Mempool {
public:
    using AdmitResult = std::expected<Hash256, MempoolReject>;

    /**
     * @param params Параметры цепочки (должны пережить пул)
     */
    Mempool(const core::ChainParams& params, MempoolPolicy policy);

    /**
     * @brief Принять транзакцию
     *
     * @param confirmed Подтверждённый UTXO set
     * @param next_height Высота следующего блока
     * @param now Текущее время (Unix time)
     * @param signatures_verified Подписи уже проверены вызывающим
     * @return txid или причина отказа
     */
    [[nodiscard]] AdmitResult admit(
        const Transaction& tx,
        const UtxoView& confirmed,
        uint32_t next_height,
        int64_t now,
        bool signatures_verified = false
    );

    /**
     * @brief Выбрать транзакции для блока
     *
     * Жадно по fee-rate в пределах бюджета. Транзакция выбирается только
     * после всех своих родителей из пула.
     */
    [[nodiscard]] std::vector<Transaction> select_for_block(
        std::size_t max_bytes,
        std::size_t max_count = std::numeric_limits<std::size_t>::max()
    ) const;

    /**
     * @brief Удалить транзакцию и всех её потомков
     *
     * @return Количество удалённых записей
     */
    std::size_t evict(const Hash256& txid);

    /**
     * @brief Удалить транзакции, вошедшие в блок, и конфликтующие с ним
     */
    void remove_for_block(const core::Block& block);

    /**
     * @brief Удалить записи старше expiry_seconds
     *
     * @return Количество удалённых записей
     */
    std::size_t expire(int64_t now);

    /**
     * @brief Перепроверить все записи после изменения UTXO set
     *
     * @return Количество удалённых записей
     */
    std::size_t revalidate(const UtxoView& confirmed, uint32_t next_height);

    [[nodiscard]] MempoolSummary summary(std::size_t top_count = 10) const;

    [[nodiscard]] bool contains(const Hash256& txid) const;
    [[nodiscard]] const MempoolEntry* get(const Hash256& txid) const;

    /**
     * @brief Транзакция пула, тратящая выход
     */
    [[nodiscard]] std::optional<Hash256> spender_of(const OutPoint& outpoint) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t bytes() const noexcept { return total_bytes_; }
    [[nodiscard]] const MempoolPolicy& policy() const noexcept { return policy_; }

private:
    /**
     * @brief Представление: подтверждённые выходы + выходы пула - траты пула
     */
    class View;

    /**
     * @brief Ключ упорядочивания: fee-rate по возрастанию, новые раньше
     */
    struct FeeKey {
        Amount fee_rate;
        uint64_t sequence;
        Hash256 txid;

        [[nodiscard]] bool operator<(const FeeKey& other) const noexcept {
            if (fee_rate != other.fee_rate) return fee_rate < other.fee_rate;
            return sequence > other.sequence;
        }
    };

    AdmitResult admit_entry(
        const Transaction& tx,
        const UtxoView& confirmed,
        uint32_t next_height,
        int64_t entry_time,
        bool signatures_verified
    );

    /**
     * @brief Подобрать записи для вытеснения ради новой транзакции
     *
     * @return Записи (с потомками) или nullopt если места не освободить
     */
    [[nodiscard]] std::optional<std::vector<Hash256>> plan_eviction(
        const Transaction& tx,
        std::size_t size,
        Amount fee_rate
    ) const;

    void collect_descendants(const Hash256& txid, std::vector<Hash256>& out) const;
    void remove_entry(const Hash256& txid);

    const core::ChainParams& params_;
    MempoolPolicy policy_;
    TxValidator validator_;

    std::unordered_map<Hash256, MempoolEntry> entries_;
    std::set<FeeKey> by_fee_;
    std::unordered_map<OutPoint, Hash256> spenders_;
    std::size_t total_bytes_{0};
    uint64_t next_sequence_{0};
};

} // namespace qtc::chain
