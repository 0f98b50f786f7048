/**
 * @file utxo_set.hpp
 * @brief Множество непотраченных выходов (UTXO set)
 *
 * Применение блока разделено на две фазы:
 * - prepare(): проверка и вычисление изменений без модификации
 * - commit(): применение заранее вычисленной дельты
 *
 * Между ними движок консенсуса записывает дельту в хранилище, поэтому
 * состояние в памяти никогда не опережает долговременную запись.
 */

#pragma once

#include "errors.hpp"
#include "../core/types.hpp"
#include "../core/primitives/block.hpp"
#include "../core/primitives/transaction.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace qtc::chain {

using core::OutPoint;
using core::Transaction;
using core::TxOut;

/**
 * @brief Непотраченный выход
 */
struct Coin {
    TxOut out;

    /// @brief Высота блока, создавшего выход
    uint32_t height{0};

    /// @brief Создан coinbase транзакцией
    bool coinbase{false};

    [[nodiscard]] bool operator==(const Coin&) const noexcept = default;
};

/**
 * @brief Выход вместе с его OutPoint
 */
struct CoinEntry {
    OutPoint outpoint;
    Coin coin;

    [[nodiscard]] bool operator==(const CoinEntry&) const noexcept = default;
};

/**
 * @brief Данные отката блока: потраченные блоком выходы в порядке входов
 *
 * Выходы, созданные и потраченные внутри того же блока, не включаются.
 */
struct BlockUndo {
    std::vector<CoinEntry> spent;

    [[nodiscard]] bool operator==(const BlockUndo&) const noexcept = default;
};

/**
 * @brief Итоговое изменение UTXO set
 */
struct UtxoDelta {
    /// @brief Удаляемые выходы (со значениями для отката)
    std::vector<CoinEntry> spent;

    /// @brief Добавляемые выходы
    std::vector<CoinEntry> created;

    /**
     * @brief Обратная дельта
     */
    [[nodiscard]] UtxoDelta inverse() const {
        return UtxoDelta{created, spent};
    }

    [[nodiscard]] bool operator==(const UtxoDelta&) const noexcept = default;
};

// =============================================================================
// Представления
// =============================================================================

/**
 * @brief Интерфейс поиска выходов
 */
class UtxoView {
public:
    virtual ~UtxoView() = default;

    /**
     * @brief Найти непотраченный выход
     *
     * @return Coin или nullopt если выход неизвестен или потрачен
     */
    [[nodiscard]] virtual std::optional<Coin> lookup(const OutPoint& outpoint) const = 0;
};

/**
 * @brief Представление поверх другого с отложенными тратами и созданиями
 *
 * Базовое представление не изменяется и должно пережить overlay.
 */
class UtxoOverlay final : public UtxoView {
public:
    explicit UtxoOverlay(const UtxoView& base) : base_(base) {}

    [[nodiscard]] std::optional<Coin> lookup(const OutPoint& outpoint) const override;

    /**
     * @brief Пометить выход потраченным
     *
     * @return false если выход не найден
     */
    bool spend(const OutPoint& outpoint);

    /**
     * @brief Добавить выход
     *
     * Заменяет потраченный в overlay выход базы с тем же outpoint.
     */
    void add(const OutPoint& outpoint, const Coin& coin);

    /**
     * @brief Применить транзакцию: потратить входы и добавить выходы
     *
     * @return false если какой-либо вход не найден (overlay не изменяется)
     */
    bool apply(const Transaction& tx, uint32_t height);

private:
    const UtxoView& base_;
    std::unordered_set<OutPoint> spent_;
    std::unordered_map<OutPoint, Coin> created_;
};

// =============================================================================
// UTXO set
// =============================================================================

/**
 * @brief Множество непотраченных выходов
 *
 * Не thread-safe: синхронизацию обеспечивает node::Node.
 */
class UtxoSet final : public UtxoView {
public:
    using ApplyResult = std::expected<BlockUndo, ConsensusError>;
    using DeltaResult = std::expected<UtxoDelta, ConsensusError>;

    UtxoSet() = default;

    [[nodiscard]] std::optional<Coin> lookup(const OutPoint& outpoint) const override;

    // =========================================================================
    // Применение и откат блоков
    // =========================================================================

    /**
     * @brief Вычислить изменения от применения блока, не изменяя множество
     *
     * Выходы, созданные ранее в том же блоке, могут быть потрачены позже
     * в нём же.
     *
     * @return Дельта или DoubleSpend если вход потрачен/неизвестен
     */
    [[nodiscard]] DeltaResult prepare(const core::Block& block, uint32_t height) const;

    /**
     * @brief Вычислить изменения отката блока
     *
     * @param block Последний применённый блок
     * @param undo Данные отката, полученные при применении
     * @return Дельта или UndoMismatch
     */
    [[nodiscard]] DeltaResult prepare_revert(
        const core::Block& block,
        uint32_t height,
        const BlockUndo& undo
    ) const;

    /**
     * @brief Применить дельту
     *
     * Дельта должна быть получена из prepare()/prepare_revert() для
     * текущего состояния или прочитана из журнала хранилища.
     */
    void commit(const UtxoDelta& delta);

    /**
     * @brief Применить блок атомарно
     *
     * @return Данные отката или DoubleSpend (множество не изменено)
     */
    [[nodiscard]] ApplyResult apply(const core::Block& block, uint32_t height);

    /**
     * @brief Откатить блок (обратная операция к apply)
     */
    [[nodiscard]] std::expected<void, ConsensusError> revert(
        const core::Block& block,
        uint32_t height,
        const BlockUndo& undo
    );

    // =========================================================================
    // Запросы
    // =========================================================================

    /**
     * @brief Сумма выходов, запертых на lock
     */
    [[nodiscard]] Amount balance(const Hash256& lock) const;

    /**
     * @brief Все выходы, запертые на lock (упорядочены по высоте)
     */
    [[nodiscard]] std::vector<CoinEntry> unspent_for(const Hash256& lock) const;

    /**
     * @brief Сумма всех выходов
     */
    [[nodiscard]] Amount total_value() const;

    [[nodiscard]] std::size_t size() const noexcept {
        return coins_.size();
    }

    /**
     * @brief Обойти все выходы
     */
    void for_each(const std::function<void(const OutPoint&, const Coin&)>& visitor) const;

    void clear() noexcept {
        coins_.clear();
    }

private:
    std::unordered_map<OutPoint, Coin> coins_;
};

/**
 * @brief Данные отката из дельты подключения блока
 */
[[nodiscard]] inline BlockUndo undo_from_delta(const UtxoDelta& delta) {
    return BlockUndo{delta.spent};
}

} // namespace qtc::chain
