/**
 * @file chain_store.hpp
 * @brief Долговременное хранилище цепочки
 *
 * Хранилище содержит:
 * - тела блоков по хешу (включая блоки боковых веток)
 * - индекс основной цепочки по высоте
 * - UTXO записи по OutPoint и данные отката
 * - запись метаданных цепочки (tip, высота, работа, эмиссия)
 *
 * Подключение или отключение блока фиксируется одной атомарной записью
 * commit(). После возврата из commit() запись переживает сбой процесса.
 */

#pragma once

#include "utxo_set.hpp"
#include "../core/types.hpp"
#include "../core/primitives/block.hpp"
#include "../core/primitives/uint256.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace qtc::chain {

/**
 * @brief Метаданные цепочки
 */
struct ChainMeta {
    Hash256 tip_hash{};
    uint32_t height{0};
    core::uint256 chain_work;

    /// @brief Выпущено всего к tip включительно
    Amount total_minted{0};

    [[nodiscard]] bool operator==(const ChainMeta&) const noexcept = default;
};

/**
 * @brief Тип фиксации
 */
enum class CommitKind : uint8_t {
    Connect = 1,
    Disconnect = 2,
};

/**
 * @brief Атомарная запись подключения/отключения блока
 */
struct CommitRecord {
    CommitKind kind{CommitKind::Connect};

    /// @brief Подключаемый или отключаемый блок
    Hash256 block_hash{};

    /// @brief Высота этого блока
    uint32_t height{0};

    /// @brief Изменение UTXO set
    UtxoDelta delta;

    /// @brief Метаданные после фиксации
    ChainMeta meta;
};

/**
 * @brief Состояние, восстановленное из хранилища
 */
struct StoredChain {
    /// @brief Метаданные (nullopt для пустого хранилища)
    std::optional<ChainMeta> meta;

    UtxoSet utxo;

    /// @brief Все сохранённые блоки в порядке записи (родитель раньше потомка)
    std::vector<Hash256> blocks;

    /// @brief Основная цепочка: хеш по высоте
    std::vector<Hash256> main_chain;

    /// @brief Эмиссия по высоте основной цепочки
    std::vector<Amount> main_minted;

    /// @brief Блоки, помеченные невалидными
    std::unordered_set<Hash256> invalid;
};

/**
 * @brief Интерфейс хранилища цепочки
 *
 * Ошибки записи возвращаются как StorageWriteFailed; вызывающий
 * считает их фатальными.
 */
class ChainStore {
public:
    virtual ~ChainStore() = default;

    /**
     * @brief Сохранить тело блока
     *
     * Повторное сохранение уже известного блока ничего не делает.
     */
    [[nodiscard]] virtual Result<void> put_block(const core::Block& block) = 0;

    /**
     * @brief Атомарно зафиксировать подключение или отключение блока
     */
    [[nodiscard]] virtual Result<void> commit(const CommitRecord& record) = 0;

    /**
     * @brief Пометить блок невалидным
     */
    [[nodiscard]] virtual Result<void> mark_invalid(const Hash256& hash) = 0;

    /**
     * @brief Метаданные tip (nullopt для пустого хранилища)
     */
    [[nodiscard]] virtual std::optional<ChainMeta> read_tip() const = 0;

    /**
     * @brief Прочитать блок по хешу
     *
     * @return Блок или QueryNotFound
     */
    [[nodiscard]] virtual Result<core::Block> read_block(const Hash256& hash) const = 0;

    /**
     * @brief Прочитать блок основной цепочки по высоте
     */
    [[nodiscard]] virtual Result<core::Block> read_block(uint32_t height) const = 0;

    /**
     * @brief Данные отката подключённого блока
     */
    [[nodiscard]] virtual Result<BlockUndo> read_undo(const Hash256& hash) const = 0;

    /**
     * @brief Восстановить состояние после перезапуска
     */
    [[nodiscard]] virtual Result<StoredChain> recover() = 0;
};

// =============================================================================
// Общее индексное состояние
// =============================================================================

/**
 * @brief Индексы хранилища в памяти (без тел блоков)
 *
 * Используется обеими реализациями для применения записей.
 */
class StoreIndex {
public:
    void add_block(const Hash256& hash);
    void apply_commit(const CommitRecord& record, bool apply_utxo = true);
    void add_invalid(const Hash256& hash);

    [[nodiscard]] bool has_block(const Hash256& hash) const {
        return known_.contains(hash);
    }

    [[nodiscard]] const std::optional<ChainMeta>& meta() const noexcept { return meta_; }
    [[nodiscard]] const UtxoSet& utxo() const noexcept { return utxo_; }

    /**
     * @brief Хеш основной цепочки на высоте
     */
    [[nodiscard]] std::optional<Hash256> hash_at(uint32_t height) const;

    [[nodiscard]] Result<BlockUndo> undo(const Hash256& hash) const;

    /**
     * @brief Снимок состояния
     */
    [[nodiscard]] StoredChain snapshot() const;

    /**
     * @brief Заменить UTXO set и метаданные (загрузка снимка)
     */
    void restore(UtxoSet utxo, std::optional<ChainMeta> meta);

    void clear();

private:
    std::optional<ChainMeta> meta_;
    UtxoSet utxo_;
    std::vector<Hash256> blocks_;
    std::unordered_set<Hash256> known_;
    std::vector<Hash256> main_chain_;
    std::vector<Amount> main_minted_;
    std::unordered_map<Hash256, BlockUndo> undo_;
    std::unordered_set<Hash256> invalid_;
};

// =============================================================================
// Хранилище в памяти
// =============================================================================

/**
 * @brief Хранилище в памяти для тестов
 *
 * recover() возвращает текущее содержимое, что эквивалентно перезапуску
 * узла с тем же хранилищем. Запись можно принудительно отключить для
 * проверки обработки фатальных ошибок.
 */
class MemoryChainStore final : public ChainStore {
public:
    MemoryChainStore() = default;

    [[nodiscard]] Result<void> put_block(const core::Block& block) override;
    [[nodiscard]] Result<void> commit(const CommitRecord& record) override;
    [[nodiscard]] Result<void> mark_invalid(const Hash256& hash) override;
    [[nodiscard]] std::optional<ChainMeta> read_tip() const override;
    [[nodiscard]] Result<core::Block> read_block(const Hash256& hash) const override;
    [[nodiscard]] Result<core::Block> read_block(uint32_t height) const override;
    [[nodiscard]] Result<BlockUndo> read_undo(const Hash256& hash) const override;
    [[nodiscard]] Result<StoredChain> recover() override;

    /**
     * @brief Включить отказ всех последующих записей
     */
    void set_fail_writes(bool fail) noexcept {
        fail_writes_ = fail;
    }

    [[nodiscard]] std::size_t block_count() const noexcept {
        return blocks_.size();
    }

private:
    StoreIndex index_;
    std::unordered_map<Hash256, core::Block> blocks_;
    bool fail_writes_{false};
};

} // namespace qtc::chain
