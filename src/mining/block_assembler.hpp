/**
 * @file block_assembler.hpp
 * @brief Сборка шаблона блока и перебор nonce
 *
 * Шаблон строится от ChainState активной цепочки:
 * - coinbase с lock_time = высота, выплата subsidy + комиссии на payout lock
 * - транзакции из mempool, жадно по fee-rate
 * - заголовок: prev = tip, bits = next_bits, timestamp = max(MTP + 1, now)
 */

#pragma once

#include "../chain/consensus_engine.hpp"
#include "../chain/mempool.hpp"
#include "../core/chain/chain_params.hpp"
#include "../core/primitives/block.hpp"
#include "../core/types.hpp"

#include <atomic>
#include <cstdint>
#include <string_view>
#include <vector>

namespace qtc::mining {

/**
 * @brief Шаблон блока для майнинга
 */
struct BlockTemplate {
    core::Block block;

    /// @brief Высота блока
    uint32_t height{0};

    /// @brief Награда (с учётом лимита эмиссии)
    Amount subsidy{0};

    /// @brief Сумма комиссий включённых транзакций
    Amount fees{0};
};

/**
 * @brief Настройки сборщика
 */
struct AssemblerOptions {
    /// @brief Предел размера блока (0 = консенсусный максимум)
    std::size_t max_block_bytes{0};
};

/**
 * @brief Итог перебора nonce
 */
enum class SearchResult {
    /// @brief Найден заголовок с hash <= target
    Found,
    /// @brief Перебор прерван флагом отмены
    Cancelled,
    /// @brief Исчерпан бюджет хешей
    Exhausted,
};

[[nodiscard]] constexpr std::string_view to_string(SearchResult result) noexcept {
    switch (result) {
        case SearchResult::Found: return "found";
        case SearchResult::Cancelled: return "cancelled";
        case SearchResult::Exhausted: return "exhausted";
    }
    return "unknown";
}

/**
 * @brief Сборщик блоков
 */
class BlockAssembler {
public:
    explicit BlockAssembler(const core::ChainParams& params, AssemblerOptions options = {});

    /**
     * @brief Построить шаблон поверх текущего tip
     *
     * @param state Состояние активной цепочки
     * @param mempool Источник транзакций
     * @param payout_lock Получатель награды
     * @param adjusted_now Скорректированное время узла
     */
    [[nodiscard]] BlockTemplate assemble(
        const chain::ChainState& state,
        const chain::Mempool& mempool,
        const Hash256& payout_lock,
        int64_t adjusted_now
    ) const;

    /**
     * @brief Построить шаблон с заданным набором транзакций
     *
     * Транзакции должны быть упорядочены так, чтобы родители шли раньше.
     */
    [[nodiscard]] BlockTemplate assemble(
        const chain::ChainState& state,
        std::vector<core::Transaction> transactions,
        Amount fees,
        const Hash256& payout_lock,
        int64_t adjusted_now
    ) const;

    /**
     * @brief Перебор nonce до hash <= target
     *
     * При переполнении nonce увеличивает timestamp. Флаг отмены
     * проверяется на каждом хеше.
     *
     * @param max_hashes Бюджет хешей (0 = без ограничения)
     */
    [[nodiscard]] static SearchResult search(
        core::Block& block,
        const std::atomic<bool>& cancel,
        uint64_t max_hashes = 0
    );

    [[nodiscard]] std::size_t max_block_bytes() const noexcept;

private:
    const core::ChainParams& params_;
    AssemblerOptions options_;
};

} // namespace qtc::mining
