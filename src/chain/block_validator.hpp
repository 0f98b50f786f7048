/**
 * @file block_validator.hpp
 * @brief Валидатор блоков
 *
 * Три уровня проверки:
 * - check_block(): без контекста цепочки (структура, размер, PoW, Merkle)
 * - check_header(): относительно родителя (сложность, время, высота в coinbase)
 * - check_transactions(): относительно UTXO set родителя
 */

#pragma once

#include "errors.hpp"
#include "tx_validator.hpp"
#include "utxo_set.hpp"
#include "../core/chain/chain_params.hpp"
#include "../core/primitives/block.hpp"
#include "../core/validation/pow_validator.hpp"

#include <cstdint>
#include <expected>

namespace qtc::chain {

/**
 * @brief Контекст проверки блока относительно родителя
 */
struct BlockContext {
    /// @brief Высота проверяемого блока
    uint32_t height{0};

    /// @brief Требуемый compact target
    uint32_t required_bits{0};

    /// @brief Median Time Past последних 11 предков
    uint32_t median_time_past{0};

    /// @brief Скорректированное время узла
    int64_t adjusted_time{0};
};

/**
 * @brief Валидатор блоков
 *
 * Не имеет состояния; thread-safe.
 */
class BlockValidator {
public:
    using CheckResult = std::expected<void, RejectReason>;

    /// @brief Сумма комиссий блока или причина отказа
    using FeeResult = std::expected<Amount, RejectReason>;

    /**
     * @param params Параметры цепочки (должны пережить валидатор)
     */
    explicit BlockValidator(const core::ChainParams& params);

    /**
     * @brief Проверка без контекста
     *
     * BadStructure, BadCoinbase, OversizedBlock, BadDifficulty,
     * BadProofOfWork, BadMerkleRoot.
     */
    [[nodiscard]] CheckResult check_block(const core::Block& block) const;

    /**
     * @brief Проверка относительно родителя
     *
     * BadDifficulty, BadTimestamp, BadCoinbase.
     */
    [[nodiscard]] CheckResult check_header(
        const core::Block& block,
        const BlockContext& context
    ) const;

    /**
     * @brief Проверка транзакций относительно UTXO set родителя
     *
     * Транзакции проверяются по порядку; каждая видит выходы предыдущих
     * транзакций блока. Подписи проверяются параллельно.
     *
     * @param allowed_subsidy Допустимая награда (с учётом лимита эмиссии)
     * @return Сумма комиссий или InvalidTransaction/OversizedCoinbase
     */
    [[nodiscard]] FeeResult check_transactions(
        const core::Block& block,
        uint32_t height,
        const UtxoView& view,
        Amount allowed_subsidy
    ) const;

    [[nodiscard]] const TxValidator& tx_validator() const noexcept {
        return tx_validator_;
    }

private:
    /**
     * @brief Проверить подписи всех транзакций блока
     *
     * @return Флаг корректности подписей для каждой транзакции
     */
    [[nodiscard]] std::vector<char> verify_signatures_parallel(const core::Block& block) const;

    const core::ChainParams& params_;
    TxValidator tx_validator_;
    core::validation::PowValidator pow_validator_;
};

} // namespace qtc::chain
