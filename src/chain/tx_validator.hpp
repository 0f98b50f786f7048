/**
 * @file tx_validator.hpp
 * @brief Валидатор транзакций
 *
 * Порядок проверок validate():
 * 1. Структура: входы, выходы, размер, количество, суммы выходов
 * 2. Отсутствие повторяющихся входов
 * 3. Все входы найдены в представлении UTXO
 * 4. Созревание coinbase
 * 5. Авторизация: SHA256d(public_key) == lock, подпись Dilithium2
 * 6. Сумма входов >= сумма выходов
 *
 * Проверка подписей (CPU-bound, не зависит от UTXO) доступна отдельно:
 * блоки проверяют подписи параллельно, mempool - вне блокировки записи.
 */

#pragma once

#include "errors.hpp"
#include "utxo_set.hpp"
#include "../core/chain/chain_params.hpp"
#include "../core/primitives/transaction.hpp"

#include <expected>

namespace qtc::chain {

/**
 * @brief Валидатор транзакций
 *
 * Не имеет состояния и побочных эффектов; thread-safe.
 */
class TxValidator {
public:
    /// @brief Комиссия или причина отказа
    using FeeResult = std::expected<Amount, InvalidReason>;

    /// @brief Успех или причина отказа
    using CheckResult = std::expected<void, InvalidReason>;

    /**
     * @param params Параметры цепочки (должны пережить валидатор)
     */
    explicit TxValidator(const core::ChainParams& params);

    /**
     * @brief Контекстно-независимая проверка структуры обычной транзакции
     */
    [[nodiscard]] CheckResult check_structure(const Transaction& tx) const;

    /**
     * @brief Структура coinbase: без входов, размер и выходы в пределах лимитов
     */
    [[nodiscard]] CheckResult check_coinbase(const Transaction& tx) const;

    /**
     * @brief Проверки, зависящие от UTXO, без проверки подписей
     *
     * @param spend_height Высота блока, в который войдёт транзакция
     * @return Комиссия или причина отказа
     */
    [[nodiscard]] FeeResult check_inputs(
        const Transaction& tx,
        const UtxoView& view,
        uint32_t spend_height
    ) const;

    /**
     * @brief Проверить подписи всех входов над signature_hash()
     */
    [[nodiscard]] CheckResult verify_signatures(const Transaction& tx) const;

    /**
     * @brief Полная проверка транзакции
     *
     * @return Комиссия или первая найденная причина отказа
     */
    [[nodiscard]] FeeResult validate(
        const Transaction& tx,
        const UtxoView& view,
        uint32_t spend_height
    ) const;

private:
    /**
     * @brief Шаги 1-5 без подписей; возвращает сумму входов
     */
    [[nodiscard]] FeeResult resolve_inputs(
        const Transaction& tx,
        const UtxoView& view,
        uint32_t spend_height
    ) const;

    [[nodiscard]] FeeResult compute_fee(const Transaction& tx, Amount input_total) const;

    const core::ChainParams& params_;
};

} // namespace qtc::chain
