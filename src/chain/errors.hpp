/**
 * @file errors.hpp
 * @brief Коды отказов консенсуса, валидации и mempool
 *
 * Каждый отказ несёт конкретный код причины. Классы ошибок:
 * - Structural: некорректная кодировка или структура
 * - Consensus: блок отвергается навсегда
 * - Validation: транзакция отвергается, отправитель может исправить её
 * - Resource: временная нехватка ресурсов (mempool переполнен)
 * - Orphan: родитель неизвестен, блок буферизуется
 */

#pragma once

#include "../core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace qtc::chain {

/**
 * @brief Класс ошибки
 */
enum class ErrorClass {
    Structural,
    Consensus,
    Validation,
    Resource,
    Orphan,
};

[[nodiscard]] constexpr std::string_view to_string(ErrorClass cls) noexcept {
    switch (cls) {
        case ErrorClass::Structural: return "structural";
        case ErrorClass::Consensus: return "consensus";
        case ErrorClass::Validation: return "validation";
        case ErrorClass::Resource: return "resource";
        case ErrorClass::Orphan: return "orphan";
    }
    return "unknown";
}

// =============================================================================
// Транзакции
// =============================================================================

/**
 * @brief Причина невалидности транзакции
 */
enum class InvalidReason {
    NoInputs,
    NoOutputs,
    UnexpectedCoinbase,
    Oversized,
    TooManyInputs,
    TooManyOutputs,
    BadOutputAmount,
    DuplicateInput,
    UnknownInput,
    ImmatureCoinbase,
    LockMismatch,
    BadSignature,
    NegativeFee,
};

[[nodiscard]] constexpr std::string_view to_string(InvalidReason reason) noexcept {
    switch (reason) {
        case InvalidReason::NoInputs: return "no-inputs";
        case InvalidReason::NoOutputs: return "no-outputs";
        case InvalidReason::UnexpectedCoinbase: return "unexpected-coinbase";
        case InvalidReason::Oversized: return "oversized";
        case InvalidReason::TooManyInputs: return "too-many-inputs";
        case InvalidReason::TooManyOutputs: return "too-many-outputs";
        case InvalidReason::BadOutputAmount: return "bad-output-amount";
        case InvalidReason::DuplicateInput: return "duplicate-input";
        case InvalidReason::UnknownInput: return "unknown-input";
        case InvalidReason::ImmatureCoinbase: return "immature-coinbase";
        case InvalidReason::LockMismatch: return "lock-mismatch";
        case InvalidReason::BadSignature: return "bad-signature";
        case InvalidReason::NegativeFee: return "negative-fee";
    }
    return "unknown";
}

/**
 * @brief Структурные причины проверяются до любой семантики
 */
[[nodiscard]] constexpr ErrorClass classify(InvalidReason reason) noexcept {
    switch (reason) {
        case InvalidReason::NoInputs:
        case InvalidReason::NoOutputs:
        case InvalidReason::UnexpectedCoinbase:
        case InvalidReason::Oversized:
        case InvalidReason::TooManyInputs:
        case InvalidReason::TooManyOutputs:
        case InvalidReason::BadOutputAmount:
            return ErrorClass::Structural;
        default:
            return ErrorClass::Validation;
    }
}

// =============================================================================
// UTXO
// =============================================================================

/**
 * @brief Ошибка применения блока к UTXO set
 */
enum class ConsensusError {
    /// @brief Вход ссылается на потраченный или неизвестный выход
    DoubleSpend,
    /// @brief Выход с таким OutPoint уже существует
    DuplicateOutput,
    /// @brief Данные отката не соответствуют блоку
    UndoMismatch,
};

[[nodiscard]] constexpr std::string_view to_string(ConsensusError error) noexcept {
    switch (error) {
        case ConsensusError::DoubleSpend: return "double-spend";
        case ConsensusError::DuplicateOutput: return "duplicate-output";
        case ConsensusError::UndoMismatch: return "undo-mismatch";
    }
    return "unknown";
}

// =============================================================================
// Блоки
// =============================================================================

/**
 * @brief Код отказа блока
 */
enum class RejectCode {
    Malformed,
    BadStructure,
    OversizedBlock,
    BadDifficulty,
    BadProofOfWork,
    BadMerkleRoot,
    BadTimestamp,
    BadCoinbase,
    OversizedCoinbase,
    InvalidTransaction,
    OrphanParent,
    InvalidAncestor,
};

[[nodiscard]] constexpr std::string_view to_string(RejectCode code) noexcept {
    switch (code) {
        case RejectCode::Malformed: return "malformed";
        case RejectCode::BadStructure: return "bad-structure";
        case RejectCode::OversizedBlock: return "oversized-block";
        case RejectCode::BadDifficulty: return "bad-difficulty";
        case RejectCode::BadProofOfWork: return "bad-proof-of-work";
        case RejectCode::BadMerkleRoot: return "bad-merkle-root";
        case RejectCode::BadTimestamp: return "bad-timestamp";
        case RejectCode::BadCoinbase: return "bad-coinbase";
        case RejectCode::OversizedCoinbase: return "oversized-coinbase";
        case RejectCode::InvalidTransaction: return "invalid-transaction";
        case RejectCode::OrphanParent: return "orphan-parent";
        case RejectCode::InvalidAncestor: return "invalid-ancestor";
    }
    return "unknown";
}

/**
 * @brief Причина отказа блока
 *
 * Для InvalidTransaction заполнены tx_index и tx_reason.
 */
struct RejectReason {
    RejectCode code{RejectCode::Malformed};

    /// @brief Индекс транзакции в блоке (для InvalidTransaction)
    std::size_t tx_index{0};

    /// @brief Причина невалидности транзакции (для InvalidTransaction)
    InvalidReason tx_reason{InvalidReason::UnknownInput};

    /// @brief Подробности для журнала
    std::string detail;

    [[nodiscard]] static RejectReason make(RejectCode code, std::string detail = {}) {
        RejectReason reason;
        reason.code = code;
        reason.detail = std::move(detail);
        return reason;
    }

    [[nodiscard]] static RejectReason invalid_transaction(std::size_t index, InvalidReason why) {
        RejectReason reason;
        reason.code = RejectCode::InvalidTransaction;
        reason.tx_index = index;
        reason.tx_reason = why;
        return reason;
    }

    /**
     * @brief Строка вида "invalid-transaction(2, bad-signature)"
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const RejectReason& other) const noexcept {
        if (code != other.code) return false;
        if (code != RejectCode::InvalidTransaction) return true;
        return tx_index == other.tx_index && tx_reason == other.tx_reason;
    }
};

[[nodiscard]] constexpr ErrorClass classify(RejectCode code) noexcept {
    switch (code) {
        case RejectCode::Malformed:
        case RejectCode::BadStructure:
        case RejectCode::OversizedBlock:
            return ErrorClass::Structural;
        case RejectCode::InvalidTransaction:
            return ErrorClass::Validation;
        case RejectCode::OrphanParent:
            return ErrorClass::Orphan;
        default:
            return ErrorClass::Consensus;
    }
}

// =============================================================================
// Mempool
// =============================================================================

/**
 * @brief Код отказа в приёме транзакции в mempool
 */
enum class MempoolRejectCode {
    AlreadyPresent,
    Invalid,
    Conflict,
    InsufficientFee,
    Dust,
    MempoolFull,
};

[[nodiscard]] constexpr std::string_view to_string(MempoolRejectCode code) noexcept {
    switch (code) {
        case MempoolRejectCode::AlreadyPresent: return "already-present";
        case MempoolRejectCode::Invalid: return "invalid";
        case MempoolRejectCode::Conflict: return "conflict";
        case MempoolRejectCode::InsufficientFee: return "insufficient-fee";
        case MempoolRejectCode::Dust: return "dust";
        case MempoolRejectCode::MempoolFull: return "mempool-full";
    }
    return "unknown";
}

/**
 * @brief Отказ mempool
 */
struct MempoolReject {
    MempoolRejectCode code{MempoolRejectCode::Invalid};

    /// @brief Причина невалидности (для Invalid)
    InvalidReason reason{InvalidReason::UnknownInput};

    [[nodiscard]] static MempoolReject make(MempoolRejectCode code) noexcept {
        return MempoolReject{code, InvalidReason::UnknownInput};
    }

    [[nodiscard]] static MempoolReject invalid(InvalidReason why) noexcept {
        return MempoolReject{MempoolRejectCode::Invalid, why};
    }

    /**
     * @brief Имеет ли смысл повторить отправку позже без изменений
     */
    [[nodiscard]] constexpr bool retry_later() const noexcept {
        return code == MempoolRejectCode::MempoolFull;
    }

    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const MempoolReject& other) const noexcept {
        if (code != other.code) return false;
        return code != MempoolRejectCode::Invalid || reason == other.reason;
    }
};

[[nodiscard]] constexpr ErrorClass classify(const MempoolReject& reject) noexcept {
    switch (reject.code) {
        case MempoolRejectCode::MempoolFull:
            return ErrorClass::Resource;
        case MempoolRejectCode::Invalid:
            return classify(reject.reason);
        default:
            return ErrorClass::Validation;
    }
}

} // namespace qtc::chain
