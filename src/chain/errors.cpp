/**
 * @file errors.cpp
 * @brief Строковое представление отказов
 */

#include "errors.hpp"

#include <format>

namespace qtc::chain {

std::string RejectReason::to_string() const {
    std::string result;
    if (code == RejectCode::InvalidTransaction) {
        result = std::format("{}({}, {})", chain::to_string(code), tx_index,
                             chain::to_string(tx_reason));
    } else {
        result = std::string(chain::to_string(code));
    }
    if (!detail.empty()) {
        result += ": " + detail;
    }
    return result;
}

std::string MempoolReject::to_string() const {
    if (code == MempoolRejectCode::Invalid) {
        return std::format("{}({})", chain::to_string(code), chain::to_string(reason));
    }
    return std::string(chain::to_string(code));
}

} // namespace qtc::chain
