#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Тип записи журнала
 *
 * LOSS и PROFIT — только аудит, в расчётах не участвуют.
 */
enum class TransactionKind {
    FUNDING,
    SETTLEMENT,
    BALANCE_RECORD,
    ADJUSTMENT,
    LOSS,
    PROFIT
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::FUNDING: return "FUNDING";
        case TransactionKind::SETTLEMENT: return "SETTLEMENT";
        case TransactionKind::BALANCE_RECORD: return "BALANCE_RECORD";
        case TransactionKind::ADJUSTMENT: return "ADJUSTMENT";
        case TransactionKind::LOSS: return "LOSS";
        case TransactionKind::PROFIT: return "PROFIT";
        default: return "UNKNOWN";
    }
}

inline TransactionKind parseTransactionKind(const std::string& str) {
    if (str == "FUNDING") return TransactionKind::FUNDING;
    if (str == "SETTLEMENT") return TransactionKind::SETTLEMENT;
    if (str == "BALANCE_RECORD") return TransactionKind::BALANCE_RECORD;
    if (str == "ADJUSTMENT") return TransactionKind::ADJUSTMENT;
    if (str == "LOSS") return TransactionKind::LOSS;
    if (str == "PROFIT") return TransactionKind::PROFIT;
    throw std::invalid_argument("Unknown transaction kind: " + str);
}

} // namespace ledger::domain
