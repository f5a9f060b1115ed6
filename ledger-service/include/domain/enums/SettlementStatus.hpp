#pragma once

#include <string>

namespace ledger::domain {

enum class SettlementStatus {
    SETTLED,
    DUPLICATE,              ///< Повтор с теми же входными данными, не ошибка
    NO_ACTIVE_LOSS,
    NO_ACTIVE_PROFIT,
    INVALID_PAYMENT,
    CAPITAL_EXCEEDED,
    INVARIANT_VIOLATION,
    CONCURRENCY_CONFLICT,   ///< Таймаут ожидания блокировки, можно повторить
    ACCOUNT_NOT_FOUND
};

inline std::string toString(SettlementStatus status) {
    switch (status) {
        case SettlementStatus::SETTLED: return "SETTLED";
        case SettlementStatus::DUPLICATE: return "DUPLICATE";
        case SettlementStatus::NO_ACTIVE_LOSS: return "NO_ACTIVE_LOSS";
        case SettlementStatus::NO_ACTIVE_PROFIT: return "NO_ACTIVE_PROFIT";
        case SettlementStatus::INVALID_PAYMENT: return "INVALID_PAYMENT";
        case SettlementStatus::CAPITAL_EXCEEDED: return "CAPITAL_EXCEEDED";
        case SettlementStatus::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
        case SettlementStatus::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
        case SettlementStatus::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        default: return "UNKNOWN";
    }
}

} // namespace ledger::domain
