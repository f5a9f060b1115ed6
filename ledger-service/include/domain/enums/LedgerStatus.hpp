#pragma once

#include <string>

namespace ledger::domain {

enum class LedgerStatus {
    OK,
    INVALID_AMOUNT,
    FUNDING_BLOCKED,
    ACCOUNT_NOT_FOUND,
    INVARIANT_VIOLATION,
    CONCURRENCY_CONFLICT
};

inline std::string toString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::OK: return "OK";
        case LedgerStatus::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case LedgerStatus::FUNDING_BLOCKED: return "FUNDING_BLOCKED";
        case LedgerStatus::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case LedgerStatus::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
        case LedgerStatus::CONCURRENCY_CONFLICT: return "CONCURRENCY_CONFLICT";
        default: return "UNKNOWN";
    }
}

} // namespace ledger::domain
