#pragma once

#include "LedgerState.hpp"
#include "Transaction.hpp"
#include "enums/LedgerStatus.hpp"
#include <optional>
#include <string>
#include <utility>

namespace ledger::domain {

/**
 * @brief Результат createFunding / createBalanceRecord
 */
class LedgerResult {
public:
    LedgerStatus status = LedgerStatus::OK;
    std::string message;
    std::optional<Transaction> transaction;
    std::optional<LedgerState> state;

    bool isOk() const { return status == LedgerStatus::OK; }

    static LedgerResult ok(Transaction transaction, LedgerState state) {
        LedgerResult result;
        result.status = LedgerStatus::OK;
        result.message = "Recorded";
        result.transaction = std::move(transaction);
        result.state = std::move(state);
        return result;
    }

    static LedgerResult failure(LedgerStatus status, const std::string& message) {
        LedgerResult result;
        result.status = status;
        result.message = message;
        return result;
    }
};

} // namespace ledger::domain
