#pragma once

#include "Date.hpp"
#include "Decimal.hpp"
#include "enums/SettlementStatus.hpp"
#include "enums/SnapshotKind.hpp"
#include <optional>
#include <string>
#include <utility>

namespace ledger::domain {

/**
 * @brief Итог проведённой оплаты
 *
 * capitalClosed и доли — модули значений (для прибыли в журнале они
 * хранятся со знаком минус).
 */
struct SettlementOutcome {
    std::string settlementId;
    std::string transactionId;
    std::string snapshotId;
    SnapshotKind kind = SnapshotKind::LOSS;
    Date date;
    Decimal paymentAmount;
    Decimal capitalClosed;
    Decimal remainingAfter;
    Decimal pendingAfter;
    bool snapshotSettled = false;
    Decimal yourShareAmount;            ///< Доля capitalClosed
    Decimal counterpartyShareAmount;
    Decimal paymentMyShare;             ///< Доля самого платежа
    Decimal paymentCounterpartyShare;
};

/**
 * @brief Результат settle / payProfit
 *
 * SETTLED и DUPLICATE успешны, остальное — отказ без изменения состояния.
 */
class SettlementResult {
public:
    SettlementStatus status = SettlementStatus::INVALID_PAYMENT;
    std::optional<SettlementOutcome> outcome;
    std::string message;

    bool isSuccess() const {
        return status == SettlementStatus::SETTLED || status == SettlementStatus::DUPLICATE;
    }

    static SettlementResult settled(SettlementOutcome outcome) {
        SettlementResult result;
        result.status = SettlementStatus::SETTLED;
        result.outcome = std::move(outcome);
        result.message = "Settlement recorded";
        return result;
    }

    static SettlementResult duplicate(SettlementOutcome outcome) {
        SettlementResult result;
        result.status = SettlementStatus::DUPLICATE;
        result.outcome = std::move(outcome);
        result.message = "Settlement already recorded";
        return result;
    }

    static SettlementResult failure(SettlementStatus status, const std::string& message) {
        SettlementResult result;
        result.status = status;
        result.message = message;
        return result;
    }
};

} // namespace ledger::domain
