#pragma once

#include "Date.hpp"
#include "Decimal.hpp"
#include "enums/AccountPosition.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Проекция состояния счёта для дашбордов
 *
 * Все поля производные, кроме cached* (значения кэша агрегата).
 */
struct LedgerState {
    std::string accountId;
    AccountPosition position = AccountPosition::NEUTRAL;
    Decimal capital;
    Decimal currentBalance;
    Decimal loss;
    Decimal profit;
    Decimal pending;                    ///< В долях, округление вниз
    Decimal pendingMyShare;
    Decimal pendingCounterpartyShare;
    Decimal remainingLoss;
    Decimal remainingProfit;
    std::optional<std::string> activeSnapshotId;
    Decimal cachedCapital;
    Decimal cachedBalance;
    std::optional<Date> asOf;           ///< Задано для исторического среза
};

} // namespace ledger::domain
