#pragma once

#include "domain/Date.hpp"
#include "domain/Decimal.hpp"
#include "domain/LedgerResult.hpp"
#include "domain/LedgerState.hpp"
#include "domain/PendingEntry.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс журнала: пополнения, записи баланса, проекции
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    virtual domain::LedgerResult createFunding(const std::string& accountId,
                                               const domain::Decimal& amount,
                                               const domain::Date& date,
                                               const std::string& note) = 0;

    /**
     * @brief Записать баланс биржевого счёта
     * @param adjustment Дополнительная корректировка, прибавляется к balance
     */
    virtual domain::LedgerResult createBalanceRecord(const std::string& accountId,
                                                     const domain::Decimal& balance,
                                                     const domain::Date& date,
                                                     const std::string& note,
                                                     const domain::Decimal& adjustment) = 0;

    /**
     * @return std::nullopt если счёт не найден
     */
    virtual std::optional<domain::LedgerState> getState(const std::string& accountId) = 0;

    /**
     * @brief Состояние на конец указанной даты
     */
    virtual std::optional<domain::LedgerState> getStateAsOf(const std::string& accountId,
                                                            const domain::Date& date) = 0;

    virtual std::optional<std::vector<domain::Transaction>> getTransactions(const std::string& accountId) = 0;

    /**
     * @brief Все счета с активным снимком
     */
    virtual std::vector<domain::PendingEntry> getPendingSummary() = 0;
};

} // namespace ledger::ports::input
