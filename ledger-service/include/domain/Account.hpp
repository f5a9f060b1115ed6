#pragma once

#include "BeneficiarySplit.hpp"
#include "Decimal.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Агрегат «клиент на бирже»
 *
 * Владеет своими транзакциями и снимками. cachedCapital и cachedBalance
 * только кэш, источник истины — журнал.
 * lossSplit/profitSplit — значения по умолчанию для следующего снимка.
 */
struct Account {
    std::string accountId;      ///< Формат: "acc-xxxxxxxx"
    std::string clientName;
    std::string exchangeName;
    BeneficiarySplit lossSplit;
    BeneficiarySplit profitSplit;
    Decimal cachedCapital;
    Decimal cachedBalance;
};

} // namespace ledger::domain
