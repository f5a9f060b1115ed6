#pragma once

#include "Date.hpp"
#include "Decimal.hpp"
#include <cstdint>

namespace ledger::domain {

/**
 * @brief Точка заморозки баланса
 *
 * (date, sequence) — ключ последней записи, формировавшей баланс
 * на момент заморозки; balance — значение CB в этот момент.
 */
struct BalanceReference {
    Date date;
    int64_t sequence = 0;
    Decimal balance;

    bool operator==(const BalanceReference& other) const {
        return date == other.date && sequence == other.sequence && balance == other.balance;
    }
};

} // namespace ledger::domain
