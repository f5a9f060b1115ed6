#pragma once

#include "BalanceReference.hpp"
#include "BeneficiarySplit.hpp"
#include "Decimal.hpp"
#include "enums/SnapshotKind.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Замороженный эпизод убытка (или прибыли к выплате)
 *
 * amount и split фиксируются при создании и больше не меняются.
 * Остаток всегда вычисляется из журнала: amount минус закрытый капитал
 * сделок SETTLEMENT с этим snapshotId. Меняться может только isSettled.
 */
struct LossSnapshot {
    std::string id;
    std::string accountId;
    SnapshotKind kind = SnapshotKind::LOSS;
    BalanceReference balanceReference;
    Decimal amount;
    BeneficiarySplit split;
    bool isSettled = false;

    bool isLoss() const { return kind == SnapshotKind::LOSS; }

    /**
     * @brief Знак capital_closed в журнале: +1 для убытка, -1 для прибыли
     */
    int capitalSign() const { return isLoss() ? 1 : -1; }
};

} // namespace ledger::domain
