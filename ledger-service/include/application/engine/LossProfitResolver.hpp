#pragma once

#include "MoneyPolicy.hpp"
#include "domain/Decimal.hpp"
#include "domain/enums/AccountPosition.hpp"

namespace ledger::application::engine {

struct Classification {
    domain::AccountPosition position = domain::AccountPosition::NEUTRAL;
    domain::Decimal loss;
    domain::Decimal profit;

    /// Ненулевой, но меньше порога остаток
    bool isResidual() const {
        auto amount = loss.isPositive() ? loss : profit;
        return amount.isPositive() && MoneyPolicy::isEffectivelyZero(amount);
    }
};

/**
 * @brief LOSS = max(CAPITAL − CB, 0), PROFIT = max(CB − CAPITAL, 0)
 *
 * Значения точные, порог здесь не применяется: остаток меньше порога
 * закрывает LossSnapshotManager явной записью.
 */
class LossProfitResolver {
public:
    static Classification classify(const domain::Decimal& capital, const domain::Decimal& balance) {
        Classification result;
        result.loss = domain::Decimal::max(capital - balance, domain::Decimal::zero());
        result.profit = domain::Decimal::max(balance - capital, domain::Decimal::zero());
        if (result.loss.isPositive()) {
            result.position = domain::AccountPosition::LOSS;
        } else if (result.profit.isPositive()) {
            result.position = domain::AccountPosition::PROFIT;
        }
        return result;
    }
};

} // namespace ledger::application::engine
