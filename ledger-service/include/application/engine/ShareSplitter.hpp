#pragma once

#include "MoneyPolicy.hpp"
#include "domain/BeneficiarySplit.hpp"
#include "domain/Decimal.hpp"

namespace ledger::application::engine {

/**
 * @brief Распределение суммы между двумя получателями
 */
struct ShareAllocation {
    domain::Decimal total;
    domain::Decimal first;
    domain::Decimal second;
};

/**
 * @brief Делитель долей без утечки денег
 *
 * Округляется только одна сторона, вторая получает остаток,
 * поэтому first + second == total всегда точно.
 */
class ShareSplitter {
public:
    /**
     * @brief Доли от суммы в share-space
     *
     * total = вниз(amount × (a+b) / 100), first = вниз(amount × a / 100),
     * second = total − first.
     *
     * @example
     * ```cpp
     * auto s = ShareSplitter::split(Decimal::parse("95"), Decimal::parse("1"), Decimal::parse("9"));
     * // s.total == 9.5, s.first == 0.9, s.second == 8.6
     * ```
     */
    static ShareAllocation split(const domain::Decimal& amount,
                                 const domain::Decimal& pctA,
                                 const domain::Decimal& pctB) {
        ShareAllocation allocation;
        allocation.total = MoneyPolicy::shareOf(amount, pctA + pctB);
        allocation.first = MoneyPolicy::shareOf(amount, pctA);
        allocation.second = allocation.total - allocation.first;
        return allocation;
    }

    static ShareAllocation split(const domain::Decimal& amount, const domain::BeneficiarySplit& beneficiaries) {
        return split(amount, beneficiaries.myPct(), beneficiaries.counterpartyPct());
    }

    /**
     * @brief Разделить уже известную сумму пропорционально долям
     *
     * first = вниз(total × my / (my+counterparty)) до decimals знаков,
     * second = total − first.
     */
    static ShareAllocation apportion(const domain::Decimal& total,
                                     const domain::BeneficiarySplit& beneficiaries,
                                     int decimals) {
        ShareAllocation allocation;
        allocation.total = total;
        auto totalPct = beneficiaries.totalPct();
        if (totalPct.isZero()) {
            allocation.first = domain::Decimal::zero();
        } else {
            allocation.first = total.mulDiv(beneficiaries.myPct(), totalPct, decimals,
                                            domain::RoundingMode::DOWN);
        }
        allocation.second = total - allocation.first;
        return allocation;
    }
};

} // namespace ledger::application::engine
