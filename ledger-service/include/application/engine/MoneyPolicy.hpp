#pragma once

#include "domain/Decimal.hpp"

namespace ledger::application::engine {

/**
 * @brief Политика округления денег
 *
 * share-space (то, что платит клиент) — вниз до 1 знака,
 * capital-space (учёт капитала) — половина вверх до 2 знаков.
 * Остаток меньше порога закрывается явной записью в журнале.
 */
class MoneyPolicy {
public:
    static constexpr int SHARE_DECIMALS = 1;
    static constexpr int CAPITAL_DECIMALS = 2;

    /// AUTO_CLOSE_THRESHOLD = 0.01
    static domain::Decimal threshold() {
        return domain::Decimal::fromMicros(10000);
    }

    static domain::Decimal roundShare(const domain::Decimal& value) {
        return value.round(SHARE_DECIMALS, domain::RoundingMode::DOWN);
    }

    static domain::Decimal roundCapital(const domain::Decimal& value) {
        return value.round(CAPITAL_DECIMALS, domain::RoundingMode::HALF_UP);
    }

    static bool isEffectivelyZero(const domain::Decimal& value) {
        return value.abs() < threshold();
    }

    /**
     * @brief amount × pct / 100 с округлением вниз в share-space
     */
    static domain::Decimal shareOf(const domain::Decimal& amount, const domain::Decimal& pct) {
        return amount.mulDiv(pct, domain::Decimal::hundred(), SHARE_DECIMALS, domain::RoundingMode::DOWN);
    }

    /**
     * @brief payment × 100 / pct с округлением половина вверх в capital-space
     */
    static domain::Decimal capitalOf(const domain::Decimal& payment, const domain::Decimal& pct) {
        return payment.mulDiv(domain::Decimal::hundred(), pct, CAPITAL_DECIMALS, domain::RoundingMode::HALF_UP);
    }
};

} // namespace ledger::application::engine
