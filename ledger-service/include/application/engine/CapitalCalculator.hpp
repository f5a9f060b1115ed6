#pragma once

#include "domain/Decimal.hpp"
#include "domain/Transaction.hpp"
#include <vector>

namespace ledger::application::engine {

/**
 * @brief CAPITAL = Σ FUNDING − Σ capital_closed
 *
 * Всегда пересчитывается из журнала, ничего не хранит.
 */
class CapitalCalculator {
public:
    static domain::Decimal totalFunding(const std::vector<domain::Transaction>& transactions) {
        domain::Decimal total;
        for (const auto& tx : transactions) {
            if (tx.kind == domain::TransactionKind::FUNDING) {
                total += tx.amount;
            }
        }
        return total;
    }

    static domain::Decimal totalCapitalClosed(const std::vector<domain::Transaction>& transactions) {
        domain::Decimal total;
        for (const auto& tx : transactions) {
            if (tx.kind == domain::TransactionKind::SETTLEMENT && tx.capitalClosed) {
                total += *tx.capitalClosed;
            }
        }
        return total;
    }

    static domain::Decimal capital(const std::vector<domain::Transaction>& transactions) {
        return totalFunding(transactions) - totalCapitalClosed(transactions);
    }
};

} // namespace ledger::application::engine
