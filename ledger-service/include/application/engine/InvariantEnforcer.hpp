#pragma once

#include "BalanceOracle.hpp"
#include "CapitalCalculator.hpp"
#include "LossProfitResolver.hpp"
#include "LossSnapshotManager.hpp"
#include "MoneyPolicy.hpp"
#include "domain/Account.hpp"
#include "domain/LossSnapshot.hpp"
#include "domain/Transaction.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace ledger::application::engine {

struct InvariantReport {
    std::vector<std::string> violations;

    bool ok() const { return violations.empty(); }

    std::string summary() const {
        std::ostringstream ss;
        for (size_t i = 0; i < violations.size(); ++i) {
            if (i > 0) ss << "; ";
            ss << violations[i];
        }
        return ss.str();
    }
};

/**
 * @brief Проверка инвариантов журнала перед commit
 *
 * Любое нарушение означает ошибку в коде: операция отменяется целиком,
 * ничего не исправляется автоматически.
 */
class InvariantEnforcer {
public:
    static InvariantReport check(const domain::Account& account,
                                 const std::vector<domain::Transaction>& transactions,
                                 const std::vector<domain::LossSnapshot>& snapshots) {
        InvariantReport report;
        auto tolerance = MoneyPolicy::threshold();

        auto funding = CapitalCalculator::totalFunding(transactions);
        auto closed = CapitalCalculator::totalCapitalClosed(transactions);
        auto capital = funding - closed;

        if ((account.cachedCapital - capital).abs() >= tolerance) {
            report.violations.push_back("cached capital " + account.cachedCapital.toString() +
                                        " != ledger capital " + capital.toString());
        }

        if (closed > funding) {
            report.violations.push_back("capital closed " + closed.toString() +
                                        " exceeds funding " + funding.toString());
        }

        int activeCount = 0;
        for (const auto& snapshot : snapshots) {
            if (!snapshot.isSettled) {
                ++activeCount;
            }
            if (!snapshot.amount.isPositive()) {
                report.violations.push_back("snapshot " + snapshot.id + " has non-positive amount");
            }
        }
        if (activeCount > 1) {
            report.violations.push_back(std::to_string(activeCount) + " active snapshots");
        }

        auto activeSnapshot = LossSnapshotManager::active(snapshots);
        auto balance = BalanceOracle::currentBalance(transactions, activeSnapshot ? &*activeSnapshot : nullptr);
        auto classification = LossProfitResolver::classify(capital, balance);

        if (classification.loss.isPositive() && classification.profit.isPositive()) {
            report.violations.push_back("loss and profit both positive");
        }

        if ((account.cachedBalance - balance).abs() >= tolerance) {
            report.violations.push_back("cached balance " + account.cachedBalance.toString() +
                                        " != derived balance " + balance.toString());
        }

        if (activeSnapshot) {
            auto position = activeSnapshot->isLoss() ? domain::AccountPosition::LOSS
                                                     : domain::AccountPosition::PROFIT;
            if (!LossSnapshotManager::canTransition(position, classification.position)) {
                report.violations.push_back("active " + toString(activeSnapshot->kind) +
                                            " snapshot but ledger shows " +
                                            toString(classification.position) +
                                            " (capital=" + capital.toString() +
                                            ", balance=" + balance.toString() + ")");
            }

            auto remaining = LossSnapshotManager::remaining(*activeSnapshot, transactions);
            auto expected = activeSnapshot->isLoss() ? classification.loss : classification.profit;
            if (remaining.isNegative()) {
                report.violations.push_back("snapshot " + activeSnapshot->id + " remaining is negative");
            }
            if ((remaining - expected).abs() >= tolerance) {
                report.violations.push_back("snapshot " + activeSnapshot->id + " remaining " +
                                            remaining.toString() + " != derived " + expected.toString());
            }
            if (!activeSnapshot->split.isValid()) {
                report.violations.push_back("snapshot " + activeSnapshot->id + " has invalid split");
            }
        } else if (classification.position != domain::AccountPosition::NEUTRAL) {
            report.violations.push_back("unsnapshotted " + toString(classification.position) +
                                        " (capital=" + capital.toString() +
                                        ", balance=" + balance.toString() + ")");
        }

        for (const auto& tx : transactions) {
            if (tx.kind != domain::TransactionKind::SETTLEMENT) {
                continue;
            }
            if (!tx.capitalClosed || !tx.settlementId || !tx.snapshotId) {
                report.violations.push_back("settlement " + tx.id + " is incomplete");
                continue;
            }
            auto allocated = tx.yourShareAmount + tx.counterpartyShareAmount;
            if ((allocated - *tx.capitalClosed).abs() >= tolerance) {
                report.violations.push_back("settlement " + tx.id + " allocations " + allocated.toString() +
                                            " != capital closed " + tx.capitalClosed->toString());
            }
        }

        return report;
    }
};

} // namespace ledger::application::engine
