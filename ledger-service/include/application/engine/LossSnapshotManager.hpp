#pragma once

#include "BalanceOracle.hpp"
#include "CapitalCalculator.hpp"
#include "LossProfitResolver.hpp"
#include "MoneyPolicy.hpp"
#include "domain/Date.hpp"
#include "domain/LossSnapshot.hpp"
#include "domain/Transaction.hpp"
#include "domain/enums/AccountPosition.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <optional>
#include <vector>

namespace ledger::application::engine {

enum class ReconcileAction {
    NONE,
    SNAPSHOT_OPENED,
    RESIDUAL_ADJUSTED
};

/**
 * @brief Автомат NEUTRAL → LOSS/PROFIT → NEUTRAL и работа со снимками
 *
 * Остаток снимка не хранится: amount минус закрытый капитал
 * привязанных к снимку сделок.
 */
class LossSnapshotManager {
public:
    static std::optional<domain::LossSnapshot> active(const std::vector<domain::LossSnapshot>& snapshots) {
        for (const auto& snapshot : snapshots) {
            if (!snapshot.isSettled) {
                return snapshot;
            }
        }
        return std::nullopt;
    }

    static std::optional<domain::LossSnapshot> latestSettledOfKind(const std::vector<domain::LossSnapshot>& snapshots,
                                                                    domain::SnapshotKind kind) {
        for (auto it = snapshots.rbegin(); it != snapshots.rend(); ++it) {
            if (it->kind == kind && it->isSettled) {
                return *it;
            }
        }
        return std::nullopt;
    }

    static std::optional<domain::LossSnapshot> findById(const std::vector<domain::LossSnapshot>& snapshots,
                                                        const std::string& snapshotId) {
        for (const auto& snapshot : snapshots) {
            if (snapshot.id == snapshotId) {
                return snapshot;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Закрытая часть снимка (модуль), только сделки с sequence ≤ upToSequence
     */
    static domain::Decimal closedAmount(const domain::LossSnapshot& snapshot,
                                        const std::vector<domain::Transaction>& transactions,
                                        std::optional<int64_t> upToSequence = std::nullopt) {
        domain::Decimal closed;
        for (const auto& tx : transactions) {
            if (tx.kind != domain::TransactionKind::SETTLEMENT || !tx.capitalClosed ||
                tx.snapshotId != snapshot.id) {
                continue;
            }
            if (upToSequence && tx.sequence > *upToSequence) {
                continue;
            }
            closed += snapshot.isLoss() ? *tx.capitalClosed : -*tx.capitalClosed;
        }
        return closed;
    }

    static domain::Decimal remaining(const domain::LossSnapshot& snapshot,
                                     const std::vector<domain::Transaction>& transactions) {
        return snapshot.amount - closedAmount(snapshot, transactions);
    }

    /**
     * @brief Остаток сразу после сделки с данным sequence
     */
    static domain::Decimal remainingAfter(const domain::LossSnapshot& snapshot,
                                          const std::vector<domain::Transaction>& transactions,
                                          int64_t sequence) {
        return snapshot.amount - closedAmount(snapshot, transactions, sequence);
    }

    /**
     * @brief LOSS ↔ PROFIT напрямую запрещено, только через NEUTRAL
     */
    static bool canTransition(domain::AccountPosition from, domain::AccountPosition to) {
        if (from == domain::AccountPosition::LOSS && to == domain::AccountPosition::PROFIT) {
            return false;
        }
        if (from == domain::AccountPosition::PROFIT && to == domain::AccountPosition::LOSS) {
            return false;
        }
        return true;
    }

    /**
     * @brief Привести снимки в соответствие с журналом в конце единицы работы
     *
     * Пока снимок активен, ничего не делает. Иначе при LOSS/PROFIT ≥ порога
     * открывает снимок с замороженными долями счёта и пишет аудит-запись,
     * а остаток меньше порога закрывает записью ADJUSTMENT.
     *
     * @throws domain::ConstraintViolationException если хранилище отклонило снимок
     */
    static ReconcileAction reconcile(ports::output::ILedgerSession& session, const domain::Date& date) {
        auto snapshots = session.snapshots();
        if (active(snapshots)) {
            return ReconcileAction::NONE;
        }

        auto transactions = session.transactions();
        auto capital = CapitalCalculator::capital(transactions);
        auto balance = BalanceOracle::currentBalance(transactions, nullptr);
        auto classification = LossProfitResolver::classify(capital, balance);

        if (classification.position == domain::AccountPosition::NEUTRAL) {
            return ReconcileAction::NONE;
        }

        auto account = session.account();
        if (classification.isResidual()) {
            auto delta = capital - balance;
            auto adjustment = domain::Transaction::balanceAdjustment(
                account.accountId, delta, date,
                "Auto-close residual " + toString(classification.position));
            session.append(adjustment);
            std::cout << "[LossSnapshotManager] Residual closed for " << account.accountId
                      << ": delta=" << delta << std::endl;
            return ReconcileAction::RESIDUAL_ADJUSTED;
        }

        bool isLoss = classification.position == domain::AccountPosition::LOSS;

        domain::LossSnapshot snapshot;
        snapshot.id = utils::UuidGenerator::generateWithPrefix("snp");
        snapshot.accountId = account.accountId;
        snapshot.kind = isLoss ? domain::SnapshotKind::LOSS : domain::SnapshotKind::PROFIT;
        snapshot.balanceReference = BalanceOracle::referencePoint(transactions, date);
        snapshot.amount = isLoss ? classification.loss : classification.profit;
        snapshot.split = isLoss ? account.lossSplit : account.profitSplit;
        session.openSnapshot(snapshot);

        domain::Transaction audit;
        audit.accountId = account.accountId;
        audit.kind = isLoss ? domain::TransactionKind::LOSS : domain::TransactionKind::PROFIT;
        audit.amount = snapshot.amount;
        audit.date = date;
        audit.snapshotId = snapshot.id;
        audit.note = toString(snapshot.kind) + " snapshot opened";
        session.append(audit);

        std::cout << "[LossSnapshotManager] Opened " << toString(snapshot.kind) << " snapshot "
                  << snapshot.id << " for " << account.accountId
                  << ": amount=" << snapshot.amount
                  << " frozenBalance=" << snapshot.balanceReference.balance << std::endl;
        return ReconcileAction::SNAPSHOT_OPENED;
    }
};

} // namespace ledger::application::engine
