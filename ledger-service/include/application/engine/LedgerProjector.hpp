#pragma once

#include "BalanceOracle.hpp"
#include "CapitalCalculator.hpp"
#include "LossProfitResolver.hpp"
#include "LossSnapshotManager.hpp"
#include "MoneyPolicy.hpp"
#include "ShareSplitter.hpp"
#include "domain/Account.hpp"
#include "domain/Date.hpp"
#include "domain/LedgerState.hpp"
#include "domain/LossSnapshot.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <vector>

namespace ledger::application::engine {

/**
 * @brief Сборка LedgerState из журнала
 *
 * С asOf учитываются только записи с датой ≤ asOf; снимок считается
 * активным на эту дату, если он открыт не позже неё и остаток по
 * сделкам до этой даты не меньше порога.
 */
class LedgerProjector {
public:
    static domain::LedgerState project(const domain::Account& account,
                                       const std::vector<domain::Transaction>& transactions,
                                       const std::vector<domain::LossSnapshot>& snapshots,
                                       std::optional<domain::Date> asOf = std::nullopt) {
        std::vector<domain::Transaction> visible;
        std::optional<domain::LossSnapshot> activeSnapshot;

        if (asOf) {
            for (const auto& tx : transactions) {
                if (tx.date <= *asOf) {
                    visible.push_back(tx);
                }
            }
            activeSnapshot = activeAt(snapshots, visible, *asOf);
        } else {
            visible = transactions;
            activeSnapshot = LossSnapshotManager::active(snapshots);
        }

        domain::LedgerState state;
        state.accountId = account.accountId;
        state.asOf = asOf;
        state.cachedCapital = account.cachedCapital;
        state.cachedBalance = account.cachedBalance;
        state.capital = CapitalCalculator::capital(visible);
        state.currentBalance = BalanceOracle::currentBalance(visible, activeSnapshot ? &*activeSnapshot : nullptr);

        auto classification = LossProfitResolver::classify(state.capital, state.currentBalance);
        state.loss = classification.loss;
        state.profit = classification.profit;
        state.position = classification.position;

        if (activeSnapshot) {
            auto remaining = LossSnapshotManager::remaining(*activeSnapshot, visible);
            auto shares = ShareSplitter::split(remaining, activeSnapshot->split);
            state.activeSnapshotId = activeSnapshot->id;
            state.position = activeSnapshot->isLoss() ? domain::AccountPosition::LOSS
                                                      : domain::AccountPosition::PROFIT;
            state.pending = shares.total;
            state.pendingMyShare = shares.first;
            state.pendingCounterpartyShare = shares.second;
            if (activeSnapshot->isLoss()) {
                state.remainingLoss = remaining;
            } else {
                state.remainingProfit = remaining;
            }
        }

        return state;
    }

private:
    static std::optional<domain::LossSnapshot> activeAt(const std::vector<domain::LossSnapshot>& snapshots,
                                                        const std::vector<domain::Transaction>& visible,
                                                        const domain::Date& asOf) {
        std::optional<domain::LossSnapshot> result;
        for (const auto& snapshot : snapshots) {
            if (snapshot.balanceReference.date > asOf) {
                continue;
            }
            auto remaining = LossSnapshotManager::remaining(snapshot, visible);
            if (remaining >= MoneyPolicy::threshold()) {
                result = snapshot;
            }
        }
        return result;
    }
};

} // namespace ledger::application::engine
