#pragma once

#include "BalanceOracle.hpp"
#include "CapitalCalculator.hpp"
#include "InvariantEnforcer.hpp"
#include "LossSnapshotManager.hpp"
#include "domain/Date.hpp"
#include "ports/output/ILedgerStore.hpp"

namespace ledger::application::engine {

/**
 * @brief Завершение изменяющей единицы работы перед commit
 *
 * Порядок: сверка снимков, обновление кэшей агрегата, проверка
 * инвариантов. Все чтения идут через ту же сессию (read-your-writes).
 */
class UnitOfWork {
public:
    static InvariantReport finalize(ports::output::ILedgerSession& session, const domain::Date& date) {
        LossSnapshotManager::reconcile(session, date);
        refreshCaches(session);
        return InvariantEnforcer::check(session.account(), session.transactions(), session.snapshots());
    }

    static void refreshCaches(ports::output::ILedgerSession& session) {
        auto transactions = session.transactions();
        auto snapshots = session.snapshots();
        auto activeSnapshot = LossSnapshotManager::active(snapshots);
        session.updateCaches(CapitalCalculator::capital(transactions),
                             BalanceOracle::currentBalance(transactions, activeSnapshot ? &*activeSnapshot : nullptr));
    }
};

} // namespace ledger::application::engine
