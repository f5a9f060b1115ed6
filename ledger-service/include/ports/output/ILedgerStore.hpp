#pragma once

#include "domain/Account.hpp"
#include "domain/BeneficiarySplit.hpp"
#include "domain/Decimal.hpp"
#include "domain/LossSnapshot.hpp"
#include "domain/Transaction.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledger::ports::output {

enum class LockMode {
    SHARED,     ///< Только чтение зафиксированного состояния
    EXCLUSIVE   ///< Изменение агрегата, операции по счёту строго последовательны
};

/**
 * @brief Единица работы над одним агрегатом счёта
 *
 * Чтения видят собственные незафиксированные записи.
 * Сессия без commit() откатывается в деструкторе.
 */
class ILedgerSession {
public:
    virtual ~ILedgerSession() = default;

    virtual domain::Account account() = 0;

    /// Журнал счёта в порядке (date, sequence)
    virtual std::vector<domain::Transaction> transactions() = 0;

    /// Снимки счёта в порядке создания
    virtual std::vector<domain::LossSnapshot> snapshots() = 0;

    /// Поиск по всем счетам: settlement_id уникален глобально
    virtual std::optional<domain::Transaction> findBySettlementId(const std::string& settlementId) = 0;

    /**
     * @brief Добавить запись
     * @return запись с назначенными id и sequence
     * @throws domain::ConstraintViolationException при повторе settlement_id
     */
    virtual domain::Transaction append(const domain::Transaction& transaction) = 0;

    /**
     * @throws domain::ConstraintViolationException если у счёта уже есть активный снимок
     */
    virtual void openSnapshot(const domain::LossSnapshot& snapshot) = 0;

    virtual void markSnapshotSettled(const std::string& snapshotId) = 0;

    virtual void updateCaches(const domain::Decimal& capital, const domain::Decimal& balance) = 0;

    virtual void updateShareDefaults(const domain::BeneficiarySplit& lossSplit,
                                     const domain::BeneficiarySplit& profitSplit) = 0;

    virtual void commit() = 0;
};

/**
 * @brief Хранилище журнала (append-only)
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    /**
     * @brief Открыть единицу работы по счёту
     * @throws domain::AccountNotFoundException
     * @throws domain::ConcurrencyConflictException по таймауту блокировки
     */
    virtual std::unique_ptr<ILedgerSession> begin(const std::string& accountId, LockMode mode) = 0;

    virtual domain::Account createAccount(const domain::Account& account) = 0;

    virtual std::vector<std::string> accountIds() = 0;
};

} // namespace ledger::ports::output
