#pragma once

#include "domain/BalanceReference.hpp"
#include "domain/Date.hpp"
#include "domain/Decimal.hpp"
#include "domain/LossSnapshot.hpp"
#include "domain/Transaction.hpp"
#include <optional>
#include <vector>

namespace ledger::application::engine {

/**
 * @brief Источник текущего баланса (CB)
 *
 * Без активного снимка: последняя запись BALANCE_RECORD (с её корректировкой)
 * плюс FUNDING и ADJUSTMENT после неё; без записей база равна 0, то есть
 * CB = сумма пополнений.
 * С активным снимком: замороженный баланс плюс FUNDING после точки заморозки.
 * Записи баланса во время активного снимка сохраняются, но не учитываются.
 */
class BalanceOracle {
public:
    static domain::Decimal currentBalance(const std::vector<domain::Transaction>& transactions,
                                          const domain::LossSnapshot* activeSnapshot) {
        if (activeSnapshot) {
            return frozenBalance(transactions, activeSnapshot->balanceReference);
        }

        const domain::Transaction* latest = latestBalanceRecord(transactions);
        domain::Decimal balance;
        if (latest) {
            balance = latest->amount + latest->adjustment;
        }
        for (const auto& tx : transactions) {
            if (tx.kind != domain::TransactionKind::FUNDING &&
                tx.kind != domain::TransactionKind::ADJUSTMENT) {
                continue;
            }
            if (!latest || tx.isAfter(*latest)) {
                balance += tx.amount;
            }
        }
        return balance;
    }

    static domain::Decimal frozenBalance(const std::vector<domain::Transaction>& transactions,
                                         const domain::BalanceReference& reference) {
        domain::Decimal balance = reference.balance;
        for (const auto& tx : transactions) {
            if (tx.kind == domain::TransactionKind::FUNDING &&
                tx.isAfter(reference.date, reference.sequence)) {
                balance += tx.amount;
            }
        }
        return balance;
    }

    /**
     * @brief Точка заморозки для нового снимка
     *
     * Ключ последней записи, влияющей на баланс (FUNDING, BALANCE_RECORD,
     * ADJUSTMENT), и текущий CB. Без таких записей — fallbackDate и 0.
     */
    static domain::BalanceReference referencePoint(const std::vector<domain::Transaction>& transactions,
                                                   const domain::Date& fallbackDate) {
        domain::BalanceReference reference;
        reference.date = fallbackDate;
        const domain::Transaction* latest = nullptr;
        for (const auto& tx : transactions) {
            if (!affectsBalance(tx.kind)) {
                continue;
            }
            if (!latest || tx.isAfter(*latest)) {
                latest = &tx;
            }
        }
        if (latest) {
            reference.date = latest->date;
            reference.sequence = latest->sequence;
        }
        reference.balance = currentBalance(transactions, nullptr);
        return reference;
    }

private:
    static bool affectsBalance(domain::TransactionKind kind) {
        return kind == domain::TransactionKind::FUNDING
            || kind == domain::TransactionKind::BALANCE_RECORD
            || kind == domain::TransactionKind::ADJUSTMENT;
    }

    static const domain::Transaction* latestBalanceRecord(const std::vector<domain::Transaction>& transactions) {
        const domain::Transaction* latest = nullptr;
        for (const auto& tx : transactions) {
            if (tx.kind != domain::TransactionKind::BALANCE_RECORD) {
                continue;
            }
            if (!latest || tx.isAfter(*latest)) {
                latest = &tx;
            }
        }
        return latest;
    }
};

} // namespace ledger::application::engine
