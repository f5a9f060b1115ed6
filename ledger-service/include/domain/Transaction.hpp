#pragma once

#include "BalanceReference.hpp"
#include "Date.hpp"
#include "Decimal.hpp"
#include "enums/TransactionKind.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Неизменяемая запись журнала
 *
 * После добавления в хранилище запись не изменяется и не удаляется.
 * sequence назначает хранилище; порядок записей — ключ (date, sequence).
 */
struct Transaction {
    std::string id;
    std::string accountId;
    int64_t sequence = 0;
    Date date;
    TransactionKind kind = TransactionKind::FUNDING;
    Decimal amount;

    // SETTLEMENT
    std::optional<Decimal> capitalClosed;       ///< Отрицательный для выплаты прибыли
    Decimal yourShareAmount;
    Decimal counterpartyShareAmount;
    std::optional<std::string> settlementId;
    std::optional<BalanceReference> balanceReference;

    std::optional<std::string> snapshotId;      ///< SETTLEMENT, LOSS, PROFIT
    Decimal adjustment;                         ///< Доп. корректировка BALANCE_RECORD
    std::string note;

    /**
     * @brief Запись строго позже ключа (date, sequence)
     */
    bool isAfter(const Date& otherDate, int64_t otherSequence) const {
        return date > otherDate || (date == otherDate && sequence > otherSequence);
    }

    bool isAfter(const Transaction& other) const {
        return isAfter(other.date, other.sequence);
    }

    static Transaction funding(const std::string& accountId, const Decimal& amount,
                               const Date& date, const std::string& note = "") {
        Transaction tx;
        tx.accountId = accountId;
        tx.kind = TransactionKind::FUNDING;
        tx.amount = amount;
        tx.date = date;
        tx.note = note;
        return tx;
    }

    static Transaction balanceRecord(const std::string& accountId, const Decimal& balance,
                                     const Decimal& adjustment, const Date& date,
                                     const std::string& note = "") {
        Transaction tx;
        tx.accountId = accountId;
        tx.kind = TransactionKind::BALANCE_RECORD;
        tx.amount = balance;
        tx.adjustment = adjustment;
        tx.date = date;
        tx.note = note;
        return tx;
    }

    static Transaction balanceAdjustment(const std::string& accountId, const Decimal& delta,
                                         const Date& date, const std::string& note) {
        Transaction tx;
        tx.accountId = accountId;
        tx.kind = TransactionKind::ADJUSTMENT;
        tx.amount = delta;
        tx.date = date;
        tx.note = note;
        return tx;
    }
};

} // namespace ledger::domain
