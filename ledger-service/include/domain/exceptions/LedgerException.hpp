#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Базовое исключение инфраструктуры журнала
 *
 * Ожидаемые отказы (валидация, дубликаты) возвращаются результатами,
 * исключения — только для сбоев хранилища и блокировок.
 */
class LedgerException : public std::runtime_error {
public:
    explicit LedgerException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Таймаут ожидания блокировки счёта, операцию можно повторить
 */
class ConcurrencyConflictException : public LedgerException {
public:
    explicit ConcurrencyConflictException(const std::string& message)
        : LedgerException(message) {}
};

/**
 * @brief Нарушено ограничение уникальности хранилища
 */
class ConstraintViolationException : public LedgerException {
public:
    explicit ConstraintViolationException(const std::string& message)
        : LedgerException(message) {}
};

class AccountNotFoundException : public LedgerException {
public:
    explicit AccountNotFoundException(const std::string& accountId)
        : LedgerException("Account not found: " + accountId) {}
};

} // namespace ledger::domain
