#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/engine/LedgerProjector.hpp"
#include "application/engine/LossSnapshotManager.hpp"
#include "application/engine/UnitOfWork.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Сервис журнала: пополнения, записи баланса и проекции
 *
 * Пополнение запрещено, пока у счёта есть активный снимок.
 * Запись баланса принимается всегда, но при активном снимке
 * начинает действовать только после его закрытия.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    explicit LedgerService(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {
        std::cout << "[LedgerService] Created" << std::endl;
    }

    domain::LedgerResult createFunding(const std::string& accountId,
                                       const domain::Decimal& amount,
                                       const domain::Date& date,
                                       const std::string& note) override {
        if (!amount.isPositive()) {
            return domain::LedgerResult::failure(domain::LedgerStatus::INVALID_AMOUNT,
                                                 "Funding amount must be positive");
        }

        return mutate(accountId, date, [&](ports::output::ILedgerSession& session) {
            if (auto active = engine::LossSnapshotManager::active(session.snapshots())) {
                std::cout << "[LedgerService] Funding blocked on " << accountId
                          << ": active " << toString(active->kind) << " snapshot " << active->id << std::endl;
                return std::optional<domain::LedgerResult>(domain::LedgerResult::failure(
                    domain::LedgerStatus::FUNDING_BLOCKED,
                    "Funding is blocked while " + toString(active->kind) + " snapshot " + active->id + " is active"));
            }
            return std::optional<domain::LedgerResult>();
        }, domain::Transaction::funding(accountId, amount, date, note));
    }

    domain::LedgerResult createBalanceRecord(const std::string& accountId,
                                             const domain::Decimal& balance,
                                             const domain::Date& date,
                                             const std::string& note,
                                             const domain::Decimal& adjustment) override {
        if (balance.isNegative()) {
            return domain::LedgerResult::failure(domain::LedgerStatus::INVALID_AMOUNT,
                                                 "Balance must not be negative");
        }

        return mutate(accountId, date, [](ports::output::ILedgerSession&) {
            return std::optional<domain::LedgerResult>();
        }, domain::Transaction::balanceRecord(accountId, balance, adjustment, date, note));
    }

    std::optional<domain::LedgerState> getState(const std::string& accountId) override {
        return project(accountId, std::nullopt);
    }

    std::optional<domain::LedgerState> getStateAsOf(const std::string& accountId,
                                                    const domain::Date& date) override {
        return project(accountId, date);
    }

    std::optional<std::vector<domain::Transaction>> getTransactions(const std::string& accountId) override {
        try {
            auto session = store_->begin(accountId, ports::output::LockMode::SHARED);
            return session->transactions();
        } catch (const domain::AccountNotFoundException&) {
            return std::nullopt;
        }
    }

    std::vector<domain::PendingEntry> getPendingSummary() override {
        std::vector<domain::PendingEntry> entries;
        for (const auto& accountId : store_->accountIds()) {
            try {
                auto session = store_->begin(accountId, ports::output::LockMode::SHARED);
                auto account = session->account();
                auto state = engine::LedgerProjector::project(account, session->transactions(), session->snapshots());
                if (!state.activeSnapshotId) {
                    continue;
                }

                domain::PendingEntry entry;
                entry.accountId = account.accountId;
                entry.clientName = account.clientName;
                entry.exchangeName = account.exchangeName;
                entry.snapshotId = *state.activeSnapshotId;
                entry.kind = state.position == domain::AccountPosition::PROFIT
                                 ? domain::SnapshotKind::PROFIT
                                 : domain::SnapshotKind::LOSS;
                entry.remaining = entry.kind == domain::SnapshotKind::LOSS ? state.remainingLoss
                                                                           : state.remainingProfit;
                entry.pending = state.pending;
                entry.myShare = state.pendingMyShare;
                entry.counterpartyShare = state.pendingCounterpartyShare;
                entries.push_back(entry);

            } catch (const domain::AccountNotFoundException&) {
                continue;
            }
        }

        std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            return a.pending > b.pending;
        });
        return entries;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;

    template <typename Guard>
    domain::LedgerResult mutate(const std::string& accountId,
                                const domain::Date& date,
                                Guard guard,
                                const domain::Transaction& transaction) {
        try {
            auto session = store_->begin(accountId, ports::output::LockMode::EXCLUSIVE);

            if (auto rejected = guard(*session)) {
                return *rejected;
            }

            auto stored = session->append(transaction);

            auto report = engine::UnitOfWork::finalize(*session, date);
            if (!report.ok()) {
                std::cerr << "[LedgerService] INVARIANT VIOLATION, rolled back: account=" << accountId
                          << " kind=" << toString(transaction.kind)
                          << " amount=" << transaction.amount
                          << " date=" << date.toString()
                          << " violations=[" << report.summary() << "]" << std::endl;
                return domain::LedgerResult::failure(domain::LedgerStatus::INVARIANT_VIOLATION, report.summary());
            }

            auto state = engine::LedgerProjector::project(session->account(), session->transactions(),
                                                          session->snapshots());
            session->commit();

            std::cout << "[LedgerService] " << toString(stored.kind) << " " << stored.amount
                      << " on " << accountId << " -> " << toString(state.position)
                      << " capital=" << state.capital << " balance=" << state.currentBalance << std::endl;

            return domain::LedgerResult::ok(stored, state);

        } catch (const domain::AccountNotFoundException& e) {
            return domain::LedgerResult::failure(domain::LedgerStatus::ACCOUNT_NOT_FOUND, e.what());

        } catch (const domain::ConcurrencyConflictException& e) {
            std::cerr << "[LedgerService] Lock timeout on " << accountId << ": " << e.what() << std::endl;
            return domain::LedgerResult::failure(domain::LedgerStatus::CONCURRENCY_CONFLICT, e.what());

        } catch (const domain::ConstraintViolationException& e) {
            std::cerr << "[LedgerService] Storage constraint rejected write on " << accountId
                      << ": " << e.what() << std::endl;
            return domain::LedgerResult::failure(domain::LedgerStatus::INVARIANT_VIOLATION, e.what());

        } catch (const domain::LedgerException& e) {
            std::cerr << "[LedgerService] Storage failure on " << accountId << ": " << e.what() << std::endl;
            return domain::LedgerResult::failure(domain::LedgerStatus::INVARIANT_VIOLATION, e.what());
        }
    }

    std::optional<domain::LedgerState> project(const std::string& accountId, std::optional<domain::Date> asOf) {
        try {
            auto session = store_->begin(accountId, ports::output::LockMode::SHARED);
            return engine::LedgerProjector::project(session->account(), session->transactions(),
                                                    session->snapshots(), asOf);
        } catch (const domain::AccountNotFoundException&) {
            return std::nullopt;
        }
    }
};

} // namespace ledger::application
