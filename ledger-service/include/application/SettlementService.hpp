#pragma once

#include "ports/input/ISettlementService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/engine/LossSnapshotManager.hpp"
#include "application/engine/MoneyPolicy.hpp"
#include "application/engine/SettlementIdGenerator.hpp"
#include "application/engine/ShareSplitter.hpp"
#include "application/engine/UnitOfWork.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace ledger::application {

/**
 * @brief Процессор оплат по активному снимку
 *
 * Вся операция выполняется в одной эксклюзивной единице работы по счёту:
 * идемпотентность → валидация в share-space → перевод в capital-space →
 * автозакрытие → запись SETTLEMENT → сверка и инварианты → commit.
 * Любой отказ до commit откатывает сессию целиком.
 *
 * Для прибыли (payProfit) capital_closed пишется со знаком минус:
 * выплаченная прибыль переходит в капитал.
 */
class SettlementService : public ports::input::ISettlementService {
public:
    explicit SettlementService(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {
        std::cout << "[SettlementService] Created" << std::endl;
    }

    domain::SettlementResult settle(const domain::SettlementRequest& request) override {
        return process(request, domain::SnapshotKind::LOSS);
    }

    domain::SettlementResult payProfit(const domain::SettlementRequest& request) override {
        return process(request, domain::SnapshotKind::PROFIT);
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;

    domain::SettlementResult process(const domain::SettlementRequest& request, domain::SnapshotKind kind) {
        try {
            auto session = store_->begin(request.accountId, ports::output::LockMode::EXCLUSIVE);
            return execute(*session, request, kind);

        } catch (const domain::AccountNotFoundException& e) {
            std::cout << "[SettlementService] " << e.what() << std::endl;
            return domain::SettlementResult::failure(domain::SettlementStatus::ACCOUNT_NOT_FOUND, e.what());

        } catch (const domain::ConcurrencyConflictException& e) {
            std::cerr << "[SettlementService] Lock timeout on " << request.accountId << ": " << e.what() << std::endl;
            return domain::SettlementResult::failure(domain::SettlementStatus::CONCURRENCY_CONFLICT, e.what());

        } catch (const domain::ConstraintViolationException& e) {
            std::cerr << "[SettlementService] Storage constraint rejected settlement on " << request.accountId
                      << " amount=" << request.amount << " date=" << request.date.toString()
                      << ": " << e.what() << std::endl;
            return domain::SettlementResult::failure(domain::SettlementStatus::INVARIANT_VIOLATION, e.what());

        } catch (const domain::LedgerException& e) {
            logFailure("Storage failure", request, kind, e);
            return domain::SettlementResult::failure(domain::SettlementStatus::INVARIANT_VIOLATION, e.what());

        } catch (const std::exception& e) {
            // Переполнение Decimal или сбой хэширования settlement_id
            logFailure("Settlement aborted", request, kind, e);
            return domain::SettlementResult::failure(domain::SettlementStatus::INVARIANT_VIOLATION, e.what());
        }
    }

    static void logFailure(const char* what, const domain::SettlementRequest& request,
                           domain::SnapshotKind kind, const std::exception& e) {
        std::cerr << "[SettlementService] " << what << " on " << request.accountId
                  << " kind=" << toString(kind)
                  << " amount=" << request.amount
                  << " date=" << request.date.toString()
                  << " key=" << request.requestKey
                  << ": " << e.what() << std::endl;
    }

    domain::SettlementResult execute(ports::output::ILedgerSession& session,
                                     const domain::SettlementRequest& request,
                                     domain::SnapshotKind kind) {
        using engine::LossSnapshotManager;
        using engine::MoneyPolicy;

        auto snapshots = session.snapshots();
        auto activeSnapshot = LossSnapshotManager::active(snapshots);
        if (activeSnapshot && activeSnapshot->kind != kind) {
            activeSnapshot.reset();
        }

        // 1. Идемпотентность: активный снимок, а без него последний закрытый снимок того же вида
        std::optional<domain::LossSnapshot> candidate = activeSnapshot;
        if (!candidate) {
            candidate = LossSnapshotManager::latestSettledOfKind(snapshots, kind);
        }
        if (candidate) {
            auto settlementId = engine::SettlementIdGenerator::generate(
                request.accountId, candidate->balanceReference, request.amount, candidate->id, request.requestKey);
            if (auto prior = session.findBySettlementId(settlementId)) {
                std::cout << "[SettlementService] Duplicate " << settlementId
                          << " on " << request.accountId << std::endl;
                return domain::SettlementResult::duplicate(replay(*prior, *candidate, session.transactions()));
            }
        }

        // 2. Активный снимок нужного вида
        if (!activeSnapshot) {
            bool isLoss = kind == domain::SnapshotKind::LOSS;
            return domain::SettlementResult::failure(
                isLoss ? domain::SettlementStatus::NO_ACTIVE_LOSS : domain::SettlementStatus::NO_ACTIVE_PROFIT,
                isLoss ? "No active loss for account " + request.accountId
                       : "No active profit for account " + request.accountId);
        }
        const auto& snapshot = *activeSnapshot;

        // 3. Остаток из журнала
        auto transactions = session.transactions();
        auto remaining = LossSnapshotManager::remaining(snapshot, transactions);
        if (!request.amount.isPositive()) {
            return domain::SettlementResult::failure(domain::SettlementStatus::INVALID_PAYMENT,
                                                     "Payment must be positive");
        }
        if (request.date < snapshot.balanceReference.date) {
            return domain::SettlementResult::failure(domain::SettlementStatus::INVALID_PAYMENT,
                                                     "Payment date " + request.date.toString() +
                                                     " precedes balance reference " +
                                                     snapshot.balanceReference.date.toString());
        }

        // 4. Доли только из замороженного снимка
        auto totalPct = snapshot.split.totalPct();
        auto hundred = domain::Decimal::hundred();

        // 5. share-space: payment ≤ remaining × pct / 100, точное сравнение
        if (domain::Decimal::compareProducts(request.amount, hundred, remaining, totalPct) > 0) {
            auto pending = MoneyPolicy::shareOf(remaining, totalPct);
            return domain::SettlementResult::failure(domain::SettlementStatus::INVALID_PAYMENT,
                                                     "Payment " + request.amount.toString() +
                                                     " exceeds pending " + pending.toString());
        }

        // 6. capital-space: payment × 100 / pct ≤ remaining
        auto capitalClosedRaw = request.amount.mulDiv(hundred, totalPct);
        if (capitalClosedRaw > remaining) {
            return domain::SettlementResult::failure(domain::SettlementStatus::CAPITAL_EXCEEDED,
                                                     "Capital closed " + capitalClosedRaw.toString() +
                                                     " exceeds remaining " + remaining.toString());
        }

        // 7. Округление один раз, после валидации
        auto capitalClosed = MoneyPolicy::capitalOf(request.amount, totalPct);
        if (capitalClosed > remaining) {
            capitalClosed = remaining;
        }

        // 8.
        auto newRemaining = remaining - capitalClosed;
        if (newRemaining.isNegative()) {
            return domain::SettlementResult::failure(domain::SettlementStatus::CAPITAL_EXCEEDED,
                                                     "Remaining would become negative");
        }

        // 9. Автозакрытие
        bool closes = newRemaining < MoneyPolicy::threshold();
        if (closes) {
            capitalClosed += newRemaining;
            newRemaining = domain::Decimal::zero();
        }

        // 10. Распределение
        auto attribution = engine::ShareSplitter::apportion(capitalClosed, snapshot.split,
                                                            MoneyPolicy::CAPITAL_DECIMALS);
        auto paymentShares = engine::ShareSplitter::apportion(request.amount, snapshot.split,
                                                              MoneyPolicy::SHARE_DECIMALS);

        // 11. Запись SETTLEMENT
        auto sign = snapshot.capitalSign();
        domain::Transaction tx;
        tx.accountId = request.accountId;
        tx.kind = domain::TransactionKind::SETTLEMENT;
        tx.date = request.date;
        tx.amount = request.amount;
        tx.capitalClosed = sign > 0 ? capitalClosed : -capitalClosed;
        tx.yourShareAmount = sign > 0 ? attribution.first : -attribution.first;
        tx.counterpartyShareAmount = sign > 0 ? attribution.second : -attribution.second;
        tx.settlementId = engine::SettlementIdGenerator::generate(
            request.accountId, snapshot.balanceReference, request.amount, snapshot.id, request.requestKey);
        tx.snapshotId = snapshot.id;
        tx.balanceReference = snapshot.balanceReference;
        tx.note = request.note;
        auto stored = session.append(tx);

        // 12. Меняется только флаг
        if (closes) {
            session.markSnapshotSettled(snapshot.id);
        }

        // 13. Сверка, кэши, инварианты
        auto report = engine::UnitOfWork::finalize(session, request.date);
        if (!report.ok()) {
            std::cerr << "[SettlementService] INVARIANT VIOLATION, rolled back: account=" << request.accountId
                      << " kind=" << toString(kind)
                      << " amount=" << request.amount
                      << " date=" << request.date.toString()
                      << " snapshot=" << snapshot.id
                      << " remaining=" << remaining
                      << " capitalClosed=" << capitalClosed
                      << " violations=[" << report.summary() << "]" << std::endl;
            return domain::SettlementResult::failure(domain::SettlementStatus::INVARIANT_VIOLATION,
                                                     report.summary());
        }

        session.commit();

        // 14.
        domain::SettlementOutcome outcome;
        outcome.settlementId = *stored.settlementId;
        outcome.transactionId = stored.id;
        outcome.snapshotId = snapshot.id;
        outcome.kind = kind;
        outcome.date = request.date;
        outcome.paymentAmount = request.amount;
        outcome.capitalClosed = capitalClosed;
        outcome.remainingAfter = newRemaining;
        outcome.pendingAfter = MoneyPolicy::shareOf(newRemaining, totalPct);
        outcome.snapshotSettled = closes;
        outcome.yourShareAmount = attribution.first;
        outcome.counterpartyShareAmount = attribution.second;
        outcome.paymentMyShare = paymentShares.first;
        outcome.paymentCounterpartyShare = paymentShares.second;

        std::cout << "[SettlementService] " << toString(kind) << " settlement " << outcome.settlementId
                  << " on " << request.accountId
                  << ": paid=" << request.amount
                  << " capitalClosed=" << capitalClosed
                  << " remaining=" << newRemaining
                  << (closes ? " (snapshot closed)" : "") << std::endl;

        return domain::SettlementResult::settled(outcome);
    }

    /**
     * @brief Восстановить итог ранее проведённой оплаты из журнала
     */
    static domain::SettlementOutcome replay(const domain::Transaction& prior,
                                            const domain::LossSnapshot& snapshot,
                                            const std::vector<domain::Transaction>& transactions) {
        using engine::MoneyPolicy;

        auto remainingAfter = engine::LossSnapshotManager::remainingAfter(snapshot, transactions, prior.sequence);
        auto capitalClosed = prior.capitalClosed ? prior.capitalClosed->abs() : domain::Decimal::zero();
        auto paymentShares = engine::ShareSplitter::apportion(prior.amount, snapshot.split,
                                                              MoneyPolicy::SHARE_DECIMALS);

        domain::SettlementOutcome outcome;
        outcome.settlementId = prior.settlementId.value_or("");
        outcome.transactionId = prior.id;
        outcome.snapshotId = snapshot.id;
        outcome.kind = snapshot.kind;
        outcome.date = prior.date;
        outcome.paymentAmount = prior.amount;
        outcome.capitalClosed = capitalClosed;
        outcome.remainingAfter = remainingAfter;
        outcome.pendingAfter = MoneyPolicy::shareOf(remainingAfter, snapshot.split.totalPct());
        outcome.snapshotSettled = remainingAfter.isZero();
        outcome.yourShareAmount = prior.yourShareAmount.abs();
        outcome.counterpartyShareAmount = prior.counterpartyShareAmount.abs();
        outcome.paymentMyShare = paymentShares.first;
        outcome.paymentCounterpartyShare = paymentShares.second;
        return outcome;
    }
};

} // namespace ledger::application
