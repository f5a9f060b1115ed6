#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/engine/InvariantEnforcer.hpp"
#include "application/engine/UnitOfWork.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <memory>
#include <stdexcept>

namespace ledger::application {

/**
 * @brief Сервис счетов: открытие, доли по умолчанию, сверка кэшей
 */
class AccountService : public ports::input::IAccountService {
public:
    explicit AccountService(std::shared_ptr<ports::output::ILedgerStore> store)
        : store_(std::move(store))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    domain::Account openAccount(const ports::input::OpenAccountRequest& request) override {
        if (request.clientName.empty() || request.exchangeName.empty()) {
            throw std::invalid_argument("Client and exchange names are required");
        }
        validateSplits(request.lossSplit, request.profitSplit);

        domain::Account account;
        account.accountId = utils::UuidGenerator::generateWithPrefix("acc");
        account.clientName = request.clientName;
        account.exchangeName = request.exchangeName;
        account.lossSplit = request.lossSplit;
        account.profitSplit = request.profitSplit;

        std::cout << "[AccountService] Opening account " << account.accountId
                  << " client=" << account.clientName
                  << " exchange=" << account.exchangeName << std::endl;

        return store_->createAccount(account);
    }

    std::optional<domain::Account> getAccount(const std::string& accountId) override {
        try {
            auto session = store_->begin(accountId, ports::output::LockMode::SHARED);
            return session->account();
        } catch (const domain::AccountNotFoundException&) {
            return std::nullopt;
        }
    }

    bool updateShareDefaults(const std::string& accountId,
                             const domain::BeneficiarySplit& lossSplit,
                             const domain::BeneficiarySplit& profitSplit) override {
        validateSplits(lossSplit, profitSplit);
        try {
            auto session = store_->begin(accountId, ports::output::LockMode::EXCLUSIVE);
            session->updateShareDefaults(lossSplit, profitSplit);
            session->commit();
            std::cout << "[AccountService] Share defaults updated for " << accountId
                      << ": loss=" << lossSplit.totalPct() << "% profit=" << profitSplit.totalPct() << "%" << std::endl;
            return true;
        } catch (const domain::AccountNotFoundException&) {
            return false;
        }
    }

    ports::input::CacheReconcileReport reconcileCaches() override {
        ports::input::CacheReconcileReport report;

        for (const auto& accountId : store_->accountIds()) {
            ++report.accountsChecked;
            try {
                auto session = store_->begin(accountId, ports::output::LockMode::EXCLUSIVE);
                auto before = session->account();

                engine::UnitOfWork::refreshCaches(*session);
                auto after = session->account();

                auto invariants = engine::InvariantEnforcer::check(after, session->transactions(), session->snapshots());
                if (!invariants.ok()) {
                    std::cerr << "[AccountService] Invariants broken on " << accountId
                              << ": " << invariants.summary() << std::endl;
                    ++report.failed;
                    continue;
                }

                if (before.cachedCapital != after.cachedCapital || before.cachedBalance != after.cachedBalance) {
                    ++report.drifted;
                    std::cout << "[AccountService] Cache drift on " << accountId
                              << ": capital " << before.cachedCapital << " -> " << after.cachedCapital
                              << ", balance " << before.cachedBalance << " -> " << after.cachedBalance << std::endl;
                }
                session->commit();

            } catch (const domain::LedgerException& e) {
                std::cerr << "[AccountService] Cache reconcile failed on " << accountId << ": " << e.what() << std::endl;
                ++report.failed;
            }
        }

        std::cout << "[AccountService] Caches reconciled: checked=" << report.accountsChecked
                  << " drifted=" << report.drifted << " failed=" << report.failed << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;

    static void validateSplits(const domain::BeneficiarySplit& lossSplit, const domain::BeneficiarySplit& profitSplit) {
        if (!lossSplit.isValid()) {
            throw std::invalid_argument("Invalid loss share split");
        }
        if (!profitSplit.isValid()) {
            throw std::invalid_argument("Invalid profit share split");
        }
    }
};

} // namespace ledger::application
