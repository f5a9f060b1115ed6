#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include "utils/UuidGenerator.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace ledger::adapters::secondary {

/**
 * @brief Встроенное хранилище журнала
 *
 * Соблюдает те же ограничения, что и схема PostgreSQL: уникальный
 * settlement_id и не более одного активного снимка на счёт.
 * EXCLUSIVE-сессия держит мьютекс счёта до своего уничтожения,
 * изменения копятся в сессии и публикуются атомарно в commit().
 * Хранилище должно жить дольше своих сессий.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
public:
    explicit InMemoryLedgerStore(std::chrono::milliseconds lockTimeout = std::chrono::milliseconds(5000))
        : lockTimeout_(lockTimeout)
    {
        std::cout << "[InMemoryLedgerStore] Created (lock timeout " << lockTimeout_.count() << " ms)" << std::endl;
    }

    std::unique_ptr<ports::output::ILedgerSession> begin(const std::string& accountId,
                                                         ports::output::LockMode mode) override {
        {
            std::lock_guard<std::mutex> lock(dataMutex_);
            if (data_.find(accountId) == data_.end()) {
                throw domain::AccountNotFoundException(accountId);
            }
        }

        std::unique_lock<std::timed_mutex> accountLock;
        if (mode == ports::output::LockMode::EXCLUSIVE) {
            auto mutex = locks_.findOrCreate(accountId);
            accountLock = std::unique_lock<std::timed_mutex>(*mutex, std::defer_lock);
            if (!accountLock.try_lock_for(lockTimeout_)) {
                throw domain::ConcurrencyConflictException(
                    "Timed out after " + std::to_string(lockTimeout_.count()) + " ms waiting for account " + accountId);
            }
        }

        std::lock_guard<std::mutex> lock(dataMutex_);
        return std::make_unique<Session>(*this, accountId, mode, data_.at(accountId), std::move(accountLock));
    }

    domain::Account createAccount(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(dataMutex_);
        if (data_.find(account.accountId) != data_.end()) {
            throw domain::ConstraintViolationException("Account already exists: " + account.accountId);
        }
        AccountData data;
        data.account = account;
        data_[account.accountId] = data;
        return account;
    }

    std::vector<std::string> accountIds() override {
        std::lock_guard<std::mutex> lock(dataMutex_);
        std::vector<std::string> ids;
        ids.reserve(data_.size());
        for (const auto& [id, data] : data_) {
            ids.push_back(id);
        }
        std::sort(ids.begin(), ids.end());
        return ids;
    }

    // Test helpers
    size_t size() const {
        std::lock_guard<std::mutex> lock(dataMutex_);
        return data_.size();
    }

    size_t transactionCount(const std::string& accountId) const {
        std::lock_guard<std::mutex> lock(dataMutex_);
        auto it = data_.find(accountId);
        return it == data_.end() ? 0 : it->second.transactions.size();
    }

    void setCaches(const std::string& accountId, const domain::Decimal& capital, const domain::Decimal& balance) {
        std::lock_guard<std::mutex> lock(dataMutex_);
        auto& account = data_.at(accountId).account;
        account.cachedCapital = capital;
        account.cachedBalance = balance;
    }

private:
    struct AccountData {
        domain::Account account;
        std::vector<domain::Transaction> transactions;
        std::vector<domain::LossSnapshot> snapshots;
    };

    class Session : public ports::output::ILedgerSession {
    public:
        Session(InMemoryLedgerStore& store,
                std::string accountId,
                ports::output::LockMode mode,
                AccountData staged,
                std::unique_lock<std::timed_mutex> accountLock)
            : store_(store)
            , accountId_(std::move(accountId))
            , mode_(mode)
            , staged_(std::move(staged))
            , accountLock_(std::move(accountLock))
        {}

        ~Session() override {
            if (dirty_ && !committed_) {
                std::cout << "[InMemoryLedgerStore] Rolled back unit of work on " << accountId_ << std::endl;
            }
        }

        domain::Account account() override {
            return staged_.account;
        }

        std::vector<domain::Transaction> transactions() override {
            return staged_.transactions;
        }

        std::vector<domain::LossSnapshot> snapshots() override {
            return staged_.snapshots;
        }

        std::optional<domain::Transaction> findBySettlementId(const std::string& settlementId) override {
            for (const auto& tx : staged_.transactions) {
                if (tx.settlementId == settlementId) {
                    return tx;
                }
            }
            std::lock_guard<std::mutex> lock(store_.dataMutex_);
            auto it = store_.settlementIndex_.find(settlementId);
            if (it == store_.settlementIndex_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        domain::Transaction append(const domain::Transaction& transaction) override {
            requireWritable();

            domain::Transaction stored = transaction;
            if (stored.id.empty()) {
                stored.id = utils::UuidGenerator::generateWithPrefix("txn");
            }
            stored.accountId = accountId_;
            stored.sequence = store_.nextSequence_.fetch_add(1);

            if (stored.settlementId && findBySettlementId(*stored.settlementId)) {
                throw domain::ConstraintViolationException("Duplicate settlement_id: " + *stored.settlementId);
            }

            auto position = std::upper_bound(
                staged_.transactions.begin(), staged_.transactions.end(), stored,
                [](const domain::Transaction& a, const domain::Transaction& b) { return b.isAfter(a); });
            staged_.transactions.insert(position, stored);
            dirty_ = true;
            return stored;
        }

        void openSnapshot(const domain::LossSnapshot& snapshot) override {
            requireWritable();
            for (const auto& existing : staged_.snapshots) {
                if (!existing.isSettled) {
                    throw domain::ConstraintViolationException(
                        "Account " + accountId_ + " already has active snapshot " + existing.id);
                }
            }
            staged_.snapshots.push_back(snapshot);
            staged_.snapshots.back().accountId = accountId_;
            dirty_ = true;
        }

        void markSnapshotSettled(const std::string& snapshotId) override {
            requireWritable();
            for (auto& snapshot : staged_.snapshots) {
                if (snapshot.id == snapshotId) {
                    snapshot.isSettled = true;
                    dirty_ = true;
                    return;
                }
            }
            throw domain::LedgerException("Snapshot not found: " + snapshotId);
        }

        void updateCaches(const domain::Decimal& capital, const domain::Decimal& balance) override {
            requireWritable();
            staged_.account.cachedCapital = capital;
            staged_.account.cachedBalance = balance;
            dirty_ = true;
        }

        void updateShareDefaults(const domain::BeneficiarySplit& lossSplit,
                                 const domain::BeneficiarySplit& profitSplit) override {
            requireWritable();
            staged_.account.lossSplit = lossSplit;
            staged_.account.profitSplit = profitSplit;
            dirty_ = true;
        }

        void commit() override {
            if (committed_ || !dirty_) {
                committed_ = true;
                return;
            }

            std::lock_guard<std::mutex> lock(store_.dataMutex_);
            for (const auto& tx : staged_.transactions) {
                if (!tx.settlementId) {
                    continue;
                }
                auto it = store_.settlementIndex_.find(*tx.settlementId);
                if (it != store_.settlementIndex_.end() && it->second.id != tx.id) {
                    throw domain::ConstraintViolationException("Duplicate settlement_id: " + *tx.settlementId);
                }
            }
            for (const auto& tx : staged_.transactions) {
                if (tx.settlementId) {
                    store_.settlementIndex_[*tx.settlementId] = tx;
                }
            }
            store_.data_[accountId_] = staged_;
            committed_ = true;
        }

    private:
        InMemoryLedgerStore& store_;
        std::string accountId_;
        ports::output::LockMode mode_;
        AccountData staged_;
        std::unique_lock<std::timed_mutex> accountLock_;
        bool dirty_ = false;
        bool committed_ = false;

        void requireWritable() const {
            if (mode_ != ports::output::LockMode::EXCLUSIVE) {
                throw domain::LedgerException("Read-only session on account " + accountId_);
            }
            if (committed_) {
                throw domain::LedgerException("Session already committed on account " + accountId_);
            }
        }
    };

    std::chrono::milliseconds lockTimeout_;
    ThreadSafeMap<std::string, std::timed_mutex> locks_;
    mutable std::mutex dataMutex_;
    std::unordered_map<std::string, AccountData> data_;
    std::unordered_map<std::string, domain::Transaction> settlementIndex_;
    std::atomic<int64_t> nextSequence_{1};
};

} // namespace ledger::adapters::secondary
