#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/exceptions/LedgerException.hpp"
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <iostream>
#include <memory>

namespace ledger::adapters::secondary
{

    /**
     * @brief Хранилище журнала в PostgreSQL
     *
     * Ограничения, от которых зависит движок, заданы в схеме:
     * - уникальный индекс по settlement_id (WHERE settlement_id IS NOT NULL);
     * - частичный уникальный индекс loss_snapshots(account_id) WHERE is_settled = false;
     * - триггеры, запрещающие UPDATE/DELETE журнала и изменение снимков, кроме флага is_settled.
     *
     * Сессия = одна транзакция БД. EXCLUSIVE берёт SELECT ... FOR UPDATE
     * по строке счёта с lock_timeout, таймаут (SQLSTATE 55P03) превращается
     * в ConcurrencyConflictException.
     */
    class PostgresLedgerStore : public ports::output::ILedgerStore
    {
    public:
        PostgresLedgerStore(std::shared_ptr<settings::DbSettings> dbSettings,
                            std::shared_ptr<settings::LedgerSettings> ledgerSettings)
            : dbSettings_(std::move(dbSettings)), ledgerSettings_(std::move(ledgerSettings))
        {
            initSchema();
            std::cout << "[PostgresLedgerStore] Connected to " << dbSettings_->getName() << std::endl;
        }

        std::unique_ptr<ports::output::ILedgerSession> begin(const std::string &accountId,
                                                             ports::output::LockMode mode) override
        {
            return translate([&]
                             { return std::unique_ptr<ports::output::ILedgerSession>(std::make_unique<Session>(
                                   dbSettings_->getConnectionString(), accountId, mode, ledgerSettings_->getLockTimeout())); });
        }

        domain::Account createAccount(const domain::Account &account) override
        {
            return translate([&]
                             {
                pqxx::connection c(dbSettings_->getConnectionString());
                pqxx::work t(c);
                t.exec_params(
                    "INSERT INTO ledger_accounts (account_id, client_name, exchange_name, "
                    "loss_split_kind, loss_my_pct, loss_counterparty_pct, "
                    "profit_split_kind, profit_my_pct, profit_counterparty_pct, "
                    "cached_capital, cached_balance) "
                    "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)",
                    account.accountId, account.clientName, account.exchangeName,
                    splitKind(account.lossSplit), account.lossSplit.myPct().toString(),
                    account.lossSplit.counterpartyPct().toString(),
                    splitKind(account.profitSplit), account.profitSplit.myPct().toString(),
                    account.profitSplit.counterpartyPct().toString(),
                    account.cachedCapital.toString(), account.cachedBalance.toString());
                t.commit();
                std::cout << "[PostgresLedgerStore] Account created: " << account.accountId << std::endl;
                return account; });
        }

        std::vector<std::string> accountIds() override
        {
            return translate([&]
                             {
                pqxx::connection c(dbSettings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec("SELECT account_id FROM ledger_accounts ORDER BY account_id");
                std::vector<std::string> ids;
                for (const auto &row : r)
                {
                    ids.push_back(row[0].as<std::string>());
                }
                return ids; });
        }

    private:
        std::shared_ptr<settings::DbSettings> dbSettings_;
        std::shared_ptr<settings::LedgerSettings> ledgerSettings_;

        class Session : public ports::output::ILedgerSession
        {
        public:
            Session(const std::string &connectionString,
                    std::string accountId,
                    ports::output::LockMode mode,
                    std::chrono::milliseconds lockTimeout)
                : connection_(connectionString), work_(connection_), accountId_(std::move(accountId)), mode_(mode)
            {
                pqxx::result r;
                if (mode_ == ports::output::LockMode::EXCLUSIVE)
                {
                    work_.exec("SET LOCAL lock_timeout = '" + std::to_string(lockTimeout.count()) + "ms'");
                    r = work_.exec_params(ACCOUNT_SELECT + " WHERE account_id = $1 FOR UPDATE", accountId_);
                }
                else
                {
                    r = work_.exec_params(ACCOUNT_SELECT + " WHERE account_id = $1", accountId_);
                }
                if (r.empty())
                {
                    throw domain::AccountNotFoundException(accountId_);
                }
                account_ = readAccount(r[0]);
            }

            ~Session() override
            {
                if (dirty_ && !committed_)
                {
                    std::cout << "[PostgresLedgerStore] Rolled back unit of work on " << accountId_ << std::endl;
                }
            }

            domain::Account account() override
            {
                return account_;
            }

            std::vector<domain::Transaction> transactions() override
            {
                return translate([&]
                                 {
                    auto r = work_.exec_params(
                        TRANSACTION_SELECT + " WHERE account_id = $1 ORDER BY tx_date, sequence", accountId_);
                    std::vector<domain::Transaction> result;
                    result.reserve(r.size());
                    for (const auto &row : r)
                    {
                        result.push_back(readTransaction(row));
                    }
                    return result; });
            }

            std::vector<domain::LossSnapshot> snapshots() override
            {
                return translate([&]
                                 {
                    auto r = work_.exec_params(
                        "SELECT id, account_id, kind, balance_ref_date, balance_ref_sequence, balance_ref_amount, "
                        "amount, split_kind, my_share_pct, counterparty_share_pct, is_settled "
                        "FROM loss_snapshots WHERE account_id = $1 ORDER BY created_seq",
                        accountId_);
                    std::vector<domain::LossSnapshot> result;
                    for (const auto &row : r)
                    {
                        domain::LossSnapshot s;
                        s.id = row["id"].as<std::string>();
                        s.accountId = row["account_id"].as<std::string>();
                        s.kind = domain::parseSnapshotKind(row["kind"].as<std::string>());
                        s.balanceReference.date = domain::Date::fromString(row["balance_ref_date"].as<std::string>());
                        s.balanceReference.sequence = row["balance_ref_sequence"].as<int64_t>();
                        s.balanceReference.balance = domain::Decimal::parse(row["balance_ref_amount"].as<std::string>());
                        s.amount = domain::Decimal::parse(row["amount"].as<std::string>());
                        s.split = readSplit(row["split_kind"].as<std::string>(),
                                            row["my_share_pct"].as<std::string>(),
                                            row["counterparty_share_pct"].as<std::string>());
                        s.isSettled = row["is_settled"].as<bool>();
                        result.push_back(s);
                    }
                    return result; });
            }

            std::optional<domain::Transaction> findBySettlementId(const std::string &settlementId) override
            {
                return translate([&]
                                 {
                    auto r = work_.exec_params(TRANSACTION_SELECT + " WHERE settlement_id = $1", settlementId);
                    if (r.empty())
                        return std::optional<domain::Transaction>();
                    return std::optional<domain::Transaction>(readTransaction(r[0])); });
            }

            domain::Transaction append(const domain::Transaction &transaction) override
            {
                requireWritable();
                return translate([&]
                                 {
                    domain::Transaction stored = transaction;
                    if (stored.id.empty())
                    {
                        stored.id = utils::UuidGenerator::generateWithPrefix("txn");
                    }
                    stored.accountId = accountId_;

                    std::optional<std::string> capitalClosed;
                    if (stored.capitalClosed)
                        capitalClosed = stored.capitalClosed->toString();
                    std::optional<std::string> refDate;
                    std::optional<int64_t> refSequence;
                    std::optional<std::string> refAmount;
                    if (stored.balanceReference)
                    {
                        refDate = stored.balanceReference->date.toString();
                        refSequence = stored.balanceReference->sequence;
                        refAmount = stored.balanceReference->balance.toString();
                    }

                    auto r = work_.exec_params(
                        "INSERT INTO ledger_transactions (id, account_id, tx_date, kind, amount, capital_closed, "
                        "your_share_amount, counterparty_share_amount, settlement_id, snapshot_id, "
                        "balance_ref_date, balance_ref_sequence, balance_ref_amount, adjustment, note) "
                        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15) "
                        "RETURNING sequence",
                        stored.id, stored.accountId, stored.date.toString(), domain::toString(stored.kind),
                        stored.amount.toString(), capitalClosed,
                        stored.yourShareAmount.toString(), stored.counterpartyShareAmount.toString(),
                        stored.settlementId, stored.snapshotId,
                        refDate, refSequence, refAmount,
                        stored.adjustment.toString(), stored.note);
                    stored.sequence = r[0][0].as<int64_t>();
                    dirty_ = true;
                    return stored; });
            }

            void openSnapshot(const domain::LossSnapshot &snapshot) override
            {
                requireWritable();
                translate([&]
                          {
                    work_.exec_params(
                        "INSERT INTO loss_snapshots (id, account_id, kind, balance_ref_date, balance_ref_sequence, "
                        "balance_ref_amount, amount, split_kind, my_share_pct, counterparty_share_pct, is_settled) "
                        "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, false)",
                        snapshot.id, accountId_, domain::toString(snapshot.kind),
                        snapshot.balanceReference.date.toString(), snapshot.balanceReference.sequence,
                        snapshot.balanceReference.balance.toString(), snapshot.amount.toString(),
                        splitKind(snapshot.split), snapshot.split.myPct().toString(),
                        snapshot.split.counterpartyPct().toString());
                    dirty_ = true;
                    });
            }

            void markSnapshotSettled(const std::string &snapshotId) override
            {
                requireWritable();
                translate([&]
                          {
                    auto r = work_.exec_params(
                        "UPDATE loss_snapshots SET is_settled = true WHERE id = $1 AND account_id = $2",
                        snapshotId, accountId_);
                    if (r.affected_rows() == 0)
                    {
                        throw domain::LedgerException("Snapshot not found: " + snapshotId);
                    }
                    dirty_ = true;
                    });
            }

            void updateCaches(const domain::Decimal &capital, const domain::Decimal &balance) override
            {
                requireWritable();
                translate([&]
                          {
                    work_.exec_params(
                        "UPDATE ledger_accounts SET cached_capital = $2, cached_balance = $3 WHERE account_id = $1",
                        accountId_, capital.toString(), balance.toString());
                    account_.cachedCapital = capital;
                    account_.cachedBalance = balance;
                    dirty_ = true;
                    });
            }

            void updateShareDefaults(const domain::BeneficiarySplit &lossSplit,
                                     const domain::BeneficiarySplit &profitSplit) override
            {
                requireWritable();
                translate([&]
                          {
                    work_.exec_params(
                        "UPDATE ledger_accounts SET loss_split_kind = $2, loss_my_pct = $3, loss_counterparty_pct = $4, "
                        "profit_split_kind = $5, profit_my_pct = $6, profit_counterparty_pct = $7 WHERE account_id = $1",
                        accountId_,
                        splitKind(lossSplit), lossSplit.myPct().toString(), lossSplit.counterpartyPct().toString(),
                        splitKind(profitSplit), profitSplit.myPct().toString(), profitSplit.counterpartyPct().toString());
                    account_.lossSplit = lossSplit;
                    account_.profitSplit = profitSplit;
                    dirty_ = true;
                    });
            }

            void commit() override
            {
                translate([&]
                          {
                    work_.commit();
                    committed_ = true;
                    });
            }

        private:
            pqxx::connection connection_;
            pqxx::work work_;
            std::string accountId_;
            ports::output::LockMode mode_;
            domain::Account account_;
            bool dirty_ = false;
            bool committed_ = false;

            void requireWritable() const
            {
                if (mode_ != ports::output::LockMode::EXCLUSIVE)
                {
                    throw domain::LedgerException("Read-only session on account " + accountId_);
                }
            }
        };

        inline static const std::string ACCOUNT_SELECT =
            "SELECT account_id, client_name, exchange_name, "
            "loss_split_kind, loss_my_pct, loss_counterparty_pct, "
            "profit_split_kind, profit_my_pct, profit_counterparty_pct, "
            "cached_capital, cached_balance FROM ledger_accounts";

        inline static const std::string TRANSACTION_SELECT =
            "SELECT id, account_id, sequence, tx_date, kind, amount, capital_closed, "
            "your_share_amount, counterparty_share_amount, settlement_id, snapshot_id, "
            "balance_ref_date, balance_ref_sequence, balance_ref_amount, adjustment, note "
            "FROM ledger_transactions";

        /**
         * @brief Перевод ошибок драйвера в исключения журнала
         */
        template <typename Fn>
        static auto translate(Fn &&fn) -> decltype(fn())
        {
            try
            {
                return fn();
            }
            catch (const pqxx::unique_violation &e)
            {
                throw domain::ConstraintViolationException(e.what());
            }
            catch (const pqxx::sql_error &e)
            {
                if (e.sqlstate() == "55P03")
                {
                    throw domain::ConcurrencyConflictException(e.what());
                }
                throw domain::LedgerException(std::string("Database error: ") + e.what());
            }
            catch (const pqxx::broken_connection &e)
            {
                throw domain::LedgerException(std::string("Database connection lost: ") + e.what());
            }
        }

        static std::string splitKind(const domain::BeneficiarySplit &split)
        {
            return split.isDual() ? "DUAL" : "SINGLE";
        }

        static domain::BeneficiarySplit readSplit(const std::string &kind,
                                                  const std::string &myPct,
                                                  const std::string &counterpartyPct)
        {
            if (kind == "DUAL")
            {
                return domain::BeneficiarySplit::dual(domain::Decimal::parse(myPct),
                                                      domain::Decimal::parse(counterpartyPct));
            }
            return domain::BeneficiarySplit::single(domain::Decimal::parse(myPct));
        }

        static domain::Account readAccount(const pqxx::row &row)
        {
            domain::Account account;
            account.accountId = row["account_id"].as<std::string>();
            account.clientName = row["client_name"].as<std::string>();
            account.exchangeName = row["exchange_name"].as<std::string>();
            account.lossSplit = readSplit(row["loss_split_kind"].as<std::string>(),
                                          row["loss_my_pct"].as<std::string>(),
                                          row["loss_counterparty_pct"].as<std::string>());
            account.profitSplit = readSplit(row["profit_split_kind"].as<std::string>(),
                                            row["profit_my_pct"].as<std::string>(),
                                            row["profit_counterparty_pct"].as<std::string>());
            account.cachedCapital = domain::Decimal::parse(row["cached_capital"].as<std::string>());
            account.cachedBalance = domain::Decimal::parse(row["cached_balance"].as<std::string>());
            return account;
        }

        static domain::Transaction readTransaction(const pqxx::row &row)
        {
            domain::Transaction tx;
            tx.id = row["id"].as<std::string>();
            tx.accountId = row["account_id"].as<std::string>();
            tx.sequence = row["sequence"].as<int64_t>();
            tx.date = domain::Date::fromString(row["tx_date"].as<std::string>());
            tx.kind = domain::parseTransactionKind(row["kind"].as<std::string>());
            tx.amount = domain::Decimal::parse(row["amount"].as<std::string>());
            if (!row["capital_closed"].is_null())
                tx.capitalClosed = domain::Decimal::parse(row["capital_closed"].as<std::string>());
            tx.yourShareAmount = domain::Decimal::parse(row["your_share_amount"].as<std::string>());
            tx.counterpartyShareAmount = domain::Decimal::parse(row["counterparty_share_amount"].as<std::string>());
            if (!row["settlement_id"].is_null())
                tx.settlementId = row["settlement_id"].as<std::string>();
            if (!row["snapshot_id"].is_null())
                tx.snapshotId = row["snapshot_id"].as<std::string>();
            if (!row["balance_ref_date"].is_null())
            {
                domain::BalanceReference ref;
                ref.date = domain::Date::fromString(row["balance_ref_date"].as<std::string>());
                ref.sequence = row["balance_ref_sequence"].as<int64_t>();
                ref.balance = domain::Decimal::parse(row["balance_ref_amount"].as<std::string>());
                tx.balanceReference = ref;
            }
            tx.adjustment = domain::Decimal::parse(row["adjustment"].as<std::string>());
            tx.note = row["note"].as<std::string>();
            return tx;
        }

        void initSchema()
        {
            pqxx::connection c(dbSettings_->getConnectionString());
            pqxx::work t(c);

            t.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_accounts (
                    account_id              TEXT PRIMARY KEY,
                    client_name             TEXT NOT NULL,
                    exchange_name           TEXT NOT NULL,
                    loss_split_kind         TEXT NOT NULL CHECK (loss_split_kind IN ('SINGLE', 'DUAL')),
                    loss_my_pct             NUMERIC(9,6) NOT NULL,
                    loss_counterparty_pct   NUMERIC(9,6) NOT NULL DEFAULT 0,
                    profit_split_kind       TEXT NOT NULL CHECK (profit_split_kind IN ('SINGLE', 'DUAL')),
                    profit_my_pct           NUMERIC(9,6) NOT NULL,
                    profit_counterparty_pct NUMERIC(9,6) NOT NULL DEFAULT 0,
                    cached_capital          NUMERIC(20,6) NOT NULL DEFAULT 0,
                    cached_balance          NUMERIC(20,6) NOT NULL DEFAULT 0,
                    created_at              TIMESTAMPTZ NOT NULL DEFAULT now()
                )
            )");

            t.exec(R"(
                CREATE TABLE IF NOT EXISTS ledger_transactions (
                    sequence                  BIGSERIAL PRIMARY KEY,
                    id                        TEXT NOT NULL UNIQUE,
                    account_id                TEXT NOT NULL REFERENCES ledger_accounts(account_id),
                    tx_date                   DATE NOT NULL,
                    kind                      TEXT NOT NULL CHECK (kind IN
                        ('FUNDING', 'SETTLEMENT', 'BALANCE_RECORD', 'ADJUSTMENT', 'LOSS', 'PROFIT')),
                    amount                    NUMERIC(20,6) NOT NULL,
                    capital_closed            NUMERIC(20,6),
                    your_share_amount         NUMERIC(20,6) NOT NULL DEFAULT 0,
                    counterparty_share_amount NUMERIC(20,6) NOT NULL DEFAULT 0,
                    settlement_id             TEXT,
                    snapshot_id               TEXT,
                    balance_ref_date          DATE,
                    balance_ref_sequence      BIGINT,
                    balance_ref_amount        NUMERIC(20,6),
                    adjustment                NUMERIC(20,6) NOT NULL DEFAULT 0,
                    note                      TEXT NOT NULL DEFAULT '',
                    created_at                TIMESTAMPTZ NOT NULL DEFAULT now(),
                    CHECK (kind <> 'FUNDING' OR amount > 0),
                    CHECK (kind <> 'BALANCE_RECORD' OR amount >= 0),
                    CHECK (kind <> 'SETTLEMENT' OR
                           (capital_closed IS NOT NULL AND settlement_id IS NOT NULL AND snapshot_id IS NOT NULL))
                )
            )");

            t.exec(R"(
                CREATE UNIQUE INDEX IF NOT EXISTS ux_ledger_transactions_settlement_id
                    ON ledger_transactions (settlement_id) WHERE settlement_id IS NOT NULL
            )");
            t.exec(R"(
                CREATE INDEX IF NOT EXISTS ix_ledger_transactions_account
                    ON ledger_transactions (account_id, tx_date, sequence)
            )");

            t.exec(R"(
                CREATE TABLE IF NOT EXISTS loss_snapshots (
                    id                     TEXT PRIMARY KEY,
                    created_seq            BIGSERIAL,
                    account_id             TEXT NOT NULL REFERENCES ledger_accounts(account_id),
                    kind                   TEXT NOT NULL CHECK (kind IN ('LOSS', 'PROFIT')),
                    balance_ref_date       DATE NOT NULL,
                    balance_ref_sequence   BIGINT NOT NULL,
                    balance_ref_amount     NUMERIC(20,6) NOT NULL,
                    amount                 NUMERIC(20,6) NOT NULL CHECK (amount > 0),
                    split_kind             TEXT NOT NULL CHECK (split_kind IN ('SINGLE', 'DUAL')),
                    my_share_pct           NUMERIC(9,6) NOT NULL,
                    counterparty_share_pct NUMERIC(9,6) NOT NULL DEFAULT 0,
                    is_settled             BOOLEAN NOT NULL DEFAULT false,
                    created_at             TIMESTAMPTZ NOT NULL DEFAULT now()
                )
            )");

            // Не более одного активного снимка на счёт
            t.exec(R"(
                CREATE UNIQUE INDEX IF NOT EXISTS ux_loss_snapshots_one_active
                    ON loss_snapshots (account_id) WHERE is_settled = false
            )");

            t.exec(R"(
                CREATE OR REPLACE FUNCTION ledger_transactions_append_only() RETURNS trigger AS $$
                BEGIN
                    RAISE EXCEPTION 'ledger_transactions is append-only';
                END;
                $$ LANGUAGE plpgsql
            )");
            t.exec("DROP TRIGGER IF EXISTS trg_ledger_transactions_append_only ON ledger_transactions");
            t.exec(R"(
                CREATE TRIGGER trg_ledger_transactions_append_only
                    BEFORE UPDATE OR DELETE ON ledger_transactions
                    FOR EACH ROW EXECUTE FUNCTION ledger_transactions_append_only()
            )");

            t.exec(R"(
                CREATE OR REPLACE FUNCTION loss_snapshots_freeze() RETURNS trigger AS $$
                BEGIN
                    IF TG_OP = 'DELETE' THEN
                        RAISE EXCEPTION 'loss_snapshots rows are never deleted';
                    END IF;
                    IF NEW.amount <> OLD.amount
                       OR NEW.my_share_pct <> OLD.my_share_pct
                       OR NEW.counterparty_share_pct <> OLD.counterparty_share_pct
                       OR NEW.balance_ref_amount <> OLD.balance_ref_amount
                       OR (OLD.is_settled AND NOT NEW.is_settled) THEN
                        RAISE EXCEPTION 'loss_snapshots: only is_settled false -> true may change';
                    END IF;
                    RETURN NEW;
                END;
                $$ LANGUAGE plpgsql
            )");
            t.exec("DROP TRIGGER IF EXISTS trg_loss_snapshots_freeze ON loss_snapshots");
            t.exec(R"(
                CREATE TRIGGER trg_loss_snapshots_freeze
                    BEFORE UPDATE OR DELETE ON loss_snapshots
                    FOR EACH ROW EXECUTE FUNCTION loss_snapshots_freeze()
            )");

            t.commit();
            std::cout << "[PostgresLedgerStore] Schema initialized" << std::endl;
        }
    };

} // namespace ledger::adapters::secondary
