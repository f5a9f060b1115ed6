#pragma once

#include "domain/Account.hpp"
#include "domain/BeneficiarySplit.hpp"
#include "domain/Date.hpp"
#include "domain/Decimal.hpp"
#include "domain/LedgerState.hpp"
#include "domain/PendingEntry.hpp"
#include "domain/SettlementResult.hpp"
#include "domain/Transaction.hpp"
#include "domain/enums/LedgerStatus.hpp"
#include "domain/enums/SettlementStatus.hpp"
#include <IResponse.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace ledger::adapters::primary {

/**
 * @brief Преобразования domain ↔ JSON для HTTP-обработчиков
 *
 * Деньги передаются строками ("100.00"), чтобы не терять точность.
 * На входе принимаются и строки, и числа JSON.
 */
class JsonMapper {
public:
    /**
     * @throws std::invalid_argument если поле отсутствует или не число
     */
    static domain::Decimal decimalField(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || body[key].is_null()) {
            throw std::invalid_argument("Field '" + key + "' is required");
        }
        return toDecimal(body[key], key);
    }

    static domain::Decimal decimalField(const nlohmann::json& body, const std::string& key,
                                        const domain::Decimal& defaultValue) {
        if (!body.contains(key) || body[key].is_null()) {
            return defaultValue;
        }
        return toDecimal(body[key], key);
    }

    /**
     * @brief Дата из поля, по умолчанию сегодня
     */
    static domain::Date dateField(const nlohmann::json& body, const std::string& key) {
        if (!body.contains(key) || body[key].is_null()) {
            return domain::Date::today();
        }
        if (!body[key].is_string()) {
            throw std::invalid_argument("Field '" + key + "' must be YYYY-MM-DD");
        }
        return domain::Date::fromString(body[key].get<std::string>());
    }

    /**
     * @brief {"my_pct": "1", "counterparty_pct": "9"} — клиент компании,
     * {"my_pct": "10"} — личный клиент
     */
    static domain::BeneficiarySplit splitFromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::invalid_argument("Share split must be an object");
        }
        auto myPct = decimalField(j, "my_pct");
        if (j.contains("counterparty_pct") && !j["counterparty_pct"].is_null()) {
            return domain::BeneficiarySplit::dual(myPct, decimalField(j, "counterparty_pct"));
        }
        return domain::BeneficiarySplit::single(myPct);
    }

    static nlohmann::json toJson(const domain::BeneficiarySplit& split) {
        nlohmann::json j;
        j["type"] = split.isDual() ? "DUAL" : "SINGLE";
        j["my_pct"] = split.myPct().toString();
        if (split.isDual()) {
            j["counterparty_pct"] = split.counterpartyPct().toString();
        }
        j["total_pct"] = split.totalPct().toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Account& account) {
        nlohmann::json j;
        j["account_id"] = account.accountId;
        j["client_name"] = account.clientName;
        j["exchange_name"] = account.exchangeName;
        j["loss_split"] = toJson(account.lossSplit);
        j["profit_split"] = toJson(account.profitSplit);
        j["cached_capital"] = account.cachedCapital.toString();
        j["cached_balance"] = account.cachedBalance.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::Transaction& tx) {
        nlohmann::json j;
        j["id"] = tx.id;
        j["account_id"] = tx.accountId;
        j["sequence"] = tx.sequence;
        j["date"] = tx.date.toString();
        j["kind"] = domain::toString(tx.kind);
        j["amount"] = tx.amount.toString();
        if (tx.kind == domain::TransactionKind::BALANCE_RECORD) {
            j["adjustment"] = tx.adjustment.toString();
        }
        if (tx.capitalClosed) {
            j["capital_closed"] = tx.capitalClosed->toString();
            j["your_share_amount"] = tx.yourShareAmount.toString();
            j["counterparty_share_amount"] = tx.counterpartyShareAmount.toString();
        }
        if (tx.settlementId) j["settlement_id"] = *tx.settlementId;
        if (tx.snapshotId) j["snapshot_id"] = *tx.snapshotId;
        if (tx.balanceReference) {
            j["balance_reference"] = {
                {"date", tx.balanceReference->date.toString()},
                {"sequence", tx.balanceReference->sequence},
                {"balance", tx.balanceReference->balance.toString()}};
        }
        j["note"] = tx.note;
        return j;
    }

    static nlohmann::json toJson(const domain::LedgerState& state) {
        nlohmann::json j;
        j["account_id"] = state.accountId;
        j["position"] = domain::toString(state.position);
        j["capital"] = state.capital.toString();
        j["current_balance"] = state.currentBalance.toString();
        j["loss"] = state.loss.toString();
        j["profit"] = state.profit.toString();
        j["pending"] = state.pending.toString();
        j["pending_my_share"] = state.pendingMyShare.toString();
        j["pending_counterparty_share"] = state.pendingCounterpartyShare.toString();
        j["remaining_loss"] = state.remainingLoss.toString();
        j["remaining_profit"] = state.remainingProfit.toString();
        j["active_snapshot_id"] = state.activeSnapshotId ? nlohmann::json(*state.activeSnapshotId) : nlohmann::json();
        j["cached_capital"] = state.cachedCapital.toString();
        j["cached_balance"] = state.cachedBalance.toString();
        if (state.asOf) {
            j["as_of"] = state.asOf->toString();
        }
        return j;
    }

    static nlohmann::json toJson(const domain::SettlementOutcome& outcome) {
        nlohmann::json j;
        j["settlement_id"] = outcome.settlementId;
        j["transaction_id"] = outcome.transactionId;
        j["snapshot_id"] = outcome.snapshotId;
        j["kind"] = domain::toString(outcome.kind);
        j["date"] = outcome.date.toString();
        j["payment_amount"] = outcome.paymentAmount.toString();
        j["capital_closed"] = outcome.capitalClosed.toString();
        j["remaining"] = outcome.remainingAfter.toString();
        j["pending"] = outcome.pendingAfter.toString();
        j["snapshot_settled"] = outcome.snapshotSettled;
        j["your_share_amount"] = outcome.yourShareAmount.toString();
        j["counterparty_share_amount"] = outcome.counterpartyShareAmount.toString();
        j["payment_my_share"] = outcome.paymentMyShare.toString();
        j["payment_counterparty_share"] = outcome.paymentCounterpartyShare.toString();
        return j;
    }

    static nlohmann::json toJson(const domain::PendingEntry& entry) {
        nlohmann::json j;
        j["account_id"] = entry.accountId;
        j["client_name"] = entry.clientName;
        j["exchange_name"] = entry.exchangeName;
        j["snapshot_id"] = entry.snapshotId;
        j["kind"] = domain::toString(entry.kind);
        j["direction"] = entry.kind == domain::SnapshotKind::LOSS ? "CLIENT_OWES" : "WE_OWE";
        j["remaining"] = entry.remaining.toString();
        j["pending"] = entry.pending.toString();
        j["my_share"] = entry.myShare.toString();
        j["counterparty_share"] = entry.counterpartyShare.toString();
        return j;
    }

    static int httpStatus(domain::SettlementStatus status) {
        switch (status) {
            case domain::SettlementStatus::SETTLED: return 201;
            case domain::SettlementStatus::DUPLICATE: return 200;
            case domain::SettlementStatus::INVALID_PAYMENT: return 422;
            case domain::SettlementStatus::CAPITAL_EXCEEDED: return 422;
            case domain::SettlementStatus::NO_ACTIVE_LOSS: return 409;
            case domain::SettlementStatus::NO_ACTIVE_PROFIT: return 409;
            case domain::SettlementStatus::CONCURRENCY_CONFLICT: return 409;
            case domain::SettlementStatus::ACCOUNT_NOT_FOUND: return 404;
            default: return 500;
        }
    }

    static int httpStatus(domain::LedgerStatus status) {
        switch (status) {
            case domain::LedgerStatus::OK: return 201;
            case domain::LedgerStatus::INVALID_AMOUNT: return 422;
            case domain::LedgerStatus::FUNDING_BLOCKED: return 409;
            case domain::LedgerStatus::CONCURRENCY_CONFLICT: return 409;
            case domain::LedgerStatus::ACCOUNT_NOT_FOUND: return 404;
            default: return 500;
        }
    }

    static void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }

private:
    static domain::Decimal toDecimal(const nlohmann::json& value, const std::string& key) {
        if (value.is_string()) {
            return domain::Decimal::parse(value.get<std::string>());
        }
        if (value.is_number_integer()) {
            return domain::Decimal::fromUnits(value.get<int64_t>());
        }
        if (value.is_number_float()) {
            return domain::Decimal::parse(value.dump());
        }
        throw std::invalid_argument("Field '" + key + "' must be a decimal number");
    }
};

} // namespace ledger::adapters::primary
