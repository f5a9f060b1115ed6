#pragma once

#include <IHttpHandler.hpp>
#include "JsonMapper.hpp"
#include "ports/input/ILedgerService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ledger::adapters::primary
{

    /**
     * @brief POST /api/v1/balance-records — записать баланс биржевого счёта
     *
     * Тело: {"account_id", "balance", "adjustment"?, "date"?, "note"?}.
     * Может открыть снимок убытка или прибыли.
     */
    class BalanceRecordHandler : public IHttpHandler
    {
    public:
        explicit BalanceRecordHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[BalanceRecordHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                JsonMapper::sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());
                std::string accountId = body.value("account_id", "");
                if (accountId.empty())
                {
                    JsonMapper::sendError(res, 400, "account_id is required");
                    return;
                }

                auto result = ledgerService_->createBalanceRecord(
                    accountId,
                    JsonMapper::decimalField(body, "balance"),
                    JsonMapper::dateField(body, "date"),
                    body.value("note", ""),
                    JsonMapper::decimalField(body, "adjustment", domain::Decimal::zero()));

                if (!result.isOk())
                {
                    JsonMapper::sendError(res, JsonMapper::httpStatus(result.status), result.message);
                    return;
                }

                nlohmann::json response;
                response["transaction"] = JsonMapper::toJson(*result.transaction);
                response["state"] = JsonMapper::toJson(*result.state);
                res.setResult(201, "application/json", response.dump());
            }
            catch (const nlohmann::json::exception &e)
            {
                JsonMapper::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::invalid_argument &e)
            {
                JsonMapper::sendError(res, 400, e.what());
            }
            catch (const std::overflow_error &e)
            {
                JsonMapper::sendError(res, 400, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[BalanceRecordHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace ledger::adapters::primary
