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
     * @brief GET /api/v1/transactions/{accountId} — журнал счёта
     */
    class TransactionsHandler : public IHttpHandler
    {
    public:
        explicit TransactionsHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[TransactionsHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                JsonMapper::sendError(res, 405, "Method not allowed");
                return;
            }

            std::string accountId = req.getPathParam(0).value_or("");
            if (accountId.empty())
            {
                JsonMapper::sendError(res, 400, "Account ID is required");
                return;
            }

            try
            {
                auto transactions = ledgerService_->getTransactions(accountId);
                if (!transactions)
                {
                    JsonMapper::sendError(res, 404, "Account not found");
                    return;
                }

                nlohmann::json items = nlohmann::json::array();
                for (const auto &tx : *transactions)
                {
                    items.push_back(JsonMapper::toJson(tx));
                }

                nlohmann::json response;
                response["account_id"] = accountId;
                response["transactions"] = items;
                response["total"] = transactions->size();
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[TransactionsHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace ledger::adapters::primary
