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
     * @brief POST /api/v1/fundings — пополнение счёта
     *
     * Пока у счёта активный снимок, отвечает 409.
     */
    class FundingHandler : public IHttpHandler
    {
    public:
        explicit FundingHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[FundingHandler] Created" << std::endl;
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

                auto result = ledgerService_->createFunding(
                    accountId,
                    JsonMapper::decimalField(body, "amount"),
                    JsonMapper::dateField(body, "date"),
                    body.value("note", ""));

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
                std::cerr << "[FundingHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace ledger::adapters::primary
