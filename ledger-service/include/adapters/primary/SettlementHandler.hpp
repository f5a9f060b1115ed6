#pragma once

#include <IHttpHandler.hpp>
#include "JsonMapper.hpp"
#include "ports/input/ISettlementService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ledger::adapters::primary
{

    /**
     * @brief Оплаты по снимкам
     *
     * POST /api/v1/settlements     — клиент гасит убыток
     * POST /api/v1/profit-payouts  — выплата клиенту доли прибыли
     *
     * Тело: {"account_id", "amount", "date"?, "note"?, "request_key"?}.
     * Повтор того же запроса возвращает 200 с прежним итогом.
     */
    class SettlementHandler : public IHttpHandler
    {
    public:
        explicit SettlementHandler(std::shared_ptr<ports::input::ISettlementService> settlementService)
            : settlementService_(std::move(settlementService))
        {
            std::cout << "[SettlementHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                JsonMapper::sendError(res, 405, "Method not allowed");
                return;
            }

            bool isProfit = req.getPath().find("/profit-payouts") != std::string::npos;

            domain::SettlementRequest request;
            try
            {
                auto body = nlohmann::json::parse(req.getBody());
                request.accountId = body.value("account_id", "");
                request.amount = JsonMapper::decimalField(body, "amount");
                request.date = JsonMapper::dateField(body, "date");
                request.note = body.value("note", "");
                request.requestKey = body.value("request_key", "");
            }
            catch (const nlohmann::json::exception &e)
            {
                JsonMapper::sendError(res, 400, "Invalid JSON");
                return;
            }
            catch (const std::invalid_argument &e)
            {
                JsonMapper::sendError(res, 400, e.what());
                return;
            }
            catch (const std::overflow_error &e)
            {
                JsonMapper::sendError(res, 400, e.what());
                return;
            }

            if (request.accountId.empty())
            {
                JsonMapper::sendError(res, 400, "account_id is required");
                return;
            }

            try
            {
                auto result = isProfit ? settlementService_->payProfit(request)
                                       : settlementService_->settle(request);

                nlohmann::json response;
                response["status"] = domain::toString(result.status);
                response["message"] = result.message;
                if (result.outcome)
                {
                    response["settlement"] = JsonMapper::toJson(*result.outcome);
                }
                else
                {
                    response["error"] = result.message;
                }

                res.setResult(JsonMapper::httpStatus(result.status), "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[SettlementHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ISettlementService> settlementService_;
    };

} // namespace ledger::adapters::primary
