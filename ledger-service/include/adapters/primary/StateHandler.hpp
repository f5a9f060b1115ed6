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
     * @brief GET /api/v1/state/{accountId}[?as_of=YYYY-MM-DD]
     *
     * Роутер регистрирует с паттерном "/api/v1/state/*".
     * С as_of возвращает состояние на конец указанной даты.
     */
    class StateHandler : public IHttpHandler
    {
    public:
        explicit StateHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[StateHandler] Created" << std::endl;
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
                auto asOf = req.getQueryParam("as_of").value_or("");
                auto state = asOf.empty()
                                 ? ledgerService_->getState(accountId)
                                 : ledgerService_->getStateAsOf(accountId, domain::Date::fromString(asOf));

                if (!state)
                {
                    JsonMapper::sendError(res, 404, "Account not found");
                    return;
                }

                res.setResult(200, "application/json", JsonMapper::toJson(*state).dump());
            }
            catch (const std::invalid_argument &e)
            {
                JsonMapper::sendError(res, 400, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[StateHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace ledger::adapters::primary
