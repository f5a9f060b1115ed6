#pragma once

#include <IHttpHandler.hpp>
#include "JsonMapper.hpp"
#include "ports/input/IAccountService.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace ledger::adapters::primary
{

    /**
     * @brief Счета клиентов на биржах
     *
     * POST /api/v1/accounts      — открыть счёт
     * GET  /api/v1/accounts/{id} — получить счёт
     * PUT  /api/v1/accounts/{id} — доли по умолчанию для следующих снимков
     */
    class AccountHandler : public IHttpHandler
    {
    public:
        explicit AccountHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[AccountHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            try
            {
                const auto &method = req.getMethod();
                if (method == "POST")
                {
                    handleOpen(req, res);
                }
                else if (method == "GET")
                {
                    handleGet(req, res);
                }
                else if (method == "PUT")
                {
                    handleUpdateShares(req, res);
                }
                else
                {
                    JsonMapper::sendError(res, 405, "Method not allowed");
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                JsonMapper::sendError(res, 400, "Invalid JSON");
            }
            catch (const std::invalid_argument &e)
            {
                JsonMapper::sendError(res, 400, e.what());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[AccountHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;

        void handleOpen(IRequest &req, IResponse &res)
        {
            auto body = nlohmann::json::parse(req.getBody());

            ports::input::OpenAccountRequest request;
            request.clientName = body.value("client_name", "");
            request.exchangeName = body.value("exchange_name", "");
            request.lossSplit = JsonMapper::splitFromJson(body.value("loss_split", nlohmann::json::object()));
            request.profitSplit = JsonMapper::splitFromJson(body.value("profit_split", nlohmann::json::object()));

            auto account = accountService_->openAccount(request);
            res.setResult(201, "application/json", JsonMapper::toJson(account).dump());
        }

        void handleGet(IRequest &req, IResponse &res)
        {
            std::string accountId = req.getPathParam(0).value_or("");
            if (accountId.empty())
            {
                JsonMapper::sendError(res, 400, "Account ID is required");
                return;
            }

            auto account = accountService_->getAccount(accountId);
            if (!account)
            {
                JsonMapper::sendError(res, 404, "Account not found");
                return;
            }
            res.setResult(200, "application/json", JsonMapper::toJson(*account).dump());
        }

        void handleUpdateShares(IRequest &req, IResponse &res)
        {
            std::string accountId = req.getPathParam(0).value_or("");
            if (accountId.empty())
            {
                JsonMapper::sendError(res, 400, "Account ID is required");
                return;
            }

            auto body = nlohmann::json::parse(req.getBody());
            auto lossSplit = JsonMapper::splitFromJson(body.value("loss_split", nlohmann::json::object()));
            auto profitSplit = JsonMapper::splitFromJson(body.value("profit_split", nlohmann::json::object()));

            if (!accountService_->updateShareDefaults(accountId, lossSplit, profitSplit))
            {
                JsonMapper::sendError(res, 404, "Account not found");
                return;
            }

            auto account = accountService_->getAccount(accountId);
            res.setResult(200, "application/json", account ? JsonMapper::toJson(*account).dump() : "{}");
        }
    };

} // namespace ledger::adapters::primary
