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
     * @brief POST /api/v1/maintenance/reconcile-caches — пересчёт кэшей всех счетов
     */
    class MaintenanceHandler : public IHttpHandler
    {
    public:
        explicit MaintenanceHandler(std::shared_ptr<ports::input::IAccountService> accountService)
            : accountService_(std::move(accountService))
        {
            std::cout << "[MaintenanceHandler] Created" << std::endl;
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
                auto report = accountService_->reconcileCaches();

                nlohmann::json response;
                response["accounts_checked"] = report.accountsChecked;
                response["drifted"] = report.drifted;
                response["failed"] = report.failed;
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[MaintenanceHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IAccountService> accountService_;
    };

} // namespace ledger::adapters::primary
