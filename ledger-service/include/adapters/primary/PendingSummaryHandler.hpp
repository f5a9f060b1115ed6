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
     * @brief GET /api/v1/pending — кто кому должен
     *
     * Разделяет счета на «клиенты должны» (LOSS) и «мы должны» (PROFIT).
     */
    class PendingSummaryHandler : public IHttpHandler
    {
    public:
        explicit PendingSummaryHandler(std::shared_ptr<ports::input::ILedgerService> ledgerService)
            : ledgerService_(std::move(ledgerService))
        {
            std::cout << "[PendingSummaryHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                JsonMapper::sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto entries = ledgerService_->getPendingSummary();

                nlohmann::json clientsOwe = nlohmann::json::array();
                nlohmann::json weOwe = nlohmann::json::array();
                domain::Decimal totalClientsOwe;
                domain::Decimal totalWeOwe;

                for (const auto &entry : entries)
                {
                    if (entry.kind == domain::SnapshotKind::LOSS)
                    {
                        clientsOwe.push_back(JsonMapper::toJson(entry));
                        totalClientsOwe += entry.pending;
                    }
                    else
                    {
                        weOwe.push_back(JsonMapper::toJson(entry));
                        totalWeOwe += entry.pending;
                    }
                }

                nlohmann::json response;
                response["clients_owe"] = clientsOwe;
                response["we_owe"] = weOwe;
                response["total_clients_owe"] = totalClientsOwe.toString();
                response["total_we_owe"] = totalWeOwe.toString();
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PendingSummaryHandler] Error: " << e.what() << std::endl;
                JsonMapper::sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    };

} // namespace ledger::adapters::primary
