#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "JsonMapper.hpp"
#include "settings/LedgerSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace ledger::adapters::primary {

/**
 * @brief GET /health
 *
 * Кроме статуса сообщает выбранное хранилище и таймаут блокировки счёта.
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<settings::LedgerSettings> settings)
        : settings_(std::move(settings)) {}

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            JsonMapper::sendError(res, 405, "Method not allowed");
            return;
        }

        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "ledger-service";
        response["version"] = "1.0.0";
        response["store"] = settings_->getStore();
        response["lock_timeout_ms"] = settings_->getLockTimeout().count();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
};

} // namespace ledger::adapters::primary
