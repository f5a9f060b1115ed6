// include/LedgerApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

// Ports
#include "ports/input/IAccountService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/input/ISettlementService.hpp"
#include "ports/output/ILedgerStore.hpp"

// Application
#include "application/AccountService.hpp"
#include "application/LedgerService.hpp"
#include "application/SettlementService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/PostgresLedgerStore.hpp"

// Primary Adapters
#include "adapters/primary/AccountHandler.hpp"
#include "adapters/primary/BalanceRecordHandler.hpp"
#include "adapters/primary/FundingHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MaintenanceHandler.hpp"
#include "adapters/primary/PendingSummaryHandler.hpp"
#include "adapters/primary/SettlementHandler.hpp"
#include "adapters/primary/StateHandler.hpp"
#include "adapters/primary/TransactionsHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace ledger
{

    /**
     * @brief Ledger Service Application
     *
     * Единственная точка изменения денег — SettlementService (оплаты),
     * LedgerService (пополнения и записи баланса). Хранилище выбирается
     * переменной LEDGER_STORE.
     */
    class LedgerApp : public BoostBeastApplication
    {
    public:
        LedgerApp() { std::cout << "[LedgerApp] Initializing..." << std::endl; }
        ~LedgerApp() override { std::cout << "[LedgerApp] Shutting down..." << std::endl; }

        /**
         * @brief Хранилище по LEDGER_STORE: "memory" или PostgreSQL
         */
        static std::shared_ptr<ports::output::ILedgerStore> createStore(
            std::shared_ptr<settings::LedgerSettings> ledgerSettings,
            std::shared_ptr<settings::DbSettings> dbSettings)
        {
            if (ledgerSettings->useInMemoryStore())
            {
                std::cout << "[LedgerApp] Using in-memory ledger store" << std::endl;
                return std::make_shared<adapters::secondary::InMemoryLedgerStore>(ledgerSettings->getLockTimeout());
            }
            std::cout << "[LedgerApp] Using PostgreSQL ledger store at " << dbSettings->getHost() << std::endl;
            return std::make_shared<adapters::secondary::PostgresLedgerStore>(std::move(dbSettings),
                                                                              std::move(ledgerSettings));
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[LedgerApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[LedgerApp] Configuring DI..." << std::endl;

            // Шаг 1: Хранилище журнала (один экземпляр на процесс)
            auto ledgerSettings = std::make_shared<settings::LedgerSettings>();
            auto store = createStore(ledgerSettings, std::make_shared<settings::DbSettings>());

            // Шаг 2: Сервисы
            auto injector = di::make_injector(
                di::bind<ports::output::ILedgerStore>().to(store),
                di::bind<ports::input::ISettlementService>().to<application::SettlementService>().in(di::singleton),
                di::bind<ports::input::ILedgerService>().to<application::LedgerService>().in(di::singleton),
                di::bind<ports::input::IAccountService>().to<application::AccountService>().in(di::singleton));

            // Шаг 3: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = std::make_shared<adapters::primary::HealthHandler>(ledgerSettings);

            auto settlementHandler = injector.create<std::shared_ptr<adapters::primary::SettlementHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/settlements")] = settlementHandler;
            handlers_[getHandlerKey("POST", "/api/v1/profit-payouts")] = settlementHandler;

            handlers_[getHandlerKey("POST", "/api/v1/fundings")] =
                injector.create<std::shared_ptr<adapters::primary::FundingHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/balance-records")] =
                injector.create<std::shared_ptr<adapters::primary::BalanceRecordHandler>>();

            handlers_[getHandlerKey("GET", "/api/v1/state/*")] =
                injector.create<std::shared_ptr<adapters::primary::StateHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/transactions/*")] =
                injector.create<std::shared_ptr<adapters::primary::TransactionsHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/pending")] =
                injector.create<std::shared_ptr<adapters::primary::PendingSummaryHandler>>();

            auto accountHandler = injector.create<std::shared_ptr<adapters::primary::AccountHandler>>();
            handlers_[getHandlerKey("POST", "/api/v1/accounts")] = accountHandler;
            handlers_[getHandlerKey("GET", "/api/v1/accounts/*")] = accountHandler;
            handlers_[getHandlerKey("PUT", "/api/v1/accounts/*")] = accountHandler;

            handlers_[getHandlerKey("POST", "/api/v1/maintenance/reconcile-caches")] =
                injector.create<std::shared_ptr<adapters::primary::MaintenanceHandler>>();

            std::cout << "[LedgerApp] Ready" << std::endl;
        }
    };

} // namespace ledger
