#include "LedgerApp.hpp"
#include <csignal>
#include <cstring>
#include <iostream>

namespace {

ledger::LedgerApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

/**
 * @brief Разовый прогон сверки кэшей без запуска HTTP сервера
 *
 * Код возврата ненулевой, если хотя бы один счёт не удалось сверить.
 */
int reconcileCachesOnce() {
    auto ledgerSettings = std::make_shared<ledger::settings::LedgerSettings>();
    auto store = ledger::LedgerApp::createStore(ledgerSettings, std::make_shared<ledger::settings::DbSettings>());

    ledger::application::AccountService accounts(store);
    auto report = accounts.reconcileCaches();

    std::cout << "[main] Cache reconcile: checked=" << report.accountsChecked
              << " drifted=" << report.drifted
              << " failed=" << report.failed << std::endl;
    return report.failed > 0 ? 2 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc > 1 && std::strcmp(argv[1], "--reconcile-caches") == 0) {
            return reconcileCachesOnce();
        }

        ledger::LedgerApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        ledger::settings::LedgerSettings settings;
        std::cout << "[main] Ledger Service v1.0.0, store=" << settings.getStore()
                  << ", lock timeout " << settings.getLockTimeout().count() << " ms" << std::endl;

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Ledger Service stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
