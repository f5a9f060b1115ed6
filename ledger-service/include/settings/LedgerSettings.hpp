#pragma once

#include <chrono>
#include <cstdlib>
#include <string>

namespace ledger::settings
{

    /**
     * @brief Настройки движка журнала
     *
     * LEDGER_STORE: "postgres" (по умолчанию) или "memory".
     * LEDGER_LOCK_TIMEOUT_MS: сколько ждать блокировку счёта.
     */
    class LedgerSettings
    {
    public:
        LedgerSettings()
        {
            store_ = getEnvOrDefault("LEDGER_STORE", "postgres");
            lockTimeout_ = std::chrono::milliseconds(std::stol(getEnvOrDefault("LEDGER_LOCK_TIMEOUT_MS", "5000")));
        }

        std::string getStore() const { return store_; }
        bool useInMemoryStore() const { return store_ == "memory"; }
        std::chrono::milliseconds getLockTimeout() const { return lockTimeout_; }

    private:
        std::string store_;
        std::chrono::milliseconds lockTimeout_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace ledger::settings
