#pragma once

#include "domain/Account.hpp"
#include "domain/BeneficiarySplit.hpp"
#include <optional>
#include <string>

namespace ledger::ports::input {

struct OpenAccountRequest {
    std::string clientName;
    std::string exchangeName;
    domain::BeneficiarySplit lossSplit;
    domain::BeneficiarySplit profitSplit;
};

struct CacheReconcileReport {
    int accountsChecked = 0;
    int drifted = 0;        ///< Кэш расходился с журналом
    int failed = 0;         ///< Не удалось взять блокировку или нарушены инварианты
};

/**
 * @brief Интерфейс управления счетами
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @throws std::invalid_argument при пустых именах или неверных долях
     */
    virtual domain::Account openAccount(const OpenAccountRequest& request) = 0;

    virtual std::optional<domain::Account> getAccount(const std::string& accountId) = 0;

    /**
     * @brief Доли по умолчанию для следующих снимков
     *
     * Активный снимок не затрагивается.
     * @return false если счёт не найден
     * @throws std::invalid_argument при неверных долях
     */
    virtual bool updateShareDefaults(const std::string& accountId,
                                     const domain::BeneficiarySplit& lossSplit,
                                     const domain::BeneficiarySplit& profitSplit) = 0;

    /**
     * @brief Пересчитать cached_capital / cached_balance всех счетов
     */
    virtual CacheReconcileReport reconcileCaches() = 0;
};

} // namespace ledger::ports::input
