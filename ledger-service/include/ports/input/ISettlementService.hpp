#pragma once

#include "domain/SettlementRequest.hpp"
#include "domain/SettlementResult.hpp"

namespace ledger::ports::input {

/**
 * @brief Интерфейс процессора оплат
 */
class ISettlementService {
public:
    virtual ~ISettlementService() = default;

    /**
     * @brief Оплата клиентом активного убытка
     */
    virtual domain::SettlementResult settle(const domain::SettlementRequest& request) = 0;

    /**
     * @brief Выплата клиенту доли активной прибыли
     */
    virtual domain::SettlementResult payProfit(const domain::SettlementRequest& request) = 0;
};

} // namespace ledger::ports::input
