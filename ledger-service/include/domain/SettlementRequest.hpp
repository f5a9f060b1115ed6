#pragma once

#include "Date.hpp"
#include "Decimal.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Запрос на оплату убытка или выплату прибыли
 */
struct SettlementRequest {
    std::string accountId;
    Decimal amount;
    Date date;
    std::string note;
    std::string requestKey;     ///< Необязательный ключ идемпотентности клиента
};

} // namespace ledger::domain
