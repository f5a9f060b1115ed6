#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Состояние счёта в автомате NEUTRAL / LOSS / PROFIT
 *
 * Переходы LOSS → PROFIT и PROFIT → LOSS запрещены, только через NEUTRAL.
 */
enum class AccountPosition {
    NEUTRAL,
    LOSS,
    PROFIT
};

inline std::string toString(AccountPosition position) {
    switch (position) {
        case AccountPosition::NEUTRAL: return "NEUTRAL";
        case AccountPosition::LOSS: return "LOSS";
        case AccountPosition::PROFIT: return "PROFIT";
        default: return "UNKNOWN";
    }
}

} // namespace ledger::domain
