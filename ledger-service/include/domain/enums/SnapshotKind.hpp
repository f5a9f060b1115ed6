#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Вид замороженного эпизода: убыток клиента или прибыль к выплате
 */
enum class SnapshotKind {
    LOSS,
    PROFIT
};

inline std::string toString(SnapshotKind kind) {
    switch (kind) {
        case SnapshotKind::LOSS: return "LOSS";
        case SnapshotKind::PROFIT: return "PROFIT";
        default: return "UNKNOWN";
    }
}

inline SnapshotKind parseSnapshotKind(const std::string& str) {
    if (str == "LOSS") return SnapshotKind::LOSS;
    if (str == "PROFIT") return SnapshotKind::PROFIT;
    throw std::invalid_argument("Unknown snapshot kind: " + str);
}

} // namespace ledger::domain
