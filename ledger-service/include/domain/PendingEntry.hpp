#pragma once

#include "Decimal.hpp"
#include "enums/SnapshotKind.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Строка сводки «клиенты должны» / «мы должны»
 */
struct PendingEntry {
    std::string accountId;
    std::string clientName;
    std::string exchangeName;
    std::string snapshotId;
    SnapshotKind kind = SnapshotKind::LOSS;
    Decimal remaining;
    Decimal pending;
    Decimal myShare;
    Decimal counterpartyShare;
};

} // namespace ledger::domain
