#pragma once

#include "ports/input/ILedgerService.hpp"
#include <gmock/gmock.h>

namespace ledger::tests {

class MockLedgerService : public ports::input::ILedgerService {
public:
    MOCK_METHOD(domain::LedgerResult, createFunding,
                (const std::string &, const domain::Decimal &, const domain::Date &, const std::string &),
                (override));
    MOCK_METHOD(domain::LedgerResult, createBalanceRecord,
                (const std::string &, const domain::Decimal &, const domain::Date &, const std::string &,
                 const domain::Decimal &),
                (override));
    MOCK_METHOD(std::optional<domain::LedgerState>, getState, (const std::string &), (override));
    MOCK_METHOD(std::optional<domain::LedgerState>, getStateAsOf, (const std::string &, const domain::Date &),
                (override));
    MOCK_METHOD(std::optional<std::vector<domain::Transaction>>, getTransactions, (const std::string &),
                (override));
    MOCK_METHOD(std::vector<domain::PendingEntry>, getPendingSummary, (), (override));
};

} // namespace ledger::tests
