#pragma once

#include <gmock/gmock.h>
#include "ports/input/ICashService.hpp"

namespace pharmacy::tests {

class MockCashService : public ports::input::ICashService {
public:
    MOCK_METHOD(domain::BankAccount, openAccount, (const std::string&, const domain::Money&), (override));
    MOCK_METHOD(domain::BankLedgerEntry, importStatementEntry, (const domain::StatementEntryRequest&), (override));
    MOCK_METHOD(domain::BankLedgerEntry, approve, (int64_t, const std::string&), (override));
    MOCK_METHOD(std::vector<domain::BankLedgerEntry>, unreconciled, (const std::optional<std::string>&), (override));
    MOCK_METHOD(domain::BankLedgerEntry, resolveFlagged, (int64_t, const domain::FlagResolution&), (override));
    MOCK_METHOD(domain::Money, balance, (const std::string&), (override));
    MOCK_METHOD(domain::Money, balanceAsOf, (const std::string&, const domain::Timestamp&), (override));
    MOCK_METHOD(std::vector<domain::BankLedgerEntry>, statement,
                (const std::string&, const std::optional<domain::Timestamp>&, const std::optional<domain::Timestamp>&),
                (override));
    MOCK_METHOD(domain::ContinuityReport, verifyContinuity, (const std::string&), (override));
};

} // namespace pharmacy::tests
