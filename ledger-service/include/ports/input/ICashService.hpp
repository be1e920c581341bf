#pragma once

#include "domain/BankAccount.hpp"
#include "domain/BankLedgerEntry.hpp"
#include "domain/CashRequests.hpp"
#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::ports::input {

/**
 * @brief Сервис сверки банковского счёта
 */
class ICashService {
public:
    virtual ~ICashService() = default;

    virtual domain::BankAccount openAccount(const std::string& accountId, const domain::Money& openingBalance) = 0;

    virtual domain::BankLedgerEntry importStatementEntry(const domain::StatementEntryRequest& request) = 0;

    virtual domain::BankLedgerEntry approve(int64_t entryId, const std::string& approver) = 0;

    virtual std::vector<domain::BankLedgerEntry> unreconciled(const std::optional<std::string>& accountId) = 0;

    virtual domain::BankLedgerEntry resolveFlagged(int64_t entryId, const domain::FlagResolution& resolution) = 0;

    virtual domain::Money balance(const std::string& accountId) = 0;

    virtual domain::Money balanceAsOf(const std::string& accountId, const domain::Timestamp& at) = 0;

    /**
     * @brief Отчёт по счёту, новые строки первыми
     */
    virtual std::vector<domain::BankLedgerEntry> statement(const std::string& accountId,
                                                           const std::optional<domain::Timestamp>& from,
                                                           const std::optional<domain::Timestamp>& to) = 0;

    virtual domain::ContinuityReport verifyContinuity(const std::string& accountId) = 0;
};

} // namespace pharmacy::ports::input
