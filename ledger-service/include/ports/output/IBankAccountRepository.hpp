#pragma once

#include "domain/BankAccount.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pharmacy::ports::output {

class IBankAccountRepository {
public:
    virtual ~IBankAccountRepository() = default;

    /**
     * @return false если счёт уже открыт
     */
    virtual bool insertIfAbsent(const domain::BankAccount& account) = 0;

    virtual std::optional<domain::BankAccount> find(const std::string& accountId) = 0;

    virtual std::vector<domain::BankAccount> findAll() = 0;
};

} // namespace pharmacy::ports::output
