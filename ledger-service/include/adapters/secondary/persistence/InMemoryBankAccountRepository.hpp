#pragma once

#include "ports/output/IBankAccountRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <memory>

namespace pharmacy::adapters::secondary {

class InMemoryBankAccountRepository : public ports::output::IBankAccountRepository {
public:
    bool insertIfAbsent(const domain::BankAccount& account) override {
        return accounts_.insertIfAbsent(account.accountId, std::make_shared<domain::BankAccount>(account));
    }

    std::optional<domain::BankAccount> find(const std::string& accountId) override {
        auto account = accounts_.find(accountId);
        return account ? std::optional(*account) : std::nullopt;
    }

    std::vector<domain::BankAccount> findAll() override {
        std::vector<domain::BankAccount> result;
        for (const auto& account : accounts_.values()) {
            result.push_back(*account);
        }
        std::sort(result.begin(), result.end(),
            [](const domain::BankAccount& a, const domain::BankAccount& b) {
                return a.accountId < b.accountId;
            });
        return result;
    }

private:
    ThreadSafeMap<std::string, domain::BankAccount> accounts_;
};

} // namespace pharmacy::adapters::secondary
