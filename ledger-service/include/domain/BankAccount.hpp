#pragma once

#include "domain/Money.hpp"
#include "domain/Timestamp.hpp"
#include <string>

namespace pharmacy::domain {

/**
 * @brief Банковский счёт с известным начальным остатком
 */
struct BankAccount {
    std::string accountId;
    Money openingBalance;
    std::string currency = "INR";
    Timestamp openedAt;
};

} // namespace pharmacy::domain
