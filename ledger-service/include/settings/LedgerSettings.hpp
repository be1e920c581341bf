// include/settings/LedgerSettings.hpp
#pragma once

#include "domain/Money.hpp"
#include <chrono>
#include <cstdlib>
#include <string>

namespace pharmacy::settings
{

    /**
     * @brief Параметры движка сверки
     *
     * LEDGER_LOCK_TIMEOUT_MS      - ожидание блокировки ключа за одну попытку (200)
     * LEDGER_LOCK_ATTEMPTS        - число попыток до ConcurrencyTimeoutError (5)
     * LEDGER_BALANCE_TOLERANCE    - допустимое расхождение остатка выписки, "0.00"
     * LEDGER_PAGE_SIZE            - размер страницы чтения журнала (256)
     * LEDGER_EXPIRY_WARNING_DAYS  - горизонт отчёта об истекающих партиях (30)
     */
    class LedgerSettings
    {
    public:
        LedgerSettings()
        {
            lockTimeout_ = std::chrono::milliseconds(std::stoll(getEnvOrDefault("LEDGER_LOCK_TIMEOUT_MS", "200")));
            lockAttempts_ = std::stoi(getEnvOrDefault("LEDGER_LOCK_ATTEMPTS", "5"));
            balanceTolerance_ = domain::Money::parse(getEnvOrDefault("LEDGER_BALANCE_TOLERANCE", "0.00"));
            pageSize_ = static_cast<std::size_t>(std::stoul(getEnvOrDefault("LEDGER_PAGE_SIZE", "256")));
            expiryWarningDays_ = std::stoi(getEnvOrDefault("LEDGER_EXPIRY_WARNING_DAYS", "30"));
        }

        std::chrono::milliseconds getLockTimeout() const { return lockTimeout_; }
        int getLockAttempts() const { return lockAttempts_; }
        domain::Money getBalanceTolerance() const { return balanceTolerance_; }
        std::size_t getPageSize() const { return pageSize_; }
        int getExpiryWarningDays() const { return expiryWarningDays_; }

        // Для тестов
        void setLockTimeout(std::chrono::milliseconds timeout) { lockTimeout_ = timeout; }
        void setLockAttempts(int attempts) { lockAttempts_ = attempts; }
        void setBalanceTolerance(const domain::Money& tolerance) { balanceTolerance_ = tolerance; }
        void setPageSize(std::size_t pageSize) { pageSize_ = pageSize; }

    private:
        std::chrono::milliseconds lockTimeout_;
        int lockAttempts_;
        domain::Money balanceTolerance_;
        std::size_t pageSize_;
        int expiryWarningDays_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace pharmacy::settings
