// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace pharmacy::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения (K8s ENV):
     * LEDGER_DB_HOST, LEDGER_DB_PORT, LEDGER_DB_NAME, LEDGER_DB_USER,
     * LEDGER_DB_PASSWORD, LEDGER_DB_CONNECT_TIMEOUT (секунды),
     * LEDGER_DB_APP_NAME (видно в pg_stat_activity).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("LEDGER_DB_HOST", "ledger-postgres");
            port_ = std::stoi(getEnvOrDefault("LEDGER_DB_PORT", "5432"));
            name_ = getEnvOrDefault("LEDGER_DB_NAME", "pharmacy_ledger");
            user_ = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
            password_ = getEnvOrDefault("LEDGER_DB_PASSWORD", "ledger_secret_password");
            connectTimeout_ = std::stoi(getEnvOrDefault("LEDGER_DB_CONNECT_TIMEOUT", "5"));
            applicationName_ = getEnvOrDefault("LEDGER_DB_APP_NAME", "ledger-service");
            if (port_ <= 0 || connectTimeout_ <= 0) {
                throw std::invalid_argument("LEDGER_DB_PORT and LEDGER_DB_CONNECT_TIMEOUT must be positive");
            }
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }
        int getConnectTimeout() const { return connectTimeout_; }
        std::string getApplicationName() const { return applicationName_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_ +
                   " connect_timeout=" + std::to_string(connectTimeout_) +
                   " application_name=" + applicationName_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int connectTimeout_;
        std::string applicationName_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace pharmacy::settings
