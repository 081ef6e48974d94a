// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace economy::settings
{

    /**
     * @brief Настройки хранилища леджера
     *
     * ECONOMY_STORE_BACKEND: memory (по умолчанию) или postgres.
     * Параметры PostgreSQL читаются из ECONOMY_DB_* (K8s ENV).
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            backend_ = getEnvOrDefault("ECONOMY_STORE_BACKEND", "memory");
            host_ = getEnvOrDefault("ECONOMY_DB_HOST", "economy-postgres");
            port_ = std::stoi(getEnvOrDefault("ECONOMY_DB_PORT", "5432"));
            name_ = getEnvOrDefault("ECONOMY_DB_NAME", "economy_db");
            user_ = getEnvOrDefault("ECONOMY_DB_USER", "economy_user");
            password_ = getEnvOrDefault("ECONOMY_DB_PASSWORD", "economy_secret_password");
            statementTimeoutMs_ = std::stoi(getEnvOrDefault("ECONOMY_DB_STATEMENT_TIMEOUT_MS", "5000"));

            if (backend_ != "memory" && backend_ != "postgres")
            {
                throw std::invalid_argument("ECONOMY_STORE_BACKEND must be memory or postgres, got: " + backend_);
            }
            if (statementTimeoutMs_ <= 0)
            {
                throw std::invalid_argument("ECONOMY_DB_STATEMENT_TIMEOUT_MS must be positive");
            }
        }

        std::string getBackend() const { return backend_; }
        bool usePostgres() const { return backend_ == "postgres"; }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }
        int getStatementTimeoutMs() const { return statementTimeoutMs_; }

        std::string getConnectionString() const
        {
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string backend_;
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;
        int statementTimeoutMs_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace economy::settings
