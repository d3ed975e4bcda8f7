// include/settings/DbSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace bookkeeping::settings
{

    /**
     * @brief Настройки подключения к PostgreSQL
     *
     * Читает параметры из переменных окружения.
     * Пароль обязателен только при ACCOUNT_STORAGE=postgres:
     * проверяется при первом обращении к getConnectionString().
     */
    class DbSettings
    {
    public:
        DbSettings()
        {
            host_ = getEnvOrDefault("ACCOUNT_DB_HOST", "localhost");
            port_ = std::stoi(getEnvOrDefault("ACCOUNT_DB_PORT", "5432"));
            name_ = getEnvOrDefault("ACCOUNT_DB_NAME", "account_manager");
            user_ = getEnvOrDefault("ACCOUNT_DB_USER", "account_user");
            password_ = getEnvOrDefault("ACCOUNT_DB_PASSWORD", "");
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getName() const { return name_; }
        std::string getUser() const { return user_; }
        std::string getPassword() const { return password_; }

        std::string getConnectionString() const
        {
            if (password_.empty())
            {
                throw std::runtime_error("Required env variable not set: ACCOUNT_DB_PASSWORD");
            }
            return "host=" + host_ + " port=" + std::to_string(port_) +
                   " dbname=" + name_ + " user=" + user_ + " password=" + password_;
        }

    private:
        std::string host_;
        int port_;
        std::string name_;
        std::string user_;
        std::string password_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace bookkeeping::settings
