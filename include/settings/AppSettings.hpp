// include/settings/AppSettings.hpp
#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace bookkeeping::settings
{

    /**
     * @brief Вид хранилища счетов и журнала
     */
    enum class StorageKind
    {
        MEMORY,     ///< In-memory, данные живут до выхода из процесса
        POSTGRES    ///< PostgreSQL через libpqxx
    };

    /**
     * @brief Настройки приложения из ENV
     *
     * - ACCOUNT_STORAGE: memory | postgres (по умолчанию memory)
     * - ACCOUNT_CURRENCY_SYMBOL: символ валюты для консоли (по умолчанию ₹)
     * - ACCOUNT_DEMO_DATA: true — засеять демо-счета в memory-хранилище
     */
    class AppSettings
    {
    public:
        AppSettings()
        {
            std::string storage = getEnvOrDefault("ACCOUNT_STORAGE", "memory");
            if (storage == "memory")
            {
                storage_ = StorageKind::MEMORY;
            }
            else if (storage == "postgres")
            {
                storage_ = StorageKind::POSTGRES;
            }
            else
            {
                throw std::invalid_argument("ACCOUNT_STORAGE must be 'memory' or 'postgres', got: " + storage);
            }

            currencySymbol_ = getEnvOrDefault("ACCOUNT_CURRENCY_SYMBOL", "\xE2\x82\xB9");
            demoData_ = getEnvOrDefault("ACCOUNT_DEMO_DATA", "false") == "true";
        }

        StorageKind getStorage() const { return storage_; }
        std::string getCurrencySymbol() const { return currencySymbol_; }
        bool withDemoData() const { return demoData_; }

    private:
        StorageKind storage_ = StorageKind::MEMORY;
        std::string currencySymbol_;
        bool demoData_ = false;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace bookkeeping::settings
