// include/adapters/secondary/PostgresConnection.hpp
#pragma once

#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace bookkeeping::adapters::secondary {

/**
 * @brief Общее подключение к PostgreSQL для трёх Postgres*Repository
 *
 * Одно подключение и один mutex: запись транзакции и изменение
 * балансов выполняются в одной pqxx::work.
 *
 * Таблицы:
 * - companies (id BIGSERIAL, name UNIQUE, balance BIGINT в минорных единицах)
 * - users (company_id → companies ON DELETE SET NULL)
 * - transactions (amount BIGINT CHECK > 0, from/to_type IN company|user|cash)
 */
class PostgresConnection {
public:
    explicit PostgresConnection(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresConnection] Connecting to " << settings_->getHost()
                  << ":" << settings_->getPort() << "/" << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresConnection] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresConnection] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PostgresConnection() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    /**
     * @brief Захватить подключение на время одной pqxx::work
     */
    std::unique_lock<std::mutex> lock() {
        return std::unique_lock<std::mutex>(mutex_);
    }

    pqxx::connection& raw() { return *connection_; }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    void initSchema() {
        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS companies (
                    id BIGSERIAL PRIMARY KEY,
                    name TEXT NOT NULL UNIQUE,
                    address TEXT,
                    phone TEXT,
                    email TEXT,
                    balance BIGINT NOT NULL DEFAULT 0,
                    created_at TIMESTAMP NOT NULL DEFAULT clock_timestamp()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS users (
                    id BIGSERIAL PRIMARY KEY,
                    company_id BIGINT REFERENCES companies (id) ON DELETE SET NULL,
                    name TEXT NOT NULL,
                    email TEXT,
                    role TEXT,
                    department TEXT,
                    balance BIGINT NOT NULL DEFAULT 0,
                    created_at TIMESTAMP NOT NULL DEFAULT clock_timestamp()
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS transactions (
                    id BIGSERIAL PRIMARY KEY,
                    transaction_date DATE NOT NULL,
                    amount BIGINT NOT NULL CHECK (amount > 0),
                    from_type TEXT NOT NULL CHECK (from_type IN ('company', 'user', 'cash')),
                    from_id BIGINT NOT NULL,
                    to_type TEXT NOT NULL CHECK (to_type IN ('company', 'user', 'cash')),
                    to_id BIGINT NOT NULL,
                    description TEXT,
                    reference TEXT,
                    created_at TIMESTAMP NOT NULL DEFAULT clock_timestamp(),
                    CHECK (NOT (from_type = 'cash' AND to_type = 'cash'))
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_date ON transactions (transaction_date)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_from ON transactions (from_type, from_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_transactions_to ON transactions (to_type, to_id)");

            txn.commit();
            std::cout << "[PostgresConnection] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresConnection] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

} // namespace bookkeeping::adapters::secondary
