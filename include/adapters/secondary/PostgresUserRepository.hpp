// include/adapters/secondary/PostgresUserRepository.hpp
#pragma once

#include "ports/output/IUserRepository.hpp"
#include "PostgresConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория пользователей
 */
class PostgresUserRepository : public ports::output::IUserRepository {
public:
    explicit PostgresUserRepository(std::shared_ptr<PostgresConnection> db)
        : db_(std::move(db)) {}

    domain::User insert(const domain::User& user) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());

            auto result = txn.exec_params(
                "INSERT INTO users (company_id, name, email, role, department) "
                "VALUES ($1, $2, $3, $4, $5) "
                "RETURNING " + std::string(COLUMNS),
                user.companyId,
                user.name,
                user.email,
                user.role,
                user.department
            );

            txn.commit();
            return rowToUser(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] insert() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::User> findById(int64_t id) override {
        auto users = query("SELECT " + std::string(COLUMNS) + " FROM users WHERE id = $1", id);
        if (users.empty()) return std::nullopt;
        return users.front();
    }

    std::vector<domain::User> findAll() override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec("SELECT " + std::string(COLUMNS) + " FROM users ORDER BY name, id");
            txn.commit();

            std::vector<domain::User> users;
            for (const auto& row : result) {
                users.push_back(rowToUser(row));
            }
            return users;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::vector<domain::User> findByCompanyId(int64_t companyId) override {
        return query("SELECT " + std::string(COLUMNS) + " FROM users WHERE company_id = $1 ORDER BY name, id",
                     companyId);
    }

    bool updateDetails(const domain::User& user) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec_params(
                "UPDATE users SET company_id = $2, name = $3, email = $4, role = $5, department = $6 "
                "WHERE id = $1",
                user.id,
                user.companyId,
                user.name,
                user.email,
                user.role,
                user.department
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] updateDetails() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteById(int64_t id) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec_params("DELETE FROM users WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* COLUMNS =
        "id, company_id, name, email, role, department, balance, "
        "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_micros";

    std::shared_ptr<PostgresConnection> db_;

    std::vector<domain::User> query(const std::string& sql, int64_t param) {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec_params(sql, param);
            txn.commit();

            std::vector<domain::User> users;
            for (const auto& row : result) {
                users.push_back(rowToUser(row));
            }
            return users;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresUserRepository] query failed: " << e.what() << std::endl;
            throw;
        }
    }

    static std::string text(const pqxx::row& row, const char* column) {
        return row[column].is_null() ? "" : row[column].as<std::string>();
    }

    static domain::User rowToUser(const pqxx::row& row) {
        domain::User user;
        user.id = row["id"].as<int64_t>();
        if (!row["company_id"].is_null()) {
            user.companyId = row["company_id"].as<int64_t>();
        }
        user.name = row["name"].as<std::string>();
        user.email = text(row, "email");
        user.role = text(row, "role");
        user.department = text(row, "department");
        user.balance = domain::Money::fromCents(row["balance"].as<int64_t>());
        user.createdAt = domain::Timestamp::fromMicros(row["created_micros"].as<int64_t>());
        return user;
    }
};

} // namespace bookkeeping::adapters::secondary
