// include/adapters/secondary/PostgresCompanyRepository.hpp
#pragma once

#include "ports/output/ICompanyRepository.hpp"
#include "PostgresConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::secondary {

/**
 * @brief PostgreSQL реализация репозитория компаний
 */
class PostgresCompanyRepository : public ports::output::ICompanyRepository {
public:
    explicit PostgresCompanyRepository(std::shared_ptr<PostgresConnection> db)
        : db_(std::move(db)) {}

    domain::Company insert(const domain::Company& company) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());

            auto result = txn.exec_params(
                "INSERT INTO companies (name, address, phone, email) "
                "VALUES ($1, $2, $3, $4) "
                "RETURNING " + std::string(COLUMNS),
                company.name,
                company.address,
                company.phone,
                company.email
            );

            txn.commit();
            return rowToCompany(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCompanyRepository] insert() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Company> findById(int64_t id) override {
        return findOne("SELECT " + std::string(COLUMNS) + " FROM companies WHERE id = $1", id);
    }

    std::optional<domain::Company> findByName(const std::string& name) override {
        return findOne("SELECT " + std::string(COLUMNS) + " FROM companies WHERE name = $1", name);
    }

    std::vector<domain::Company> findAll() override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec("SELECT " + std::string(COLUMNS) + " FROM companies ORDER BY name, id");
            txn.commit();

            std::vector<domain::Company> companies;
            for (const auto& row : result) {
                companies.push_back(rowToCompany(row));
            }
            return companies;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCompanyRepository] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool updateDetails(const domain::Company& company) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec_params(
                "UPDATE companies SET name = $2, address = $3, phone = $4, email = $5 WHERE id = $1",
                company.id,
                company.name,
                company.address,
                company.phone,
                company.email
            );
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCompanyRepository] updateDetails() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteById(int64_t id) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            // users.company_id обнуляется через ON DELETE SET NULL
            auto result = txn.exec_params("DELETE FROM companies WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCompanyRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* COLUMNS =
        "id, name, address, phone, email, balance, "
        "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_micros";

    std::shared_ptr<PostgresConnection> db_;

    template <typename Param>
    std::optional<domain::Company> findOne(const std::string& sql, const Param& param) {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec_params(sql, param);
            txn.commit();

            if (result.empty()) return std::nullopt;
            return rowToCompany(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCompanyRepository] query failed: " << e.what() << std::endl;
            throw;
        }
    }

    static std::string text(const pqxx::row& row, const char* column) {
        return row[column].is_null() ? "" : row[column].as<std::string>();
    }

    static domain::Company rowToCompany(const pqxx::row& row) {
        domain::Company company;
        company.id = row["id"].as<int64_t>();
        company.name = row["name"].as<std::string>();
        company.address = text(row, "address");
        company.phone = text(row, "phone");
        company.email = text(row, "email");
        company.balance = domain::Money::fromCents(row["balance"].as<int64_t>());
        company.createdAt = domain::Timestamp::fromMicros(row["created_micros"].as<int64_t>());
        return company;
    }
};

} // namespace bookkeeping::adapters::secondary
