// include/adapters/secondary/PostgresTransactionRepository.hpp
#pragma once

#include "ports/output/ITransactionRepository.hpp"
#include "PostgresConnection.hpp"
#include "domain/Errors.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::secondary {

/**
 * @brief PostgreSQL журнал транзакций
 *
 * record/erase: INSERT/DELETE и UPDATE балансов в одной pqxx::work.
 * Если какой-либо UPDATE не затронул строку (счёт удалён), work
 * не коммитится и откатывается при разрушении.
 */
class PostgresTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit PostgresTransactionRepository(std::shared_ptr<PostgresConnection> db)
        : db_(std::move(db)) {}

    domain::Transaction record(const domain::Transaction& draft,
                               const std::vector<domain::BalanceChange>& changes) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());

            auto result = txn.exec_params(
                "INSERT INTO transactions "
                "(transaction_date, amount, from_type, from_id, to_type, to_id, description, reference) "
                "VALUES ($1::date, $2, $3, $4, $5, $6, $7, $8) "
                "RETURNING id, (EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT AS created_micros",
                draft.date.toString(),
                draft.amount.cents,
                draft.from.typeName(),
                draft.from.storageId(),
                draft.to.typeName(),
                draft.to.storageId(),
                draft.description,
                draft.reference
            );

            applyChanges(txn, changes);
            txn.commit();

            domain::Transaction stored = draft;
            stored.id = result[0]["id"].as<int64_t>();
            stored.createdAt = domain::Timestamp::fromMicros(result[0]["created_micros"].as<int64_t>());

            std::cout << "[PostgresTransactionRepository] Recorded transaction #" << stored.id << std::endl;
            return stored;

        } catch (const domain::NotFoundError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] record() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool erase(int64_t id, const std::vector<domain::BalanceChange>& changes) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());

            auto result = txn.exec_params("DELETE FROM transactions WHERE id = $1", id);
            if (result.affected_rows() == 0) {
                return false;
            }

            applyChanges(txn, changes);
            txn.commit();

            std::cout << "[PostgresTransactionRepository] Erased transaction #" << id << std::endl;
            return true;

        } catch (const domain::NotFoundError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] erase() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Transaction> findById(int64_t id) override {
        auto list = query(std::string(SELECT) + " WHERE t.id = $1", {std::to_string(id)});
        if (list.empty()) return std::nullopt;
        return list.front();
    }

    std::vector<domain::Transaction> findAll(std::size_t limit) override {
        std::string sql = std::string(SELECT) + " ORDER BY t.transaction_date DESC, t.created_at DESC, t.id DESC";
        if (limit > 0) {
            sql += " LIMIT " + std::to_string(limit);
        }
        return query(sql, {});
    }

    std::vector<domain::Transaction> findByAccount(const domain::AccountRef& account) override {
        return query(std::string(SELECT)
                     + " WHERE (t.from_type = $1 AND t.from_id = $2::bigint)"
                       "    OR (t.to_type = $1 AND t.to_id = $2::bigint)"
                       " ORDER BY t.transaction_date DESC, t.created_at DESC, t.id DESC",
                     {domain::toString(account.kind), std::to_string(account.id)});
    }

    std::vector<domain::Transaction> search(const std::string& term) override {
        return query(std::string(SELECT)
                     + " LEFT JOIN companies c1 ON t.from_type = 'company' AND t.from_id = c1.id"
                       " LEFT JOIN users u1 ON t.from_type = 'user' AND t.from_id = u1.id"
                       " LEFT JOIN companies c2 ON t.to_type = 'company' AND t.to_id = c2.id"
                       " LEFT JOIN users u2 ON t.to_type = 'user' AND t.to_id = u2.id"
                       " WHERE t.description ILIKE $1 OR t.reference ILIKE $1"
                       "    OR c1.name ILIKE $1 OR u1.name ILIKE $1"
                       "    OR c2.name ILIKE $1 OR u2.name ILIKE $1"
                       " ORDER BY t.transaction_date DESC, t.created_at DESC, t.id DESC",
                     {"%" + term + "%"});
    }

    std::size_t countReferencing(const domain::AccountRef& account) override {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());
            auto result = txn.exec_params(
                "SELECT COUNT(*) FROM transactions "
                "WHERE (from_type = $1 AND from_id = $2) OR (to_type = $1 AND to_id = $2)",
                domain::toString(account.kind),
                account.id
            );
            txn.commit();
            return result[0][0].as<std::size_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] countReferencing() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    static constexpr const char* SELECT =
        "SELECT t.id, t.transaction_date::text AS transaction_date, t.amount, "
        "t.from_type, t.from_id, t.to_type, t.to_id, t.description, t.reference, "
        "(EXTRACT(EPOCH FROM t.created_at) * 1000000)::BIGINT AS created_micros "
        "FROM transactions t";

    std::shared_ptr<PostgresConnection> db_;

    void applyChanges(pqxx::work& txn, const std::vector<domain::BalanceChange>& changes) {
        for (const auto& change : changes) {
            std::string table = change.account.kind == domain::AccountKind::COMPANY ? "companies" : "users";
            auto result = txn.exec_params(
                "UPDATE " + table + " SET balance = balance + $1 WHERE id = $2",
                change.delta.cents,
                change.account.id
            );
            if (result.affected_rows() == 0) {
                throw domain::NotFoundError(domain::toString(change.account.kind), change.account.id);
            }
        }
    }

    std::vector<domain::Transaction> query(const std::string& sql, const std::vector<std::string>& params) {
        auto lock = db_->lock();
        try {
            pqxx::work txn(db_->raw());

            pqxx::params bound;
            for (const auto& p : params) {
                bound.append(p);
            }
            auto result = txn.exec_params(sql, bound);
            txn.commit();

            std::vector<domain::Transaction> list;
            for (const auto& row : result) {
                list.push_back(rowToTransaction(row));
            }
            return list;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTransactionRepository] query failed: " << e.what() << std::endl;
            throw;
        }
    }

    static domain::Transaction rowToTransaction(const pqxx::row& row) {
        domain::Transaction t;
        t.id = row["id"].as<int64_t>();
        t.date = domain::Date::parse(row["transaction_date"].as<std::string>());
        t.amount = domain::Money::fromCents(row["amount"].as<int64_t>());
        t.from = domain::Endpoint::fromStorage(row["from_type"].as<std::string>(), row["from_id"].as<int64_t>());
        t.to = domain::Endpoint::fromStorage(row["to_type"].as<std::string>(), row["to_id"].as<int64_t>());
        t.description = row["description"].is_null() ? "" : row["description"].as<std::string>();
        t.reference = row["reference"].is_null() ? "" : row["reference"].as<std::string>();
        t.createdAt = domain::Timestamp::fromMicros(row["created_micros"].as<int64_t>());
        return t;
    }
};

} // namespace bookkeeping::adapters::secondary
