#pragma once

#include "ports/output/ITransactionRepository.hpp"
#include "InMemoryStorage.hpp"
#include <memory>
#include <algorithm>
#include <cctype>
#include <utility>

namespace bookkeeping::adapters::secondary {

/**
 * @brief In-memory журнал транзакций
 *
 * record/erase проверяют существование всех затронутых счетов и
 * вычисляют новые балансы до любой мутации (std::overflow_error
 * оставляет хранилище нетронутым), затем меняют журнал и балансы
 * под одним mutex.
 */
class InMemoryTransactionRepository : public ports::output::ITransactionRepository {
public:
    explicit InMemoryTransactionRepository(std::shared_ptr<InMemoryStorage> storage)
        : storage_(std::move(storage)) {}

    domain::Transaction record(const domain::Transaction& draft,
                               const std::vector<domain::BalanceChange>& changes) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        auto updates = prepare(changes);

        domain::Transaction stored = draft;
        stored.id = storage_->nextTransactionId++;
        stored.createdAt = storage_->nextCreatedAt();
        storage_->transactions[stored.id] = stored;

        apply(updates);
        return stored;
    }

    bool erase(int64_t id, const std::vector<domain::BalanceChange>& changes) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        auto it = storage_->transactions.find(id);
        if (it == storage_->transactions.end()) return false;
        auto updates = prepare(changes);

        storage_->transactions.erase(it);
        apply(updates);
        return true;
    }

    std::optional<domain::Transaction> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        auto it = storage_->transactions.find(id);
        if (it == storage_->transactions.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Transaction> findAll(std::size_t limit) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        std::vector<domain::Transaction> result;
        for (const auto& [id, t] : storage_->transactions) {
            result.push_back(t);
        }
        newestFirst(result);
        if (limit > 0 && result.size() > limit) {
            result.resize(limit);
        }
        return result;
    }

    std::vector<domain::Transaction> findByAccount(const domain::AccountRef& account) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        std::vector<domain::Transaction> result;
        for (const auto& [id, t] : storage_->transactions) {
            if (t.touches(account)) {
                result.push_back(t);
            }
        }
        newestFirst(result);
        return result;
    }

    std::vector<domain::Transaction> search(const std::string& term) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        std::string needle = lower(term);
        std::vector<domain::Transaction> result;
        for (const auto& [id, t] : storage_->transactions) {
            if (contains(t.description, needle) || contains(t.reference, needle)
                || contains(storage_->nameOf(t.from), needle)
                || contains(storage_->nameOf(t.to), needle)) {
                result.push_back(t);
            }
        }
        newestFirst(result);
        return result;
    }

    std::size_t countReferencing(const domain::AccountRef& account) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        return static_cast<std::size_t>(std::count_if(
            storage_->transactions.begin(), storage_->transactions.end(),
            [&](const auto& entry) { return entry.second.touches(account); }));
    }

private:
    std::shared_ptr<InMemoryStorage> storage_;

    using BalanceUpdate = std::pair<domain::Money*, domain::Money>;

    std::vector<BalanceUpdate> prepare(const std::vector<domain::BalanceChange>& changes) {
        std::vector<BalanceUpdate> updates;
        for (const auto& change : changes) {
            auto* balance = storage_->balanceOf(change.account);
            if (!balance) {
                throw domain::NotFoundError(domain::toString(change.account.kind), change.account.id);
            }
            updates.emplace_back(balance, *balance + change.delta);
        }
        return updates;
    }

    static void apply(const std::vector<BalanceUpdate>& updates) {
        for (const auto& [balance, value] : updates) {
            *balance = value;
        }
    }

    static void newestFirst(std::vector<domain::Transaction>& list) {
        std::sort(list.begin(), list.end(),
                  [](const auto& a, const auto& b) { return domain::chronologicalLess(b, a); });
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return lower(haystack).find(needle) != std::string::npos;
    }
};

} // namespace bookkeeping::adapters::secondary
