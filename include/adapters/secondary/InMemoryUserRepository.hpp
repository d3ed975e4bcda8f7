#pragma once

#include "ports/output/IUserRepository.hpp"
#include "InMemoryStorage.hpp"
#include <memory>
#include <algorithm>

namespace bookkeeping::adapters::secondary {

/**
 * @brief In-memory реализация репозитория пользователей
 */
class InMemoryUserRepository : public ports::output::IUserRepository {
public:
    explicit InMemoryUserRepository(std::shared_ptr<InMemoryStorage> storage)
        : storage_(std::move(storage)) {}

    domain::User insert(const domain::User& user) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        domain::User stored = user;
        stored.id = storage_->nextUserId++;
        storage_->users[stored.id] = stored;
        return stored;
    }

    std::optional<domain::User> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        auto it = storage_->users.find(id);
        if (it == storage_->users.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::User> findAll() override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        std::vector<domain::User> result;
        for (const auto& [id, user] : storage_->users) {
            result.push_back(user);
        }
        sortByName(result);
        return result;
    }

    std::vector<domain::User> findByCompanyId(int64_t companyId) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        std::vector<domain::User> result;
        for (const auto& [id, user] : storage_->users) {
            if (user.companyId == companyId) {
                result.push_back(user);
            }
        }
        sortByName(result);
        return result;
    }

    bool updateDetails(const domain::User& user) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        auto it = storage_->users.find(user.id);
        if (it == storage_->users.end()) return false;

        it->second.name = user.name;
        it->second.email = user.email;
        it->second.role = user.role;
        it->second.department = user.department;
        it->second.companyId = user.companyId;
        return true;
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        return storage_->users.erase(id) > 0;
    }

private:
    std::shared_ptr<InMemoryStorage> storage_;

    static void sortByName(std::vector<domain::User>& list) {
        std::stable_sort(list.begin(), list.end(),
                         [](const auto& a, const auto& b) { return a.name < b.name; });
    }
};

} // namespace bookkeeping::adapters::secondary
