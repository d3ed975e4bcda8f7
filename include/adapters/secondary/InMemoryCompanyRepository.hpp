#pragma once

#include "ports/output/ICompanyRepository.hpp"
#include "InMemoryStorage.hpp"
#include <memory>
#include <algorithm>

namespace bookkeeping::adapters::secondary {

/**
 * @brief In-memory реализация репозитория компаний
 */
class InMemoryCompanyRepository : public ports::output::ICompanyRepository {
public:
    explicit InMemoryCompanyRepository(std::shared_ptr<InMemoryStorage> storage)
        : storage_(std::move(storage)) {}

    domain::Company insert(const domain::Company& company) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        domain::Company stored = company;
        stored.id = storage_->nextCompanyId++;
        storage_->companies[stored.id] = stored;
        return stored;
    }

    std::optional<domain::Company> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        auto it = storage_->companies.find(id);
        if (it == storage_->companies.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::Company> findByName(const std::string& name) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        for (const auto& [id, company] : storage_->companies) {
            if (company.name == name) return company;
        }
        return std::nullopt;
    }

    std::vector<domain::Company> findAll() override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        std::vector<domain::Company> result;
        for (const auto& [id, company] : storage_->companies) {
            result.push_back(company);
        }
        std::stable_sort(result.begin(), result.end(),
                         [](const auto& a, const auto& b) { return a.name < b.name; });
        return result;
    }

    bool updateDetails(const domain::Company& company) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        auto it = storage_->companies.find(company.id);
        if (it == storage_->companies.end()) return false;

        it->second.name = company.name;
        it->second.address = company.address;
        it->second.phone = company.phone;
        it->second.email = company.email;
        return true;
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(storage_->mutex);
        if (storage_->companies.erase(id) == 0) return false;

        // ON DELETE SET NULL
        for (auto& [userId, user] : storage_->users) {
            if (user.companyId == id) {
                user.companyId.reset();
            }
        }
        return true;
    }

private:
    std::shared_ptr<InMemoryStorage> storage_;
};

} // namespace bookkeeping::adapters::secondary
