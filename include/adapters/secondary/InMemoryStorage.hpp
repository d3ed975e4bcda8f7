#pragma once

#include "domain/Company.hpp"
#include "domain/User.hpp"
#include "domain/Transaction.hpp"
#include "domain/Errors.hpp"
#include <map>
#include <mutex>
#include <iostream>

namespace bookkeeping::adapters::secondary {

/**
 * @brief Общее in-memory состояние: счета и журнал под одним mutex
 *
 * Три InMemory*Repository работают поверх одного экземпляра, поэтому
 * запись транзакции и изменение балансов видны только целиком.
 * Используется по умолчанию (ACCOUNT_STORAGE=memory) и в unit-тестах.
 */
class InMemoryStorage {
public:
    mutable std::mutex mutex;
    std::map<int64_t, domain::Company> companies;
    std::map<int64_t, domain::User> users;
    std::map<int64_t, domain::Transaction> transactions;
    int64_t nextCompanyId = 1;
    int64_t nextUserId = 1;
    int64_t nextTransactionId = 1;

    /**
     * @brief Указатель на хранимый баланс или nullptr (вызывать под mutex)
     */
    domain::Money* balanceOf(const domain::AccountRef& account) {
        if (account.kind == domain::AccountKind::COMPANY) {
            auto it = companies.find(account.id);
            return it == companies.end() ? nullptr : &it->second.balance;
        }
        auto it = users.find(account.id);
        return it == users.end() ? nullptr : &it->second.balance;
    }

    /**
     * @brief Отображаемое имя стороны (вызывать под mutex)
     */
    std::string nameOf(const domain::Endpoint& e) const {
        auto ref = e.account();
        if (!ref) return "Cash";
        if (ref->kind == domain::AccountKind::COMPANY) {
            auto it = companies.find(ref->id);
            return it == companies.end() ? "" : it->second.name;
        }
        auto it = users.find(ref->id);
        return it == users.end() ? "" : it->second.name;
    }

    /**
     * @brief Строго возрастающая метка вставки (вызывать под mutex)
     */
    domain::Timestamp nextCreatedAt() {
        int64_t micros = domain::Timestamp::now().toMicros();
        if (micros <= lastCreatedMicros_) {
            micros = lastCreatedMicros_ + 1;
        }
        lastCreatedMicros_ = micros;
        return domain::Timestamp::fromMicros(micros);
    }

    // =========================================================================
    // Test helpers
    // =========================================================================

    /**
     * @brief Записать баланс напрямую, минуя журнал
     *
     * Начальный баланс счёта без истории; в тестах аудита
     * имитирует повреждённое хранилище.
     */
    void seedBalance(const domain::AccountRef& account, const domain::Money& balance) {
        std::lock_guard<std::mutex> lock(mutex);
        auto* stored = balanceOf(account);
        if (!stored) {
            throw domain::NotFoundError(domain::toString(account.kind), account.id);
        }
        *stored = balance;
    }

    std::size_t transactionCount() const {
        std::lock_guard<std::mutex> lock(mutex);
        return transactions.size();
    }

    /**
     * @brief Демонстрационные счета для ручной проверки из консоли
     */
    void seedDemoData() {
        std::lock_guard<std::mutex> lock(mutex);

        domain::Company acme("Acme Traders", "12 MG Road, Pune", "020-5550-1234", "accounts@acme.example");
        acme.id = nextCompanyId++;
        companies[acme.id] = acme;

        domain::Company globex("Globex Supplies", "4 Park Street, Kolkata", "", "billing@globex.example");
        globex.id = nextCompanyId++;
        companies[globex.id] = globex;

        domain::User asha("Asha Verma", acme.id, "asha@acme.example", "Accountant", "Finance");
        asha.id = nextUserId++;
        users[asha.id] = asha;

        domain::User ravi("Ravi Iyer", globex.id, "", "Driver", "Logistics");
        ravi.id = nextUserId++;
        users[ravi.id] = ravi;

        std::cout << "[InMemoryStorage] Seeded demo data: 2 companies, 2 users" << std::endl;
    }

private:
    int64_t lastCreatedMicros_ = 0;
};

} // namespace bookkeeping::adapters::secondary
