#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace bookkeeping::domain {

/**
 * @brief Компания — реальный счёт с текущим балансом
 *
 * Баланс меняется только сервисом транзакций.
 */
struct Company {
    int64_t id = 0;             ///< Присваивается хранилищем
    std::string name;           ///< Уникален среди компаний
    std::string address;
    std::string phone;
    std::string email;
    Money balance;
    Timestamp createdAt;

    Company() = default;

    Company(const std::string& name,
            const std::string& address = "",
            const std::string& phone = "",
            const std::string& email = "")
        : name(name)
        , address(address)
        , phone(phone)
        , email(email)
        , createdAt(Timestamp::now())
    {}
};

} // namespace bookkeeping::domain
