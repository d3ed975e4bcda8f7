#pragma once

#include "Money.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace bookkeeping::domain {

/**
 * @brief Пользователь — реальный счёт, может относиться к компании
 *
 * companyId — слабая ссылка: только для поиска, не владение.
 */
struct User {
    int64_t id = 0;
    std::optional<int64_t> companyId;
    std::string name;
    std::string email;
    std::string role;
    std::string department;
    Money balance;
    Timestamp createdAt;

    User() = default;

    User(const std::string& name,
         std::optional<int64_t> companyId = std::nullopt,
         const std::string& email = "",
         const std::string& role = "",
         const std::string& department = "")
        : companyId(companyId)
        , name(name)
        , email(email)
        , role(role)
        , department(department)
        , createdAt(Timestamp::now())
    {}
};

} // namespace bookkeeping::domain
