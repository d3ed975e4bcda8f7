#pragma once

#include "domain/User.hpp"
#include <optional>
#include <vector>
#include <cstdint>

namespace bookkeeping::ports::output {

/**
 * @brief Интерфейс репозитория пользователей
 */
class IUserRepository {
public:
    virtual ~IUserRepository() = default;

    virtual domain::User insert(const domain::User& user) = 0;
    virtual std::optional<domain::User> findById(int64_t id) = 0;

    /**
     * @brief Все пользователи, упорядоченные по имени
     */
    virtual std::vector<domain::User> findAll() = 0;
    virtual std::vector<domain::User> findByCompanyId(int64_t companyId) = 0;

    /**
     * @brief Обновить описательные поля и companyId (не баланс)
     */
    virtual bool updateDetails(const domain::User& user) = 0;
    virtual bool deleteById(int64_t id) = 0;
};

} // namespace bookkeeping::ports::output
