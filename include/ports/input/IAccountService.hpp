#pragma once

#include "domain/Company.hpp"
#include "domain/User.hpp"
#include "domain/Endpoint.hpp"
#include "domain/Money.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace bookkeeping::ports::input {

/**
 * @brief Запрос на создание/изменение компании
 */
struct CompanyRequest {
    std::string name;
    std::string address;
    std::string phone;
    std::string email;
};

/**
 * @brief Запрос на создание/изменение пользователя
 */
struct UserRequest {
    std::string name;
    std::optional<int64_t> companyId;
    std::string email;
    std::string role;
    std::string department;
};

/**
 * @brief Интерфейс сервиса счетов (компании и пользователи)
 */
class IAccountService {
public:
    virtual ~IAccountService() = default;

    /**
     * @brief Создать компанию с нулевым балансом
     * @throws ValidationError если имя пустое, занято или поля некорректны
     */
    virtual domain::Company addCompany(const CompanyRequest& request) = 0;

    /**
     * @brief Изменить описательные поля компании (баланс не трогается)
     */
    virtual domain::Company updateCompany(int64_t id, const CompanyRequest& request) = 0;

    virtual std::optional<domain::Company> getCompany(int64_t id) = 0;
    virtual std::vector<domain::Company> listCompanies() = 0;

    /**
     * @brief Удалить компанию
     * @throws AccountInUseError если на компанию ссылаются транзакции
     */
    virtual void removeCompany(int64_t id) = 0;

    virtual domain::User addUser(const UserRequest& request) = 0;
    virtual domain::User updateUser(int64_t id, const UserRequest& request) = 0;
    virtual std::optional<domain::User> getUser(int64_t id) = 0;
    virtual std::vector<domain::User> listUsers() = 0;
    virtual std::vector<domain::User> listUsersByCompany(int64_t companyId) = 0;
    virtual void removeUser(int64_t id) = 0;

    /**
     * @brief Текущий баланс счёта (чтение поля, O(1))
     * @throws NotFoundError
     */
    virtual domain::Money getBalance(const domain::AccountRef& account) = 0;

    /**
     * @brief Имя счёта или "Cash" для кассы
     */
    virtual std::string displayName(const domain::Endpoint& endpoint) = 0;
};

} // namespace bookkeeping::ports::input
