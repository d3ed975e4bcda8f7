#pragma once

#include "domain/Company.hpp"
#include <optional>
#include <vector>
#include <string>
#include <cstdint>

namespace bookkeeping::ports::output {

/**
 * @brief Интерфейс репозитория компаний
 *
 * Баланс здесь не меняется: его двигает только ITransactionRepository.
 */
class ICompanyRepository {
public:
    virtual ~ICompanyRepository() = default;

    /**
     * @brief Вставить компанию, присвоить id
     * @return Компания с присвоенным id
     */
    virtual domain::Company insert(const domain::Company& company) = 0;

    virtual std::optional<domain::Company> findById(int64_t id) = 0;
    virtual std::optional<domain::Company> findByName(const std::string& name) = 0;

    /**
     * @brief Все компании, упорядоченные по имени
     */
    virtual std::vector<domain::Company> findAll() = 0;

    /**
     * @brief Обновить описательные поля (не баланс)
     * @return false если компании нет
     */
    virtual bool updateDetails(const domain::Company& company) = 0;

    /**
     * @brief Удалить компанию, отвязав её пользователей
     */
    virtual bool deleteById(int64_t id) = 0;
};

} // namespace bookkeeping::ports::output
