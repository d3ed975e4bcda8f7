#pragma once

#include <string>
#include <stdexcept>

namespace bookkeeping::domain {

/**
 * @brief Вид реального счёта
 */
enum class AccountKind {
    COMPANY,    ///< Компания
    USER        ///< Пользователь (сотрудник)
};

/**
 * @brief Преобразовать AccountKind в строку хранения ("company"/"user")
 */
inline std::string toString(AccountKind kind) {
    switch (kind) {
        case AccountKind::COMPANY: return "company";
        case AccountKind::USER:    return "user";
        default: return "unknown";
    }
}

/**
 * @brief Преобразовать строку в AccountKind
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountKind parseAccountKind(const std::string& str) {
    if (str == "company" || str == "COMPANY") return AccountKind::COMPANY;
    if (str == "user" || str == "USER")       return AccountKind::USER;
    throw std::invalid_argument("Unknown account kind: " + str);
}

} // namespace bookkeeping::domain
