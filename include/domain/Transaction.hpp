#pragma once

#include "Money.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include "Endpoint.hpp"
#include <string>
#include <cstdint>

namespace bookkeeping::domain {

/**
 * @brief Движение денег между двумя сторонами
 *
 * Инварианты (проверяются BalanceRules до записи):
 * - amount > 0
 * - from != to
 * - не более одной стороны — касса
 *
 * Варианты:
 * ```
 * cash    → account   депозит
 * account → cash      снятие
 * account → account   перевод
 * ```
 */
struct Transaction {
    int64_t id = 0;             ///< Монотонно присваивается хранилищем
    Date date;                  ///< Дата операции (первичный ключ сортировки)
    Money amount;
    Endpoint from;
    Endpoint to;
    std::string description;
    std::string reference;
    Timestamp createdAt;        ///< Момент вставки (вторичный ключ сортировки)

    bool touches(const AccountRef& ref) const {
        return from.is(ref) || to.is(ref);
    }

    /**
     * @brief Человекочитаемый тип: "Company to User", "Cash Deposit", ...
     */
    std::string transactionType() const {
        if (from.isCash()) return "Cash Deposit";
        if (to.isCash()) return "Cash Withdrawal";
        return label(from) + " to " + label(to);
    }

private:
    static std::string label(const Endpoint& e) {
        return e.account()->kind == AccountKind::COMPANY ? "Company" : "User";
    }
};

/**
 * @brief Порядок журнала: (date, createdAt, id) по возрастанию
 *
 * id только разрешает совпадения меток: он монотонен по порядку вставки.
 */
inline bool chronologicalLess(const Transaction& a, const Transaction& b) {
    if (a.date != b.date) return a.date < b.date;
    if (!(a.createdAt == b.createdAt)) return a.createdAt < b.createdAt;
    return a.id < b.id;
}

} // namespace bookkeeping::domain
