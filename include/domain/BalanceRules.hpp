#pragma once

#include "Transaction.hpp"
#include "Errors.hpp"
#include <functional>
#include <vector>

namespace bookkeeping::domain {

/**
 * @brief Изменение баланса одного реального счёта
 */
struct BalanceChange {
    AccountRef account;
    Money delta;
};

/**
 * @brief Правила поддержки балансов
 *
 * Чистые функции: хранилище применяет вычисленные здесь изменения
 * атомарно вместе со вставкой/удалением записи транзакции.
 *
 * @example
 * ```
 * company:1 → user:2, 500.00
 *   deltasFor  → [company:1 -500.00, user:2 +500.00]
 *   reversalOf → [company:1 +500.00, user:2 -500.00]
 *
 * cash → company:1, 100.00
 *   deltasFor  → [company:1 +100.00]     (касса не хранится)
 * ```
 */
class BalanceRules {
public:
    static constexpr std::size_t MAX_DESCRIPTION_LENGTH = 500;

    /**
     * @brief Проверить черновик транзакции до любой мутации
     * @throws ValidationError с именем поля-нарушителя
     */
    static void validate(const Transaction& draft) {
        if (!draft.amount.isPositive()) {
            throw ValidationError("amount", "must be positive, got " + draft.amount.toString());
        }
        if (draft.from.isCash() && draft.to.isCash()) {
            throw ValidationError("to", "cash to cash transfer is not allowed");
        }
        if (draft.from == draft.to) {
            throw ValidationError("to", "sender and receiver must differ (" + draft.from.toString() + ")");
        }
        if (draft.description.size() > MAX_DESCRIPTION_LENGTH) {
            throw ValidationError("description", "longer than "
                                  + std::to_string(MAX_DESCRIPTION_LENGTH) + " characters");
        }
    }

    /**
     * @brief Снятие наличных: реальный счёт → касса
     *
     * Только такие транзакции проверяют достаточность баланса.
     * Переводы между реальными счетами могут увести отправителя в минус.
     */
    static bool requiresBalanceCheck(const Transaction& t) {
        return !t.from.isCash() && t.to.isCash();
    }

    static std::vector<BalanceChange> deltasFor(const Transaction& t) {
        std::vector<BalanceChange> changes;
        if (auto from = t.from.account()) {
            changes.push_back({*from, -t.amount});
        }
        if (auto to = t.to.account()) {
            changes.push_back({*to, t.amount});
        }
        return changes;
    }

    /**
     * @brief Проверить, что изменения не выводят балансы за пределы int64_t
     * @param balanceOf Текущий баланс затронутого счёта
     * @throws ValidationError{field="amount"}
     */
    static void requireHeadroom(const std::vector<BalanceChange>& changes,
                                const std::function<Money(const AccountRef&)>& balanceOf) {
        for (const auto& change : changes) {
            if (!balanceOf(change.account).checkedAdd(change.delta)) {
                throw ValidationError("amount", "balance of " + change.account.toString()
                                      + " would overflow by " + change.delta.toString());
            }
        }
    }

    static std::vector<BalanceChange> reversalOf(const Transaction& t) {
        std::vector<BalanceChange> changes = deltasFor(t);
        for (auto& change : changes) {
            change.delta = -change.delta;
        }
        return changes;
    }
};

} // namespace bookkeeping::domain
