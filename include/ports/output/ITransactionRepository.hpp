#pragma once

#include "domain/Transaction.hpp"
#include "domain/BalanceRules.hpp"
#include <optional>
#include <vector>
#include <string>
#include <cstdint>

namespace bookkeeping::ports::output {

/**
 * @brief Интерфейс журнала транзакций
 *
 * Поддерживает атомарные операции записи: вставка/удаление транзакции
 * и изменение балансов затронутых счетов выполняются одной единицей
 * (commit или rollback целиком).
 *
 * @example
 * ```cpp
 * auto changes = domain::BalanceRules::deltasFor(draft);
 * auto stored = txRepo->record(draft, changes);
 *
 * // Отмена
 * txRepo->erase(stored.id, domain::BalanceRules::reversalOf(stored));
 * ```
 */
class ITransactionRepository {
public:
    virtual ~ITransactionRepository() = default;

    /**
     * @brief Записать транзакцию и применить изменения балансов
     *
     * Атомарно. Присваивает id и createdAt.
     */
    virtual domain::Transaction record(const domain::Transaction& draft,
                                       const std::vector<domain::BalanceChange>& changes) = 0;

    /**
     * @brief Удалить транзакцию и применить изменения балансов
     *
     * Атомарно.
     * @return false если транзакции нет (ничего не изменено)
     */
    virtual bool erase(int64_t id, const std::vector<domain::BalanceChange>& changes) = 0;

    virtual std::optional<domain::Transaction> findById(int64_t id) = 0;

    /**
     * @brief Последние транзакции, новые первыми
     * @param limit 0 — без ограничения
     */
    virtual std::vector<domain::Transaction> findAll(std::size_t limit = 0) = 0;

    /**
     * @brief Все транзакции, где from или to совпадает со счётом
     */
    virtual std::vector<domain::Transaction> findByAccount(const domain::AccountRef& account) = 0;

    /**
     * @brief Поиск подстроки (без учёта регистра) в описании, референсе и именах сторон
     */
    virtual std::vector<domain::Transaction> search(const std::string& term) = 0;

    virtual std::size_t countReferencing(const domain::AccountRef& account) = 0;
};

} // namespace bookkeeping::ports::output
