#pragma once

#include "domain/Transaction.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace bookkeeping::ports::input {

/**
 * @brief Запрос на создание транзакции
 */
struct TransactionRequest {
    domain::Date date = domain::Date::today();
    domain::Money amount;
    domain::Endpoint from;
    domain::Endpoint to;
    std::string description;
    std::string reference;
};

/**
 * @brief Результат записи: транзакция и балансы сторон после неё
 *
 * Для кассы баланс — nullopt.
 */
struct TransactionReceipt {
    domain::Transaction transaction;
    std::optional<domain::Money> fromBalance;
    std::optional<domain::Money> toBalance;
};

/**
 * @brief Интерфейс сервиса транзакций (поддержка балансов)
 */
class ITransactionService {
public:
    virtual ~ITransactionService() = default;

    /**
     * @brief Записать транзакцию и атомарно изменить балансы
     *
     * @throws ValidationError          сумма <= 0, from == to, cash → cash
     * @throws NotFoundError            сторона не существует
     * @throws InsufficientBalanceError снятие наличных сверх баланса
     */
    virtual TransactionReceipt createTransaction(const TransactionRequest& request) = 0;

    /**
     * @brief Удалить транзакцию, точно отменив её влияние на балансы
     *
     * Достаточность баланса не проверяется.
     * @throws NotFoundError
     */
    virtual void deleteTransaction(int64_t id) = 0;

    /**
     * @brief Депозит: cash → account, сегодняшней датой
     */
    virtual TransactionReceipt deposit(const domain::AccountRef& account,
                                       const domain::Money& amount,
                                       const std::string& description = "") = 0;

    /**
     * @brief Снятие: account → cash, сегодняшней датой
     */
    virtual TransactionReceipt withdraw(const domain::AccountRef& account,
                                        const domain::Money& amount,
                                        const std::string& description = "") = 0;

    virtual std::optional<domain::Transaction> getTransaction(int64_t id) = 0;

    /**
     * @brief Последние транзакции, новые первыми (limit 0 — все)
     */
    virtual std::vector<domain::Transaction> listTransactions(std::size_t limit) = 0;
    virtual std::vector<domain::Transaction> listByAccount(const domain::AccountRef& account) = 0;
    virtual std::vector<domain::Transaction> search(const std::string& term) = 0;
};

} // namespace bookkeeping::ports::input
