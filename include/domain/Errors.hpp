#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace bookkeeping::domain {

/**
 * @brief Базовое исключение бухгалтерского ядра
 *
 * Все ошибки ядра выбрасываются до любой мутации хранилища.
 */
class BookkeepingError : public std::runtime_error {
public:
    explicit BookkeepingError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Некорректный ввод (сумма, дата, совпадающие стороны и т.п.)
 */
class ValidationError : public BookkeepingError {
public:
    ValidationError(const std::string& field, const std::string& message)
        : BookkeepingError(field + ": " + message)
        , field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Попытка удалить счёт, на который ссылаются транзакции
 */
class AccountInUseError : public ValidationError {
public:
    AccountInUseError(const std::string& account, std::size_t references)
        : ValidationError("account", account + " is referenced by "
                          + std::to_string(references) + " transaction(s)")
        , references_(references) {}

    std::size_t references() const { return references_; }

private:
    std::size_t references_;
};

/**
 * @brief Счёт или транзакция не найдены
 */
class NotFoundError : public BookkeepingError {
public:
    NotFoundError(const std::string& entity, int64_t id)
        : BookkeepingError(entity + " not found: " + std::to_string(id))
        , entity_(entity)
        , id_(id) {}

    const std::string& entity() const { return entity_; }
    int64_t id() const { return id_; }

private:
    std::string entity_;
    int64_t id_;
};

/**
 * @brief Недостаточно средств для снятия наличных
 *
 * Суммы в минорных единицах (копейки/пайсы).
 */
class InsufficientBalanceError : public BookkeepingError {
public:
    InsufficientBalanceError(int64_t balance, int64_t requested)
        : BookkeepingError("Insufficient balance: " + formatCents(balance)
                           + " < " + formatCents(requested))
        , balance_(balance)
        , requested_(requested) {}

    int64_t balance() const { return balance_; }
    int64_t requested() const { return requested_; }

private:
    int64_t balance_;
    int64_t requested_;

    static std::string formatCents(int64_t cents) {
        std::string sign = cents < 0 ? "-" : "";
        uint64_t abs = cents < 0 ? 0 - static_cast<uint64_t>(cents) : static_cast<uint64_t>(cents);
        std::string frac = std::to_string(abs % 100);
        if (frac.size() < 2) frac = "0" + frac;
        return sign + std::to_string(abs / 100) + "." + frac;
    }
};

/**
 * @brief Сохранённый баланс расходится с балансом, полученным пересчётом журнала
 *
 * В корректной работе не возникает: означает ошибку в поддержке балансов
 * или повреждение хранилища.
 */
class ConsistencyError : public BookkeepingError {
public:
    ConsistencyError(const std::string& account, int64_t stored, int64_t replayed)
        : BookkeepingError("Ledger mismatch for " + account + ": stored="
                           + std::to_string(stored) + " replayed=" + std::to_string(replayed))
        , account_(account)
        , stored_(stored)
        , replayed_(replayed) {}

    const std::string& account() const { return account_; }
    int64_t stored() const { return stored_; }
    int64_t replayed() const { return replayed_; }

private:
    std::string account_;
    int64_t stored_;
    int64_t replayed_;
};

} // namespace bookkeeping::domain
