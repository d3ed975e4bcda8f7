#pragma once

#include "domain/Ledger.hpp"
#include <vector>
#include <string>

namespace bookkeeping::ports::input {

/**
 * @brief Расхождение хранимого и пересчитанного баланса
 */
struct ConsistencyIssue {
    domain::AccountRef account;
    std::string name;
    domain::Money stored;
    domain::Money replayed;
};

/**
 * @brief Интерфейс сервиса выписок
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Выписка счёта, новые записи первыми
     * @throws NotFoundError если счёта нет
     */
    virtual std::vector<domain::LedgerEntry> getLedger(const domain::AccountRef& account) = 0;

    /**
     * @brief Сверить хранимый баланс с пересчётом журнала
     * @throws ConsistencyError при расхождении
     */
    virtual void verifyAccount(const domain::AccountRef& account) = 0;

    /**
     * @brief Проверить все счета, вернуть расхождения (пусто — всё сходится)
     */
    virtual std::vector<ConsistencyIssue> audit() = 0;
};

} // namespace bookkeeping::ports::input
