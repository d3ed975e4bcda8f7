#pragma once

#include "ports/input/ITransactionService.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "domain/BalanceRules.hpp"
#include "domain/Errors.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <iostream>

namespace bookkeeping::application {

/**
 * @brief Поддержка балансов: запись и удаление транзакций
 *
 * Порядок createTransaction:
 * 1. BalanceRules::validate — форма черновика
 * 2. Стороны существуют (NotFoundError)
 * 3. Снятие наличных: balance >= amount (InsufficientBalanceError)
 * 4. Новые балансы помещаются в int64_t (ValidationError{amount})
 * 5. record(): вставка + изменения балансов одной атомарной единицей
 *
 * Шаги 1-4 ничего не меняют. Все записи сериализуются writeMutex_,
 * поэтому проверка баланса и запись не разделяются чужой записью.
 */
class TransactionService : public ports::input::ITransactionService {
public:
    static constexpr const char* DEPOSIT_DESCRIPTION = "Cash Deposit";
    static constexpr const char* DEPOSIT_REFERENCE = "DEPOSIT";
    static constexpr const char* WITHDRAW_DESCRIPTION = "Cash Withdrawal";
    static constexpr const char* WITHDRAW_REFERENCE = "WITHDRAW";

    TransactionService(
        std::shared_ptr<ports::output::ITransactionRepository> transactionRepo,
        std::shared_ptr<ports::input::IAccountService> accountService
    ) : transactionRepo_(std::move(transactionRepo))
      , accountService_(std::move(accountService))
    {
        std::cout << "[TransactionService] Created" << std::endl;
    }

    ports::input::TransactionReceipt createTransaction(const ports::input::TransactionRequest& request) override {
        domain::Transaction draft;
        draft.date = request.date;
        draft.amount = request.amount;
        draft.from = request.from;
        draft.to = request.to;
        draft.description = request.description;
        draft.reference = request.reference;

        std::lock_guard<std::mutex> lock(writeMutex_);

        domain::BalanceRules::validate(draft);

        auto fromBalance = balanceOf(draft.from);
        balanceOf(draft.to);

        if (domain::BalanceRules::requiresBalanceCheck(draft) && *fromBalance < draft.amount) {
            std::cout << "[TransactionService] REJECTED withdrawal from " << draft.from.toString()
                      << ": balance " << fromBalance->toString()
                      << " < " << draft.amount.toString() << std::endl;
            throw domain::InsufficientBalanceError(fromBalance->cents, draft.amount.cents);
        }

        auto changes = domain::BalanceRules::deltasFor(draft);
        domain::BalanceRules::requireHeadroom(changes, currentBalance());

        auto stored = transactionRepo_->record(draft, changes);

        std::cout << "[TransactionService] Created transaction #" << stored.id << " "
                  << stored.from.toString() << " -> " << stored.to.toString()
                  << " " << stored.amount.toString() << std::endl;

        ports::input::TransactionReceipt receipt;
        receipt.transaction = stored;
        receipt.fromBalance = balanceOf(stored.from);
        receipt.toBalance = balanceOf(stored.to);
        return receipt;
    }

    void deleteTransaction(int64_t id) override {
        std::lock_guard<std::mutex> lock(writeMutex_);

        auto existing = transactionRepo_->findById(id);
        if (!existing) {
            throw domain::NotFoundError("transaction", id);
        }

        // Отмена не проверяет достаточность: баланс может уйти в минус
        auto changes = domain::BalanceRules::reversalOf(*existing);
        domain::BalanceRules::requireHeadroom(changes, currentBalance());

        if (!transactionRepo_->erase(id, changes)) {
            throw domain::NotFoundError("transaction", id);
        }

        std::cout << "[TransactionService] Deleted transaction #" << id
                  << " (reverted " << existing->amount.toString() << ")" << std::endl;
    }

    ports::input::TransactionReceipt deposit(const domain::AccountRef& account,
                                             const domain::Money& amount,
                                             const std::string& description = "") override {
        ports::input::TransactionRequest request;
        request.date = domain::Date::today();
        request.amount = amount;
        request.from = domain::Endpoint::cash();
        request.to = domain::Endpoint::of(account);
        request.description = description.empty() ? DEPOSIT_DESCRIPTION : description;
        request.reference = DEPOSIT_REFERENCE;
        return createTransaction(request);
    }

    ports::input::TransactionReceipt withdraw(const domain::AccountRef& account,
                                              const domain::Money& amount,
                                              const std::string& description = "") override {
        ports::input::TransactionRequest request;
        request.date = domain::Date::today();
        request.amount = amount;
        request.from = domain::Endpoint::of(account);
        request.to = domain::Endpoint::cash();
        request.description = description.empty() ? WITHDRAW_DESCRIPTION : description;
        request.reference = WITHDRAW_REFERENCE;
        return createTransaction(request);
    }

    std::optional<domain::Transaction> getTransaction(int64_t id) override {
        return transactionRepo_->findById(id);
    }

    std::vector<domain::Transaction> listTransactions(std::size_t limit) override {
        return transactionRepo_->findAll(limit);
    }

    std::vector<domain::Transaction> listByAccount(const domain::AccountRef& account) override {
        accountService_->getBalance(account);
        return transactionRepo_->findByAccount(account);
    }

    std::vector<domain::Transaction> search(const std::string& term) override {
        return transactionRepo_->search(term);
    }

private:
    std::shared_ptr<ports::output::ITransactionRepository> transactionRepo_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
    std::mutex writeMutex_;

    /**
     * @brief Баланс реальной стороны или nullopt для кассы
     * @throws NotFoundError если счёта нет
     */
    std::function<domain::Money(const domain::AccountRef&)> currentBalance() {
        return [this](const domain::AccountRef& account) { return accountService_->getBalance(account); };
    }

    std::optional<domain::Money> balanceOf(const domain::Endpoint& endpoint) {
        auto ref = endpoint.account();
        if (!ref) return std::nullopt;
        return accountService_->getBalance(*ref);
    }
};

} // namespace bookkeeping::application
