#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include "domain/Ledger.hpp"
#include "domain/Errors.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::application {

/**
 * @brief Выписки и сверка балансов с журналом
 *
 * Выписка всегда пересчитывается из журнала; хранимый баланс
 * используется только для сверки (verifyAccount/audit).
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::ITransactionRepository> transactionRepo,
        std::shared_ptr<ports::input::IAccountService> accountService
    ) : transactionRepo_(std::move(transactionRepo))
      , accountService_(std::move(accountService))
    {
        std::cout << "[LedgerService] Created" << std::endl;
    }

    std::vector<domain::LedgerEntry> getLedger(const domain::AccountRef& account) override {
        // NotFoundError для несуществующего счёта
        accountService_->getBalance(account);
        return derive(account);
    }

    void verifyAccount(const domain::AccountRef& account) override {
        auto stored = accountService_->getBalance(account);
        auto replayed = domain::Ledger::closingBalance(derive(account));

        if (stored != replayed) {
            std::cerr << "[LedgerService] Mismatch for " << account.toString()
                      << ": stored=" << stored.toString()
                      << " replayed=" << replayed.toString() << std::endl;
            throw domain::ConsistencyError(account.toString(), stored.cents, replayed.cents);
        }
    }

    std::vector<ports::input::ConsistencyIssue> audit() override {
        std::vector<ports::input::ConsistencyIssue> issues;

        for (const auto& company : accountService_->listCompanies()) {
            check(domain::AccountRef::company(company.id), company.name, company.balance, issues);
        }
        for (const auto& user : accountService_->listUsers()) {
            check(domain::AccountRef::user(user.id), user.name, user.balance, issues);
        }

        std::cout << "[LedgerService] Audit finished: " << issues.size() << " mismatch(es)" << std::endl;
        return issues;
    }

private:
    std::shared_ptr<ports::output::ITransactionRepository> transactionRepo_;
    std::shared_ptr<ports::input::IAccountService> accountService_;

    std::vector<domain::LedgerEntry> derive(const domain::AccountRef& account) {
        return domain::Ledger::derive(
            account,
            transactionRepo_->findByAccount(account),
            [this](const domain::Endpoint& e) { return accountService_->displayName(e); });
    }

    void check(const domain::AccountRef& account, const std::string& name,
               const domain::Money& stored, std::vector<ports::input::ConsistencyIssue>& issues) {
        auto replayed = domain::Ledger::closingBalance(derive(account));
        if (stored != replayed) {
            std::cerr << "[LedgerService] Mismatch for " << account.toString()
                      << " '" << name << "': stored=" << stored.toString()
                      << " replayed=" << replayed.toString() << std::endl;
            issues.push_back({account, name, stored, replayed});
        }
    }
};

} // namespace bookkeeping::application
