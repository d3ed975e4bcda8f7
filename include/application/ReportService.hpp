#pragma once

#include "ports/input/IReportService.hpp"
#include "ports/input/IAccountService.hpp"
#include "ports/output/ITransactionRepository.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::application {

/**
 * @brief Сводные отчёты по балансам и журналу
 */
class ReportService : public ports::input::IReportService {
public:
    ReportService(
        std::shared_ptr<ports::output::ITransactionRepository> transactionRepo,
        std::shared_ptr<ports::input::IAccountService> accountService
    ) : transactionRepo_(std::move(transactionRepo))
      , accountService_(std::move(accountService))
    {
        std::cout << "[ReportService] Created" << std::endl;
    }

    ports::input::BalanceTotals totalBalances() override {
        ports::input::BalanceTotals totals;
        for (const auto& company : accountService_->listCompanies()) {
            totals.companyTotal += company.balance;
        }
        for (const auto& user : accountService_->listUsers()) {
            totals.userTotal += user.balance;
        }
        totals.grandTotal = totals.companyTotal + totals.userTotal;
        return totals;
    }

    ports::input::TransactionSummary transactionSummary() override {
        ports::input::TransactionSummary summary;
        for (const auto& t : transactionRepo_->findAll(0)) {
            ++summary.count;
            summary.totalAmount += t.amount;
        }
        if (summary.count > 0) {
            // Округление половины вверх; сумма всегда положительна.
            // Остаток < count, поэтому remainder * 2 не переполняется.
            auto count = static_cast<int64_t>(summary.count);
            int64_t average = summary.totalAmount.cents / count;
            int64_t remainder = summary.totalAmount.cents % count;
            if (remainder * 2 >= count) {
                ++average;
            }
            summary.averageAmount = domain::Money::fromCents(average);
        }
        return summary;
    }

    ports::input::CashPosition cashPosition() override {
        ports::input::CashPosition cash;
        for (const auto& t : transactionRepo_->findAll(0)) {
            if (t.from.isCash()) {
                cash.deposits += t.amount;
            } else if (t.to.isCash()) {
                cash.withdrawals += t.amount;
            }
        }
        cash.pool = cash.withdrawals - cash.deposits;
        return cash;
    }

    ports::input::ReportSummary summary() override {
        ports::input::ReportSummary report;
        report.balances = totalBalances();
        report.transactions = transactionSummary();
        report.cash = cashPosition();
        report.companyCount = accountService_->listCompanies().size();
        report.userCount = accountService_->listUsers().size();

        std::cout << "[ReportService] Summary: " << report.transactions.count << " transaction(s), "
                  << report.companyCount << " company(ies), " << report.userCount << " user(s)" << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::output::ITransactionRepository> transactionRepo_;
    std::shared_ptr<ports::input::IAccountService> accountService_;
};

} // namespace bookkeeping::application
