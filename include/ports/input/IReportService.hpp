#pragma once

#include "domain/Money.hpp"
#include <cstddef>

namespace bookkeeping::ports::input {

struct BalanceTotals {
    domain::Money companyTotal;
    domain::Money userTotal;
    domain::Money grandTotal;
};

struct TransactionSummary {
    std::size_t count = 0;
    domain::Money totalAmount;
    domain::Money averageAmount;
};

/**
 * @brief Денежный поток через кассу
 *
 * pool = withdrawals - deposits; pool + grandTotal == 0,
 * если все счета начинались с нуля.
 */
struct CashPosition {
    domain::Money deposits;
    domain::Money withdrawals;
    domain::Money pool;
};

struct ReportSummary {
    BalanceTotals balances;
    TransactionSummary transactions;
    CashPosition cash;
    std::size_t companyCount = 0;
    std::size_t userCount = 0;
};

/**
 * @brief Интерфейс сервиса отчётов
 */
class IReportService {
public:
    virtual ~IReportService() = default;

    virtual BalanceTotals totalBalances() = 0;
    virtual TransactionSummary transactionSummary() = 0;
    virtual CashPosition cashPosition() = 0;
    virtual ReportSummary summary() = 0;
};

} // namespace bookkeeping::ports::input
