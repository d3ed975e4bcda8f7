#include <gtest/gtest.h>

#include "mocks/InMemoryBook.hpp"

using namespace bookkeeping;
using namespace bookkeeping::tests::mocks;
using domain::Endpoint;

class ReportServiceTest : public ::testing::Test {
protected:
    InMemoryBook book_;
};

TEST_F(ReportServiceTest, EmptyBook) {
    auto summary = book_.reports->summary();

    EXPECT_EQ(summary.companyCount, 0u);
    EXPECT_EQ(summary.userCount, 0u);
    EXPECT_EQ(summary.transactions.count, 0u);
    EXPECT_TRUE(summary.transactions.averageAmount.isZero());
    EXPECT_TRUE(summary.balances.grandTotal.isZero());
    EXPECT_TRUE(summary.cash.pool.isZero());
}

TEST_F(ReportServiceTest, TotalsByKind) {
    auto acme = book_.addCompany("Acme");
    auto asha = book_.addUser("Asha");
    book_.transactions->deposit(acme, money("1000"));
    book_.transfer(Endpoint::of(acme), Endpoint::of(asha), "250");

    auto totals = book_.reports->totalBalances();

    EXPECT_EQ(totals.companyTotal, money("750"));
    EXPECT_EQ(totals.userTotal, money("250"));
    EXPECT_EQ(totals.grandTotal, money("1000"));
}

TEST_F(ReportServiceTest, AverageRoundsHalfUp) {
    auto acme = book_.addCompany("Acme");
    book_.transactions->deposit(acme, money("0.01"));
    book_.transactions->deposit(acme, money("0.02"));

    auto summary = book_.reports->transactionSummary();

    EXPECT_EQ(summary.count, 2u);
    EXPECT_EQ(summary.totalAmount, money("0.03"));
    EXPECT_EQ(summary.averageAmount, money("0.02"));
}

TEST_F(ReportServiceTest, AverageOfLargeAmounts_DoesNotOverflow) {
    auto acme = book_.addCompany("Acme");
    auto maximal = money("999,999,999,999,999.99");
    for (int i = 0; i < 24; ++i) {
        book_.transactions->deposit(acme, maximal);
        if (i < 23) {
            book_.transactions->withdraw(acme, maximal);
        }
    }

    auto summary = book_.reports->transactionSummary();

    EXPECT_EQ(summary.count, 47u);
    EXPECT_EQ(summary.totalAmount.cents, 47 * maximal.cents);
    EXPECT_EQ(summary.averageAmount, maximal);
}

TEST_F(ReportServiceTest, CashPosition) {
    auto acme = book_.addCompany("Acme");
    book_.transactions->deposit(acme, money("300"));
    book_.transactions->withdraw(acme, money("120"));

    auto cash = book_.reports->cashPosition();

    EXPECT_EQ(cash.deposits, money("300"));
    EXPECT_EQ(cash.withdrawals, money("120"));
    EXPECT_EQ(cash.pool, money("-180"));
    EXPECT_TRUE((cash.pool + book_.reports->totalBalances().grandTotal).isZero());
}
