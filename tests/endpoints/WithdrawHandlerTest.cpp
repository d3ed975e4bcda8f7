/**
 * @file WithdrawHandlerTest.cpp
 * @brief Unit-тесты для DepositHandler и WithdrawHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/DepositHandler.hpp"
#include "adapters/primary/WithdrawHandler.hpp"
#include "mocks/MockTransactionService.hpp"

using namespace bookkeeping;
using namespace bookkeeping::adapters::primary;
using namespace bookkeeping::tests::mocks;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class WithdrawHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockTransactionService_ = std::make_shared<MockTransactionService>();
        withdrawHandler_ = std::make_unique<WithdrawHandler>(mockTransactionService_);
        depositHandler_ = std::make_unique<DepositHandler>(mockTransactionService_);
    }

    static ports::input::TransactionReceipt receipt(int64_t balanceCents) {
        ports::input::TransactionReceipt r;
        r.transaction.id = 1;
        r.fromBalance = domain::Money::fromCents(balanceCents);
        return r;
    }

    std::shared_ptr<MockTransactionService> mockTransactionService_;
    std::unique_ptr<WithdrawHandler> withdrawHandler_;
    std::unique_ptr<DepositHandler> depositHandler_;
};

TEST_F(WithdrawHandlerTest, Withdraw_CallsService) {
    EXPECT_CALL(*mockTransactionService_,
                withdraw(domain::AccountRef::user(4), domain::Money::fromCents(2550), "Petty cash"))
        .WillOnce(Return(receipt(7450)));

    CommandResponse res;
    withdrawHandler_->handle(CommandRequest::parse("withdraw account=user:4 amount=25.50 description=\"Petty cash\""), res);

    EXPECT_FALSE(res.isError());
    EXPECT_EQ(res.getBody()["from_balance"], "74.50");
}

TEST_F(WithdrawHandlerTest, Withdraw_Insufficient_CarriesAmounts) {
    EXPECT_CALL(*mockTransactionService_, withdraw(_, _, _))
        .WillOnce(Throw(domain::InsufficientBalanceError(10000, 15000)));

    CommandResponse res;
    withdrawHandler_->handle(CommandRequest::parse("withdraw account=company:1 amount=150"), res);

    EXPECT_TRUE(res.isError());
    EXPECT_EQ(res.getBody()["code"], "insufficient_balance");
    EXPECT_EQ(res.getBody()["balance"], "100.00");
    EXPECT_EQ(res.getBody()["requested"], "150.00");
}

TEST_F(WithdrawHandlerTest, Withdraw_CashAccount_Rejected) {
    EXPECT_CALL(*mockTransactionService_, withdraw(_, _, _)).Times(0);

    CommandResponse res;
    withdrawHandler_->handle(CommandRequest::parse("withdraw account=cash amount=1"), res);

    EXPECT_EQ(res.getBody()["code"], "validation");
    EXPECT_EQ(res.getBody()["field"], "account");
}

TEST_F(WithdrawHandlerTest, Deposit_EmptyDescriptionUsesDefault) {
    EXPECT_CALL(*mockTransactionService_,
                deposit(domain::AccountRef::company(2), domain::Money::fromCents(100000), ""))
        .WillOnce(Return(receipt(0)));

    CommandResponse res;
    depositHandler_->handle(CommandRequest::parse("deposit account=company:2 amount=\"Rs. 1,000\""), res);

    EXPECT_FALSE(res.isError());
}
