/**
 * @file ReportHandlerTest.cpp
 * @brief Unit-тесты для ReportHandler
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/ReportHandler.hpp"
#include "mocks/MockReportService.hpp"

using namespace bookkeeping;
using namespace bookkeeping::adapters::primary;
using namespace bookkeeping::tests::mocks;
using ::testing::Return;
using ::testing::Throw;

class ReportHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockReportService_ = std::make_shared<MockReportService>();
        settings_ = std::make_shared<settings::AppSettings>();
        handler_ = std::make_unique<ReportHandler>(mockReportService_, settings_);
    }

    std::shared_ptr<MockReportService> mockReportService_;
    std::shared_ptr<settings::AppSettings> settings_;
    std::unique_ptr<ReportHandler> handler_;
};

TEST_F(ReportHandlerTest, Summary_RendersAllSections) {
    ports::input::ReportSummary summary;
    summary.companyCount = 2;
    summary.userCount = 3;
    summary.balances.companyTotal = domain::Money::fromCents(150000);
    summary.balances.userTotal = domain::Money::fromCents(-50000);
    summary.balances.grandTotal = domain::Money::fromCents(100000);
    summary.transactions.count = 4;
    summary.transactions.totalAmount = domain::Money::fromCents(200000);
    summary.transactions.averageAmount = domain::Money::fromCents(50000);
    summary.cash.deposits = domain::Money::fromCents(120000);
    summary.cash.withdrawals = domain::Money::fromCents(20000);
    summary.cash.pool = domain::Money::fromCents(-100000);
    EXPECT_CALL(*mockReportService_, summary()).WillOnce(Return(summary));

    CommandResponse res;
    handler_->handle(CommandRequest::parse("report"), res);

    const auto& body = res.getBody();
    EXPECT_FALSE(res.isError());
    EXPECT_EQ(body["companies"], 2);
    EXPECT_EQ(body["users"], 3);
    EXPECT_EQ(body["balances"]["user_total"], "-500.00");
    EXPECT_EQ(body["transactions"]["average_amount"], "500.00");
    EXPECT_EQ(body["cash"]["pool"], "-1000.00");
    EXPECT_EQ(body["grand_total_formatted"], settings_->getCurrencySymbol() + "1,000.00");
}

TEST_F(ReportHandlerTest, StorageFailure_Internal) {
    EXPECT_CALL(*mockReportService_, summary()).WillOnce(Throw(std::runtime_error("db down")));

    CommandResponse res;
    handler_->handle(CommandRequest::parse("report"), res);

    EXPECT_TRUE(res.isError());
    EXPECT_EQ(res.getBody()["code"], "internal");
}
