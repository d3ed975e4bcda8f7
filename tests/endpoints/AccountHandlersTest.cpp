/**
 * @file AccountHandlersTest.cpp
 * @brief Unit-тесты обработчиков company.* / user.* / balance
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/AddCompanyHandler.hpp"
#include "adapters/primary/UpdateCompanyHandler.hpp"
#include "adapters/primary/RemoveCompanyHandler.hpp"
#include "adapters/primary/UpdateUserHandler.hpp"
#include "adapters/primary/ListUsersHandler.hpp"
#include "adapters/primary/GetBalanceHandler.hpp"
#include "mocks/MockAccountService.hpp"

using namespace bookkeeping;
using namespace bookkeeping::adapters::primary;
using namespace bookkeeping::tests::mocks;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;
using ::testing::SaveArg;

class AccountHandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        mockAccountService_ = std::make_shared<MockAccountService>();
    }

    template <typename Handler>
    CommandResponse run(Handler& handler, const std::string& line) {
        CommandResponse res;
        handler.handle(CommandRequest::parse(line), res);
        return res;
    }

    static domain::Company acme() {
        domain::Company c("Acme", "1 Main Street", "9876543210", "info@acme.example");
        c.id = 1;
        c.balance = domain::Money::fromCents(12345);
        return c;
    }

    std::shared_ptr<MockAccountService> mockAccountService_;
};

TEST_F(AccountHandlersTest, AddCompany_ReturnsCreated) {
    AddCompanyHandler handler(mockAccountService_);
    ports::input::CompanyRequest captured;
    EXPECT_CALL(*mockAccountService_, addCompany(_)).WillOnce(::testing::DoAll(SaveArg<0>(&captured), Return(acme())));

    auto res = run(handler, "company.add name=Acme address=\"1 Main Street\"");

    EXPECT_EQ(captured.name, "Acme");
    EXPECT_EQ(captured.address, "1 Main Street");
    EXPECT_EQ(res.getBody()["id"], 1);
    EXPECT_EQ(res.getBody()["balance"], "123.45");
}

TEST_F(AccountHandlersTest, AddCompany_DuplicateName) {
    AddCompanyHandler handler(mockAccountService_);
    EXPECT_CALL(*mockAccountService_, addCompany(_))
        .WillOnce(Throw(domain::ValidationError("name", "company 'Acme' already exists")));

    auto res = run(handler, "company.add name=Acme");

    EXPECT_EQ(res.getBody()["code"], "validation");
    EXPECT_EQ(res.getBody()["field"], "name");
}

TEST_F(AccountHandlersTest, UpdateCompany_KeepsUnspecifiedFields) {
    UpdateCompanyHandler handler(mockAccountService_);
    ports::input::CompanyRequest captured;
    EXPECT_CALL(*mockAccountService_, getCompany(1)).WillOnce(Return(acme()));
    EXPECT_CALL(*mockAccountService_, updateCompany(1, _))
        .WillOnce(::testing::DoAll(SaveArg<1>(&captured), Return(acme())));

    run(handler, "company.update id=1 phone=\"020 5550 1234\"");

    EXPECT_EQ(captured.name, "Acme");
    EXPECT_EQ(captured.address, "1 Main Street");
    EXPECT_EQ(captured.phone, "020 5550 1234");
    EXPECT_EQ(captured.email, "info@acme.example");
}

TEST_F(AccountHandlersTest, UpdateCompany_BadId) {
    UpdateCompanyHandler handler(mockAccountService_);
    EXPECT_CALL(*mockAccountService_, getCompany(_)).Times(0);

    auto res = run(handler, "company.update id=abc");

    EXPECT_EQ(res.getBody()["code"], "validation");
    EXPECT_EQ(res.getBody()["field"], "id");
}

TEST_F(AccountHandlersTest, RemoveCompany_InUse) {
    RemoveCompanyHandler handler(mockAccountService_);
    EXPECT_CALL(*mockAccountService_, removeCompany(1))
        .WillOnce(Throw(domain::AccountInUseError("company 'Acme'", 3)));

    auto res = run(handler, "company.remove id=1");

    EXPECT_EQ(res.getBody()["code"], "validation");
    EXPECT_EQ(res.getBody()["field"], "account");
}

TEST_F(AccountHandlersTest, UpdateUser_EmptyCompanyDetaches) {
    UpdateUserHandler handler(mockAccountService_);
    domain::User asha("Asha", 1);
    asha.id = 5;
    ports::input::UserRequest captured;
    EXPECT_CALL(*mockAccountService_, getUser(5)).WillOnce(Return(asha));
    EXPECT_CALL(*mockAccountService_, updateUser(5, _))
        .WillOnce(::testing::DoAll(SaveArg<1>(&captured), Return(asha)));

    run(handler, "user.update id=5 company=\"\"");

    EXPECT_FALSE(captured.companyId.has_value());
    EXPECT_EQ(captured.name, "Asha");
}

TEST_F(AccountHandlersTest, ListUsers_ByCompany) {
    ListUsersHandler handler(mockAccountService_);
    EXPECT_CALL(*mockAccountService_, listUsersByCompany(2))
        .WillOnce(Return(std::vector<domain::User>{domain::User("Ravi", 2)}));
    EXPECT_CALL(*mockAccountService_, listUsers()).Times(0);

    auto res = run(handler, "user.list company=2");

    EXPECT_EQ(res.getBody()["count"], 1);
    EXPECT_EQ(res.getBody()["users"][0]["company_id"], 2);
}

TEST_F(AccountHandlersTest, GetBalance_FormatsWithCurrency) {
    auto settings = std::make_shared<settings::AppSettings>();
    GetBalanceHandler handler(mockAccountService_, settings);
    EXPECT_CALL(*mockAccountService_, getBalance(domain::AccountRef::company(1)))
        .WillOnce(Return(domain::Money::fromCents(123456789)));
    EXPECT_CALL(*mockAccountService_, displayName(_)).WillOnce(Return("Acme"));

    auto res = run(handler, "balance account=company:1");

    EXPECT_EQ(res.getBody()["balance"], "1234567.89");
    EXPECT_EQ(res.getBody()["formatted"], settings->getCurrencySymbol() + "1,234,567.89");
}
