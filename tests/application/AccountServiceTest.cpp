#include <gtest/gtest.h>

#include "mocks/InMemoryBook.hpp"

#include <functional>

using namespace bookkeeping;
using namespace bookkeeping::tests::mocks;
using domain::Endpoint;

class AccountServiceTest : public ::testing::Test {
protected:
    static ports::input::CompanyRequest company(const std::string& name,
                                                const std::string& phone = "",
                                                const std::string& email = "") {
        ports::input::CompanyRequest request;
        request.name = name;
        request.address = "1 Main Street";
        request.phone = phone;
        request.email = email;
        return request;
    }

    static std::string rejectedField(const std::function<void()>& action) {
        try {
            action();
        } catch (const domain::ValidationError& e) {
            return e.field();
        }
        return "";
    }

    InMemoryBook book_;
};

// ============================================
// COMPANIES
// ============================================

TEST_F(AccountServiceTest, AddCompany_StartsAtZero) {
    auto created = book_.accounts->addCompany(company("Acme Traders", "+91 (20) 5550-1234", "accounts@acme.example"));

    EXPECT_GT(created.id, 0);
    EXPECT_EQ(created.name, "Acme Traders");
    EXPECT_TRUE(created.balance.isZero());

    auto loaded = book_.accounts->getCompany(created.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->phone, "+91 (20) 5550-1234");
}

TEST_F(AccountServiceTest, AddCompany_IdsAreMonotonic) {
    auto a = book_.accounts->addCompany(company("A"));
    auto b = book_.accounts->addCompany(company("B"));
    EXPECT_LT(a.id, b.id);
}

TEST_F(AccountServiceTest, AddCompany_DuplicateName) {
    book_.accounts->addCompany(company("Acme"));
    EXPECT_EQ(rejectedField([&] { book_.accounts->addCompany(company("Acme")); }), "name");
    EXPECT_EQ(book_.accounts->listCompanies().size(), 1u);
}

TEST_F(AccountServiceTest, AddCompany_InvalidFields) {
    EXPECT_EQ(rejectedField([&] { book_.accounts->addCompany(company("")); }), "name");
    EXPECT_EQ(rejectedField([&] { book_.accounts->addCompany(company("   ")); }), "name");
    EXPECT_EQ(rejectedField([&] { book_.accounts->addCompany(company(std::string(101, 'x'))); }), "name");
    EXPECT_EQ(rejectedField([&] { book_.accounts->addCompany(company("Acme", "12345")); }), "phone");
    EXPECT_EQ(rejectedField([&] { book_.accounts->addCompany(company("Acme", "", "not-an-email")); }), "email");
    EXPECT_TRUE(book_.accounts->listCompanies().empty());
}

TEST_F(AccountServiceTest, ListCompanies_SortedByName) {
    book_.accounts->addCompany(company("Zeta"));
    book_.accounts->addCompany(company("Alpha"));
    book_.accounts->addCompany(company("Mid"));

    auto companies = book_.accounts->listCompanies();
    ASSERT_EQ(companies.size(), 3u);
    EXPECT_EQ(companies[0].name, "Alpha");
    EXPECT_EQ(companies[1].name, "Mid");
    EXPECT_EQ(companies[2].name, "Zeta");
}

TEST_F(AccountServiceTest, UpdateCompany_KeepsBalance) {
    auto acme = book_.addCompany("Acme");
    book_.transactions->deposit(acme, money("500"));

    auto updated = book_.accounts->updateCompany(acme.id, company("Acme Holdings"));

    EXPECT_EQ(updated.name, "Acme Holdings");
    EXPECT_EQ(updated.balance, money("500"));
    EXPECT_EQ(book_.balance(acme), money("500"));
}

TEST_F(AccountServiceTest, UpdateCompany_SameNameAllowed_OtherNameTaken) {
    auto acme = book_.addCompany("Acme");
    book_.addCompany("Globex");

    EXPECT_NO_THROW(book_.accounts->updateCompany(acme.id, company("Acme")));
    EXPECT_EQ(rejectedField([&] { book_.accounts->updateCompany(acme.id, company("Globex")); }), "name");
}

TEST_F(AccountServiceTest, UpdateCompany_Unknown_NotFound) {
    EXPECT_THROW(book_.accounts->updateCompany(99, company("Nobody")), domain::NotFoundError);
}

// ============================================
// DELETION POLICY
// ============================================

TEST_F(AccountServiceTest, RemoveCompany_WithoutTransactions) {
    auto acme = book_.addCompany("Acme");
    book_.accounts->removeCompany(acme.id);

    EXPECT_FALSE(book_.accounts->getCompany(acme.id).has_value());
}

TEST_F(AccountServiceTest, RemoveCompany_ReferencedByTransaction_Rejected) {
    auto acme = book_.addCompany("Acme");
    book_.transactions->deposit(acme, money("10"));

    try {
        book_.accounts->removeCompany(acme.id);
        FAIL() << "Expected AccountInUseError";
    } catch (const domain::AccountInUseError& e) {
        EXPECT_EQ(e.field(), "account");
        EXPECT_EQ(e.references(), 1u);
    }

    EXPECT_TRUE(book_.accounts->getCompany(acme.id).has_value());
    EXPECT_EQ(book_.balance(acme), money("10"));
}

TEST_F(AccountServiceTest, RemoveCompany_AfterTransactionDeleted) {
    auto acme = book_.addCompany("Acme");
    auto receipt = book_.transactions->deposit(acme, money("10"));
    book_.transactions->deleteTransaction(receipt.transaction.id);

    EXPECT_NO_THROW(book_.accounts->removeCompany(acme.id));
}

TEST_F(AccountServiceTest, RemoveCompany_DetachesUsers) {
    auto acme = book_.addCompany("Acme");
    auto asha = book_.addUser("Asha", acme.id);

    book_.accounts->removeCompany(acme.id);

    auto user = book_.accounts->getUser(asha.id);
    ASSERT_TRUE(user.has_value());
    EXPECT_FALSE(user->companyId.has_value());
}

TEST_F(AccountServiceTest, RemoveUser_ReferencedByTransaction_Rejected) {
    auto ravi = book_.addUser("Ravi");
    auto acme = book_.addCompany("Acme");
    book_.transfer(Endpoint::of(acme), Endpoint::of(ravi), "5");

    EXPECT_THROW(book_.accounts->removeUser(ravi.id), domain::AccountInUseError);
    EXPECT_TRUE(book_.accounts->getUser(ravi.id).has_value());
}

TEST_F(AccountServiceTest, Remove_Unknown_NotFound) {
    EXPECT_THROW(book_.accounts->removeCompany(5), domain::NotFoundError);
    EXPECT_THROW(book_.accounts->removeUser(5), domain::NotFoundError);
}

// ============================================
// USERS
// ============================================

TEST_F(AccountServiceTest, AddUser_UnknownCompany_NotFound) {
    ports::input::UserRequest request;
    request.name = "Asha";
    request.companyId = 42;

    EXPECT_THROW(book_.accounts->addUser(request), domain::NotFoundError);
    EXPECT_TRUE(book_.accounts->listUsers().empty());
}

TEST_F(AccountServiceTest, ListUsersByCompany) {
    auto acme = book_.addCompany("Acme");
    auto globex = book_.addCompany("Globex");
    book_.addUser("Asha", acme.id);
    book_.addUser("Bala", acme.id);
    book_.addUser("Ravi", globex.id);
    book_.addUser("Free Agent");

    EXPECT_EQ(book_.accounts->listUsersByCompany(acme.id).size(), 2u);
    EXPECT_EQ(book_.accounts->listUsersByCompany(globex.id).size(), 1u);
    EXPECT_EQ(book_.accounts->listUsers().size(), 4u);
    EXPECT_THROW(book_.accounts->listUsersByCompany(77), domain::NotFoundError);
}

TEST_F(AccountServiceTest, UpdateUser_MoveBetweenCompanies) {
    auto acme = book_.addCompany("Acme");
    auto globex = book_.addCompany("Globex");
    auto asha = book_.addUser("Asha", acme.id);

    ports::input::UserRequest request;
    request.name = "Asha Verma";
    request.companyId = globex.id;
    request.role = "Accountant";
    auto updated = book_.accounts->updateUser(asha.id, request);

    EXPECT_EQ(updated.name, "Asha Verma");
    EXPECT_EQ(updated.companyId, globex.id);
    EXPECT_EQ(updated.role, "Accountant");
    EXPECT_TRUE(book_.accounts->listUsersByCompany(acme.id).empty());
}

// ============================================
// BALANCE & NAMES
// ============================================

TEST_F(AccountServiceTest, GetBalance_Unknown_NotFound) {
    EXPECT_THROW(book_.accounts->getBalance(domain::AccountRef::company(1)), domain::NotFoundError);
    EXPECT_THROW(book_.accounts->getBalance(domain::AccountRef::user(1)), domain::NotFoundError);
}

TEST_F(AccountServiceTest, DisplayName) {
    auto acme = book_.addCompany("Acme");
    auto asha = book_.addUser("Asha");

    EXPECT_EQ(book_.accounts->displayName(Endpoint::of(acme)), "Acme");
    EXPECT_EQ(book_.accounts->displayName(Endpoint::of(asha)), "Asha");
    EXPECT_EQ(book_.accounts->displayName(Endpoint::cash()), "Cash");
}
