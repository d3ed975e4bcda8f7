#include <gtest/gtest.h>

#include "ConsoleApplication.hpp"
#include "adapters/primary/AddCompanyHandler.hpp"
#include "adapters/primary/AddUserHandler.hpp"
#include "adapters/primary/CreateTransactionHandler.hpp"
#include "adapters/primary/DepositHandler.hpp"
#include "adapters/primary/WithdrawHandler.hpp"
#include "adapters/primary/GetLedgerHandler.hpp"
#include "mocks/InMemoryBook.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using namespace bookkeeping;
using namespace bookkeeping::adapters::primary;

namespace {

/**
 * @brief Консоль поверх изолированной in-memory книги
 */
class TestConsole : public ConsoleApplication {
public:
    TestConsole(std::istream& in, std::ostream& out) : ConsoleApplication(in, out) {}

    tests::mocks::InMemoryBook book;

protected:
    void configureInjection() override {
        registerCommand("company.add", "company.add name=...", std::make_shared<AddCompanyHandler>(book.accounts));
        registerCommand("user.add", "user.add name=...", std::make_shared<AddUserHandler>(book.accounts));
        registerCommand("transfer", "transfer from=... to=... amount=...",
                        std::make_shared<CreateTransactionHandler>(book.transactions));
        registerCommand("deposit", "deposit account=... amount=...", std::make_shared<DepositHandler>(book.transactions));
        registerCommand("withdraw", "withdraw account=... amount=...", std::make_shared<WithdrawHandler>(book.transactions));
        registerCommand("ledger", "ledger account=...",
                        std::make_shared<GetLedgerHandler>(book.ledger, book.accounts));
    }
};

std::vector<nlohmann::json> runScript(const std::string& script) {
    std::istringstream in(script);
    std::ostringstream out;
    TestConsole console(in, out);

    char name[] = "account_manager";
    char* argv[] = {name};
    console.run(1, argv);

    std::vector<nlohmann::json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(nlohmann::json::parse(line));
    }
    return responses;
}

} // namespace

TEST(ConsoleApplicationTest, Session_EndToEnd) {
    auto responses = runScript(
        "company.add name=\"Acme Traders\"\n"
        "user.add name=Asha company=1\n"
        "deposit account=company:1 amount=1,000\n"
        "transfer from=company:1 to=user:1 amount=250.50 date=2025-10-25 description=\"Advance\"\n"
        "withdraw account=user:1 amount=300\n"
        "ledger account=company:1\n");

    ASSERT_EQ(responses.size(), 6u);
    EXPECT_EQ(responses[0]["name"], "Acme Traders");
    EXPECT_EQ(responses[1]["company_id"], 1);
    EXPECT_EQ(responses[2]["to_balance"], "1000.00");
    EXPECT_EQ(responses[3]["from_balance"], "749.50");
    EXPECT_EQ(responses[3]["transaction"]["type"], "Company to User");

    EXPECT_EQ(responses[4]["code"], "insufficient_balance");
    EXPECT_EQ(responses[4]["balance"], "250.50");
    EXPECT_EQ(responses[4]["requested"], "300.00");

    EXPECT_EQ(responses[5]["entries"].size(), 2u);
    EXPECT_EQ(responses[5]["closing_balance"], "749.50");
    EXPECT_EQ(responses[5]["stored_balance"], "749.50");
}

TEST(ConsoleApplicationTest, UnknownCommandAndSyntaxErrors) {
    auto responses = runScript(
        "frobnicate\n"
        "deposit account\n"
        "deposit amount=5\n");

    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["code"], "bad_request");
    EXPECT_EQ(responses[1]["code"], "bad_request");
    EXPECT_EQ(responses[2]["code"], "bad_request");
}

TEST(ConsoleApplicationTest, BlankLinesAndCommentsIgnored_QuitStops) {
    auto responses = runScript(
        "\n"
        "# comment\n"
        "company.add name=Acme\n"
        "quit\n"
        "company.add name=Ignored\n");

    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(responses[0]["name"], "Acme");
}

TEST(ConsoleApplicationTest, HelpListsRegisteredCommands) {
    auto responses = runScript("help\n");

    ASSERT_EQ(responses.size(), 1u);
    auto commands = responses[0]["commands"];
    bool hasLedger = false;
    for (const auto& c : commands) {
        hasLedger = hasLedger || c["command"] == "ledger";
    }
    EXPECT_TRUE(hasLedger);
}
