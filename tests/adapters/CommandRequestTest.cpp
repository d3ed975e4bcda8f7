#include <gtest/gtest.h>

#include "adapters/primary/CommandRequest.hpp"

using namespace bookkeeping::adapters::primary;

TEST(CommandRequestTest, Parse_CommandAndArguments) {
    auto req = CommandRequest::parse("transfer from=company:1 to=user:2 amount=1,500.00");

    EXPECT_EQ(req.getCommand(), "transfer");
    EXPECT_EQ(req.require("from"), "company:1");
    EXPECT_EQ(req.require("to"), "user:2");
    EXPECT_EQ(req.require("amount"), "1,500.00");
    EXPECT_EQ(req.getArgs().size(), 3u);
}

TEST(CommandRequestTest, Parse_QuotedValues) {
    auto req = CommandRequest::parse(R"(company.add name="Acme Traders" address="12 \"MG\" Road" email="")");

    EXPECT_EQ(req.require("name"), "Acme Traders");
    EXPECT_EQ(req.require("address"), "12 \"MG\" Road");
    ASSERT_TRUE(req.get("email").has_value());
    EXPECT_TRUE(req.get("email")->empty());
}

TEST(CommandRequestTest, Parse_CommandOnly) {
    auto req = CommandRequest::parse("   company.list   ");

    EXPECT_EQ(req.getCommand(), "company.list");
    EXPECT_TRUE(req.getArgs().empty());
}

TEST(CommandRequestTest, Parse_ValueMayContainEquals) {
    auto req = CommandRequest::parse("transaction.search term=a=b");
    EXPECT_EQ(req.require("term"), "a=b");
}

TEST(CommandRequestTest, Parse_Errors) {
    EXPECT_THROW(CommandRequest::parse("deposit account"), BadRequestError);
    EXPECT_THROW(CommandRequest::parse("deposit =5"), BadRequestError);
    EXPECT_THROW(CommandRequest::parse("deposit note=\"open"), BadRequestError);
    EXPECT_THROW(CommandRequest::parse("deposit note=\"a\"b"), BadRequestError);
    EXPECT_THROW(CommandRequest::parse("deposit amount=1 amount=2"), BadRequestError);
}

TEST(CommandRequestTest, Require_Missing) {
    auto req = CommandRequest::parse("balance");

    EXPECT_THROW(req.require("account"), BadRequestError);
    EXPECT_FALSE(req.has("account"));
    EXPECT_EQ(req.getOr("account", "none"), "none");
}
