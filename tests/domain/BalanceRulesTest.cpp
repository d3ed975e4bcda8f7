#include <gtest/gtest.h>

#include "domain/BalanceRules.hpp"

#include <limits>

using namespace bookkeeping::domain;

namespace {

Transaction draft(const Endpoint& from, const Endpoint& to, int64_t cents) {
    Transaction t;
    t.date = Date::parse("2025-10-25");
    t.amount = Money::fromCents(cents);
    t.from = from;
    t.to = to;
    return t;
}

std::string rejectedField(const Transaction& t) {
    try {
        BalanceRules::validate(t);
    } catch (const ValidationError& e) {
        return e.field();
    }
    return "";
}

} // namespace

TEST(BalanceRulesTest, Validate_NonPositiveAmount) {
    EXPECT_EQ(rejectedField(draft(Endpoint::company(1), Endpoint::user(1), 0)), "amount");
    EXPECT_EQ(rejectedField(draft(Endpoint::company(1), Endpoint::user(1), -500)), "amount");
}

TEST(BalanceRulesTest, Validate_CashToCash) {
    EXPECT_EQ(rejectedField(draft(Endpoint::cash(), Endpoint::cash(), 100)), "to");
}

TEST(BalanceRulesTest, Validate_SameEndpoint) {
    EXPECT_EQ(rejectedField(draft(Endpoint::user(2), Endpoint::user(2), 100)), "to");
}

TEST(BalanceRulesTest, Validate_LongDescription) {
    auto t = draft(Endpoint::company(1), Endpoint::user(1), 100);
    t.description = std::string(BalanceRules::MAX_DESCRIPTION_LENGTH + 1, 'x');
    EXPECT_EQ(rejectedField(t), "description");

    t.description.pop_back();
    EXPECT_EQ(rejectedField(t), "");
}

TEST(BalanceRulesTest, RequiresBalanceCheck_OnlyRealToCash) {
    EXPECT_TRUE(BalanceRules::requiresBalanceCheck(draft(Endpoint::user(1), Endpoint::cash(), 1)));
    EXPECT_FALSE(BalanceRules::requiresBalanceCheck(draft(Endpoint::cash(), Endpoint::user(1), 1)));
    EXPECT_FALSE(BalanceRules::requiresBalanceCheck(draft(Endpoint::company(1), Endpoint::user(1), 1)));
}

TEST(BalanceRulesTest, DeltasFor_Transfer) {
    auto changes = BalanceRules::deltasFor(draft(Endpoint::company(1), Endpoint::user(2), 50000));

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].account, AccountRef::company(1));
    EXPECT_EQ(changes[0].delta.cents, -50000);
    EXPECT_EQ(changes[1].account, AccountRef::user(2));
    EXPECT_EQ(changes[1].delta.cents, 50000);
}

TEST(BalanceRulesTest, DeltasFor_CashIsNotStored) {
    auto changes = BalanceRules::deltasFor(draft(Endpoint::cash(), Endpoint::company(1), 10000));

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].account, AccountRef::company(1));
    EXPECT_EQ(changes[0].delta.cents, 10000);
}

TEST(BalanceRulesTest, ReversalOf_NegatesEveryDelta) {
    auto t = draft(Endpoint::user(3), Endpoint::company(4), 1234);
    auto forward = BalanceRules::deltasFor(t);
    auto reverse = BalanceRules::reversalOf(t);

    ASSERT_EQ(forward.size(), reverse.size());
    for (std::size_t i = 0; i < forward.size(); ++i) {
        EXPECT_EQ(forward[i].account, reverse[i].account);
        EXPECT_EQ((forward[i].delta + reverse[i].delta).cents, 0);
    }
}

TEST(BalanceRulesTest, RequireHeadroom_RejectsOverflowingDelta) {
    auto changes = BalanceRules::deltasFor(draft(Endpoint::cash(), Endpoint::company(1), 500));
    auto nearMax = [](const AccountRef&) { return Money::fromCents(std::numeric_limits<int64_t>::max() - 499); };
    auto ordinary = [](const AccountRef&) { return Money::fromCents(1000); };

    EXPECT_NO_THROW(BalanceRules::requireHeadroom(changes, ordinary));
    try {
        BalanceRules::requireHeadroom(changes, nearMax);
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "amount");
    }
}
