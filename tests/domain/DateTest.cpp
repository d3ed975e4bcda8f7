#include <gtest/gtest.h>

#include "domain/Date.hpp"

using namespace bookkeeping::domain;

TEST(DateTest, Parse_Valid) {
    auto d = Date::parse("2025-10-27");
    EXPECT_EQ(d.year, 2025);
    EXPECT_EQ(d.month, 10);
    EXPECT_EQ(d.day, 27);
    EXPECT_EQ(d.toString(), "2025-10-27");
}

TEST(DateTest, Parse_LeapDay) {
    EXPECT_NO_THROW(Date::parse("2024-02-29"));
    EXPECT_THROW(Date::parse("2025-02-29"), ValidationError);
    EXPECT_THROW(Date::parse("1900-02-29"), ValidationError);
    EXPECT_NO_THROW(Date::parse("2000-02-29"));
}

TEST(DateTest, Parse_Malformed_Throws) {
    EXPECT_THROW(Date::parse("2025/10/27"), ValidationError);
    EXPECT_THROW(Date::parse("25-10-27"), ValidationError);
    EXPECT_THROW(Date::parse("2025-13-01"), ValidationError);
    EXPECT_THROW(Date::parse("2025-04-31"), ValidationError);
    EXPECT_THROW(Date::parse("2025-1a-01"), ValidationError);
}

TEST(DateTest, Parse_ReportsDateField) {
    try {
        Date::parse("yesterday");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.field(), "date");
    }
}

TEST(DateTest, Ordering) {
    EXPECT_LT(Date::parse("2025-10-25"), Date::parse("2025-10-27"));
    EXPECT_LT(Date::parse("2024-12-31"), Date::parse("2025-01-01"));
    EXPECT_EQ(Date::parse("2025-10-25"), Date::parse("2025-10-25"));
}
