/**
 * @file DateTest.cpp
 * @brief Unit tests for Date
 */

#include <gtest/gtest.h>
#include "domain/Date.hpp"

using namespace finance::domain;

// ============================================================================
// PARSING
// ============================================================================

TEST(DateTest, FromString_ValidDate) {
    auto date = Date::fromString("2025-12-16");
    ASSERT_TRUE(date.has_value());
    EXPECT_EQ(date->year, 2025);
    EXPECT_EQ(date->month, 12);
    EXPECT_EQ(date->day, 16);
}

TEST(DateTest, FromString_RejectsMalformed) {
    EXPECT_FALSE(Date::fromString("").has_value());
    EXPECT_FALSE(Date::fromString("2025-1-16").has_value());
    EXPECT_FALSE(Date::fromString("2025/01/16").has_value());
    EXPECT_FALSE(Date::fromString("2025-13-01").has_value());
    EXPECT_FALSE(Date::fromString("2025-02-29").has_value());
    EXPECT_FALSE(Date::fromString("abcd-ef-gh").has_value());
}

TEST(DateTest, FromString_LeapDay) {
    EXPECT_TRUE(Date::fromString("2024-02-29").has_value());
}

TEST(DateTest, ToString_PadsFields) {
    EXPECT_EQ(Date(2025, 3, 7).toString(), "2025-03-07");
}

// ============================================================================
// ARITHMETIC
// ============================================================================

TEST(DateTest, DayNumber_Epoch) {
    EXPECT_EQ(Date(1970, 1, 1).toDayNumber(), 0);
    EXPECT_EQ(Date::fromDayNumber(0), Date(1970, 1, 1));
}

TEST(DateTest, AddDays_CrossesYear) {
    EXPECT_EQ(Date(2025, 12, 28).addDays(7), Date(2026, 1, 4));
    EXPECT_EQ(Date(2025, 3, 1).addDays(-1), Date(2025, 2, 28));
}

TEST(DateTest, AddMonths_KeepsDay) {
    EXPECT_EQ(Date(2025, 1, 15).addMonths(1), Date(2025, 2, 15));
    EXPECT_EQ(Date(2025, 11, 1).addMonths(3), Date(2026, 2, 1));
}

TEST(DateTest, AddMonths_OverflowRollsIntoNextMonth) {
    EXPECT_EQ(Date(2025, 1, 31).addMonths(1), Date(2025, 3, 3));
    EXPECT_EQ(Date(2024, 1, 31).addMonths(1), Date(2024, 3, 2));
}

TEST(DateTest, DaysSince) {
    EXPECT_EQ(Date(2025, 6, 10).daysSince(Date(2025, 6, 1)), 9);
    EXPECT_EQ(Date(2025, 6, 1).daysSince(Date(2025, 6, 10)), -9);
}

TEST(DateTest, FirstOfMonth) {
    EXPECT_EQ(Date(2025, 6, 18).firstOfMonth(), Date(2025, 6, 1));
}
