/**
 * @file BillTest.cpp
 * @brief Unit tests for Bill due dates
 */

#include <gtest/gtest.h>
#include "domain/Bill.hpp"

using namespace finance::domain;

namespace {

Bill makeBill(const std::string& dueDate, BillFrequency frequency = BillFrequency::MONTHLY) {
    Bill bill;
    bill.id = "bill-1";
    bill.name = "Rent";
    bill.amount = Money(120000);
    bill.dueDate = dueDate;
    bill.accountId = "acc-1";
    bill.frequency = frequency;
    return bill;
}

const Date kToday(2025, 6, 10);

} // namespace

// ============================================================================
// NEXT DUE DATE
// ============================================================================

TEST(BillTest, NextDueDate_ByFrequency) {
    EXPECT_EQ(makeBill("2025-06-10", BillFrequency::WEEKLY).nextDueDate(kToday), "2025-06-17");
    EXPECT_EQ(makeBill("2025-06-10", BillFrequency::BIWEEKLY).nextDueDate(kToday), "2025-06-24");
    EXPECT_EQ(makeBill("2025-06-10", BillFrequency::MONTHLY).nextDueDate(kToday), "2025-07-10");
}

TEST(BillTest, NextDueDate_MonthEndOverflow) {
    EXPECT_EQ(makeBill("2025-01-31").nextDueDate(kToday), "2025-03-03");
}

TEST(BillTest, NextDueDate_WithoutDueDate_CountsFromToday) {
    EXPECT_EQ(makeBill("").nextDueDate(kToday), "2025-07-10");
    EXPECT_EQ(makeBill("garbage", BillFrequency::WEEKLY).nextDueDate(kToday), "2025-06-17");
}

// ============================================================================
// DUE STATUS
// ============================================================================

TEST(BillTest, DueStatus_Classification) {
    EXPECT_EQ(makeBill("").dueStatus(kToday).state, DueState::NO_DUE_DATE);

    auto overdue = makeBill("2025-06-07").dueStatus(kToday);
    EXPECT_EQ(overdue.state, DueState::OVERDUE);
    EXPECT_EQ(overdue.days, 3);

    EXPECT_EQ(makeBill("2025-06-10").dueStatus(kToday).state, DueState::DUE_TODAY);
    EXPECT_EQ(makeBill("2025-06-11").dueStatus(kToday).state, DueState::DUE_TOMORROW);

    auto soon = makeBill("2025-06-17").dueStatus(kToday);
    EXPECT_EQ(soon.state, DueState::DUE_SOON);
    EXPECT_EQ(soon.days, 7);

    auto upcoming = makeBill("2025-06-18").dueStatus(kToday);
    EXPECT_EQ(upcoming.state, DueState::UPCOMING);
    EXPECT_EQ(upcoming.days, 8);
}

TEST(BillTest, IsRecurring) {
    EXPECT_FALSE(isRecurring(BillFrequency::ONCE));
    EXPECT_TRUE(isRecurring(BillFrequency::WEEKLY));
    EXPECT_TRUE(isRecurring(BillFrequency::MONTHLY));
}
