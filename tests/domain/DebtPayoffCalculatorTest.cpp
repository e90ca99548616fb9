/**
 * @file DebtPayoffCalculatorTest.cpp
 * @brief Unit tests for DebtPayoffCalculator
 */

#include <gtest/gtest.h>
#include "domain/DebtPayoff.hpp"

using namespace finance::domain;

namespace {

DebtInput makeDebt(const std::string& id, double balance, double minimum, double apr, double starting) {
    DebtInput debt;
    debt.id = id;
    debt.name = id;
    debt.balance = balance;
    debt.minimumPayment = minimum;
    debt.apr = apr;
    debt.startingBalance = starting;
    return debt;
}

} // namespace

class DebtPayoffCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        debts_ = {
            makeDebt("B", 1000.0, 40.0, 0.12, 1000.0),
            makeDebt("A", 500.0, 25.0, 0.24, 500.0),
        };
    }

    std::vector<DebtInput> debts_;
    const Date start_{2025, 1, 15};
};

// ============================================================================
// ORDERING
// ============================================================================

TEST_F(DebtPayoffCalculatorTest, Prioritize_SnowballBySmallestBalance) {
    auto ordered = DebtPayoffCalculator::prioritize(debts_, DebtPayoffMode::SNOWBALL);
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered[0].id, "A");
    EXPECT_EQ(ordered[1].id, "B");
}

TEST_F(DebtPayoffCalculatorTest, Prioritize_AvalancheByHighestApr) {
    debts_[0].apr = 0.30;
    auto ordered = DebtPayoffCalculator::prioritize(debts_, DebtPayoffMode::AVALANCHE);
    EXPECT_EQ(ordered[0].id, "B");
    EXPECT_EQ(ordered[1].id, "A");
}

TEST_F(DebtPayoffCalculatorTest, Prioritize_TiesKeepInputOrder) {
    std::vector<DebtInput> tied = {
        makeDebt("first", 300.0, 10.0, 0.1, 300.0),
        makeDebt("second", 300.0, 10.0, 0.1, 300.0),
    };
    auto ordered = DebtPayoffCalculator::prioritize(tied, DebtPayoffMode::SNOWBALL);
    EXPECT_EQ(ordered[0].id, "first");
    EXPECT_EQ(ordered[1].id, "second");
}

// ============================================================================
// SIMULATION
// ============================================================================

TEST_F(DebtPayoffCalculatorTest, Snowball_FirstMonthMatchesManualCalculation) {
    auto result = DebtPayoffCalculator::calculate(debts_, DebtPayoffMode::SNOWBALL, 100.0, start_);

    ASSERT_FALSE(result.insufficientAllocation);
    ASSERT_FALSE(result.schedule.empty());

    const auto& first = result.schedule.front();
    EXPECT_EQ(first.month, 1);
    EXPECT_EQ(first.date, Date(2025, 2, 1));
    ASSERT_EQ(first.balances.size(), 2u);
    EXPECT_NEAR(first.balances[0], 450.0, 1e-6);    // A: 500 + 10 - 25 - 35
    EXPECT_NEAR(first.balances[1], 970.0, 1e-6);    // B: 1000 + 10 - 40

    // Ни один долг не погашен в первом месяце
    ASSERT_TRUE(result.debts[0].estimatedPayoffDate.has_value());
    ASSERT_TRUE(result.debts[1].estimatedPayoffDate.has_value());
    EXPECT_GT(*result.debts[0].estimatedPayoffDate, first.date);
    EXPECT_GT(*result.debts[1].estimatedPayoffDate, first.date);
}

TEST_F(DebtPayoffCalculatorTest, Snowball_PaysSmallestFirstAndTerminates) {
    auto result = DebtPayoffCalculator::calculate(debts_, DebtPayoffMode::SNOWBALL, 100.0, start_);

    ASSERT_EQ(result.debts[0].id, "A");
    auto payoffA = result.debts[0].estimatedPayoffDate;
    auto payoffB = result.debts[1].estimatedPayoffDate;
    ASSERT_TRUE(payoffA && payoffB);
    EXPECT_LT(*payoffA, *payoffB);

    EXPECT_GT(result.monthsSimulated, 0);
    EXPECT_LT(result.monthsSimulated, DebtPayoffCalculator::MAX_MONTHS);
    EXPECT_EQ(result.schedule.size(), static_cast<size_t>(result.monthsSimulated));

    ASSERT_TRUE(result.overallEstimatedDebtFreeDate.has_value());
    EXPECT_EQ(*result.overallEstimatedDebtFreeDate, *payoffB);

    EXPECT_EQ(result.nextDebtId, "A");
    EXPECT_EQ(result.nextDebtEstimatedPayoffDate, payoffA);
    EXPECT_DOUBLE_EQ(result.progressToNextDebt, 0.0);
    EXPECT_GT(result.debts[0].interestAccrued, 0.0);
}

TEST_F(DebtPayoffCalculatorTest, ZeroApr_SufficientAllocationTerminates) {
    std::vector<DebtInput> interestFree = {
        makeDebt("furniture", 450.0, 30.0, 0.0, 450.0),
        makeDebt("phone", 300.0, 20.0, 0.0, 300.0),
    };

    auto result = DebtPayoffCalculator::calculate(interestFree, DebtPayoffMode::SNOWBALL, 100.0, start_);

    EXPECT_FALSE(result.insufficientAllocation);
    EXPECT_GE(result.monthsSimulated, 8);   // 750 при 100 в месяц
    EXPECT_LE(result.monthsSimulated, DebtPayoffCalculator::MAX_MONTHS);

    for (const auto& debt : result.debts) {
        ASSERT_TRUE(debt.estimatedPayoffDate.has_value()) << debt.id;
        EXPECT_EQ(debt.estimatedPayoffDate->day, 1);
        EXPECT_DOUBLE_EQ(debt.interestAccrued, 0.0);
    }
    ASSERT_TRUE(result.overallEstimatedDebtFreeDate.has_value());
    EXPECT_EQ(*result.overallEstimatedDebtFreeDate, *result.debts.back().estimatedPayoffDate);
}

TEST_F(DebtPayoffCalculatorTest, Schedule_BalancesNeverIncreaseAndStayPaid) {
    auto result = DebtPayoffCalculator::calculate(debts_, DebtPayoffMode::SNOWBALL, 100.0, start_);

    std::vector<double> previous = {500.0, 1000.0};
    for (const auto& month : result.schedule) {
        for (size_t i = 0; i < month.balances.size(); ++i) {
            EXPECT_LE(month.balances[i], previous[i] + 1e-9) << "month " << month.month;
            if (previous[i] == 0.0) {
                EXPECT_EQ(month.balances[i], 0.0);
            }
        }
        previous = month.balances;
    }

    for (double balance : result.schedule.back().balances) {
        EXPECT_EQ(balance, 0.0);
    }
}

TEST_F(DebtPayoffCalculatorTest, PayoffDate_MatchesFirstZeroMonth) {
    auto result = DebtPayoffCalculator::calculate(debts_, DebtPayoffMode::SNOWBALL, 100.0, start_);

    for (size_t i = 0; i < result.debts.size(); ++i) {
        std::optional<Date> firstZero;
        for (const auto& month : result.schedule) {
            if (month.balances[i] == 0.0) {
                firstZero = month.date;
                break;
            }
        }
        EXPECT_EQ(result.debts[i].estimatedPayoffDate, firstZero);
    }
}

TEST_F(DebtPayoffCalculatorTest, Avalanche_ReportsAggregateProgress) {
    debts_[0].apr = 0.30;
    debts_[1].startingBalance = 1000.0;   // A: 500 из 1000

    auto result = DebtPayoffCalculator::calculate(debts_, DebtPayoffMode::AVALANCHE, 100.0, start_);

    ASSERT_FALSE(result.insufficientAllocation);
    EXPECT_EQ(result.debts[0].id, "B");
    EXPECT_FALSE(result.nextDebtId.has_value());
    EXPECT_DOUBLE_EQ(result.progressTotalPaid, 0.25);   // 1 - 1500 / 2000
    EXPECT_DOUBLE_EQ(result.progressToNextDebt, 0.0);
    EXPECT_TRUE(result.overallEstimatedDebtFreeDate.has_value());
}

// ============================================================================
// INSUFFICIENT ALLOCATION
// ============================================================================

TEST_F(DebtPayoffCalculatorTest, Insufficient_WhenBelowMinimums) {
    auto result = DebtPayoffCalculator::calculate(debts_, DebtPayoffMode::SNOWBALL, 50.0, start_);

    EXPECT_TRUE(result.insufficientAllocation);
    EXPECT_EQ(result.monthsSimulated, 0);
    EXPECT_TRUE(result.schedule.empty());
    EXPECT_EQ(result.nextDebtId, "A");
    EXPECT_FALSE(result.nextDebtEstimatedPayoffDate.has_value());
    EXPECT_FALSE(result.overallEstimatedDebtFreeDate.has_value());
    for (const auto& debt : result.debts) {
        EXPECT_FALSE(debt.estimatedPayoffDate.has_value());
    }
}

TEST_F(DebtPayoffCalculatorTest, Insufficient_WhenAllocationIsZero) {
    std::vector<DebtInput> debts = {makeDebt("A", 100.0, 0.0, 0.0, 100.0)};

    auto result = DebtPayoffCalculator::calculate(debts, DebtPayoffMode::SNOWBALL, 0.0, start_);

    EXPECT_TRUE(result.insufficientAllocation);
}

TEST_F(DebtPayoffCalculatorTest, Insufficient_ProgressFromCurrentBalances) {
    std::vector<DebtInput> debts = {
        makeDebt("A", 100.0, 30.0, 0.2, 400.0),
        makeDebt("B", 900.0, 30.0, 0.1, 500.0),
    };

    auto snowball = DebtPayoffCalculator::calculate(debts, DebtPayoffMode::SNOWBALL, 10.0, start_);
    EXPECT_DOUBLE_EQ(snowball.progressToNextDebt, 0.75);

    // Остаток больше стартового долга - прогресс не уходит в минус
    auto avalanche = DebtPayoffCalculator::calculate(debts, DebtPayoffMode::AVALANCHE, 10.0, start_);
    EXPECT_DOUBLE_EQ(avalanche.progressTotalPaid, 0.0);
    EXPECT_EQ(avalanche.nextDebtId, "A");
}

// ============================================================================
// EDGE CASES
// ============================================================================

TEST_F(DebtPayoffCalculatorTest, NeverPaidOff_WithinCap) {
    std::vector<DebtInput> debts = {makeDebt("A", 10000.0, 100.0, 0.24, 10000.0)};

    auto result = DebtPayoffCalculator::calculate(debts, DebtPayoffMode::SNOWBALL, 150.0, start_);

    EXPECT_FALSE(result.insufficientAllocation);
    EXPECT_EQ(result.monthsSimulated, DebtPayoffCalculator::MAX_MONTHS);
    EXPECT_FALSE(result.debts[0].estimatedPayoffDate.has_value());
    EXPECT_FALSE(result.overallEstimatedDebtFreeDate.has_value());
}

TEST_F(DebtPayoffCalculatorTest, ZeroBalanceDebtsAreIgnored) {
    debts_.push_back(makeDebt("C", 0.0, 15.0, 0.1, 200.0));

    auto result = DebtPayoffCalculator::calculate(debts_, DebtPayoffMode::SNOWBALL, 65.0, start_);

    EXPECT_EQ(result.debts.size(), 2u);
    EXPECT_EQ(result.findDebt("C"), nullptr);
    EXPECT_FALSE(result.insufficientAllocation);
}

TEST_F(DebtPayoffCalculatorTest, NoDebts_NothingToSimulate) {
    auto result = DebtPayoffCalculator::calculate({}, DebtPayoffMode::SNOWBALL, 100.0, start_);

    EXPECT_FALSE(result.insufficientAllocation);
    EXPECT_TRUE(result.debts.empty());
    EXPECT_EQ(result.monthsSimulated, 0);
    EXPECT_FALSE(result.nextDebtId.has_value());
}
