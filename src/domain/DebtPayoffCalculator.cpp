#include "domain/DebtPayoff.hpp"

#include <algorithm>
#include <utility>

namespace finance::domain {

namespace {

double clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

double progressOf(double balance, double startingBalance) {
    return clamp01(startingBalance > 0 ? 1.0 - balance / startingBalance : 0.0);
}

struct WorkingDebt {
    double balance = 0.0;
    double minimumPayment = 0.0;
    double apr = 0.0;
    double interest = 0.0;
    std::optional<Date> payoffDate;
};

void stampIfPaidOff(WorkingDebt& debt, const Date& monthDate) {
    if (debt.balance <= DebtPayoffCalculator::PAID_OFF_EPSILON && !debt.payoffDate) {
        debt.balance = 0.0;
        debt.payoffDate = monthDate;
    }
}

// Итоговые показатели считаются по текущим (не симулированным) остаткам
void fillProgress(DebtPayoffResult& result, DebtPayoffMode mode) {
    double totalStarting = 0.0;
    double totalRemaining = 0.0;
    for (const auto& debt : result.debts) {
        totalStarting += debt.startingBalance;
        totalRemaining += debt.balance;
    }

    const DebtProjection* target = nullptr;
    for (const auto& debt : result.debts) {
        if (debt.balance > 0) {
            target = &debt;
            break;
        }
    }

    result.progressToNextDebt = (mode == DebtPayoffMode::SNOWBALL && target)
        ? progressOf(target->balance, target->startingBalance)
        : 0.0;

    result.progressTotalPaid = mode == DebtPayoffMode::AVALANCHE
        ? progressOf(totalRemaining, totalStarting)
        : 0.0;

    if (result.insufficientAllocation) {
        if (target) {
            result.nextDebtId = target->id;
        }
        return;
    }

    if (mode == DebtPayoffMode::SNOWBALL && target) {
        result.nextDebtId = target->id;
        result.nextDebtEstimatedPayoffDate = target->estimatedPayoffDate;
    }
}

} // namespace

std::vector<DebtInput> DebtPayoffCalculator::prioritize(std::vector<DebtInput> debts, DebtPayoffMode mode) {
    std::stable_sort(debts.begin(), debts.end(), [mode](const DebtInput& a, const DebtInput& b) {
        if (mode == DebtPayoffMode::SNOWBALL) {
            return a.balance < b.balance;
        }
        return a.apr > b.apr;
    });
    return debts;
}

DebtPayoffResult DebtPayoffCalculator::calculate(
    const std::vector<DebtInput>& debts,
    DebtPayoffMode mode,
    double monthlyAllocation,
    const Date& startMonth
) {
    std::vector<DebtInput> normalized;
    for (const auto& debt : debts) {
        if (debt.balance <= 0) {
            continue;
        }
        DebtInput copy = debt;
        copy.minimumPayment = std::max(0.0, debt.minimumPayment);
        copy.apr = std::max(0.0, debt.apr);
        copy.startingBalance = std::max(0.0, debt.startingBalance);
        normalized.push_back(copy);
    }

    auto ordered = prioritize(std::move(normalized), mode);

    DebtPayoffResult result;
    double totalMinimums = 0.0;
    for (const auto& debt : ordered) {
        DebtProjection projection;
        projection.id = debt.id;
        projection.name = debt.name;
        projection.balance = debt.balance;
        projection.minimumPayment = debt.minimumPayment;
        projection.apr = debt.apr;
        projection.startingBalance = debt.startingBalance;
        result.debts.push_back(projection);
        totalMinimums += debt.minimumPayment;
    }

    if (monthlyAllocation < totalMinimums || monthlyAllocation <= 0) {
        result.insufficientAllocation = true;
        fillProgress(result, mode);
        return result;
    }

    std::vector<WorkingDebt> working;
    for (const auto& debt : ordered) {
        WorkingDebt w;
        w.balance = debt.balance;
        w.minimumPayment = debt.minimumPayment;
        w.apr = debt.apr;
        working.push_back(w);
    }

    auto hasRemaining = [&working]() {
        return std::any_of(working.begin(), working.end(),
            [](const WorkingDebt& d) { return d.balance > PAID_OFF_EPSILON; });
    };

    const Date start = startMonth.firstOfMonth();
    int month = 0;
    while (hasRemaining() && month < MAX_MONTHS) {
        ++month;
        const Date monthDate = start.addMonths(month);

        // 1. Проценты
        for (auto& debt : working) {
            if (debt.balance <= 0) continue;
            double interest = debt.balance * (debt.apr / 12.0);
            debt.balance += interest;
            debt.interest += interest;
        }

        // 2. Минимальные платежи
        double remainingBudget = monthlyAllocation;
        for (auto& debt : working) {
            if (debt.balance <= 0) continue;
            double payment = std::min(debt.balance, debt.minimumPayment);
            debt.balance -= payment;
            remainingBudget -= payment;
            stampIfPaidOff(debt, monthDate);
        }

        // 3. Остаток бюджета - первому непогашенному долгу
        if (remainingBudget > 0) {
            auto target = std::find_if(working.begin(), working.end(),
                [](const WorkingDebt& d) { return d.balance > PAID_OFF_EPSILON; });
            if (target != working.end()) {
                double extra = std::min(target->balance, remainingBudget);
                target->balance -= extra;
                remainingBudget -= extra;
                stampIfPaidOff(*target, monthDate);
            }
        }

        PayoffMonth snapshot;
        snapshot.month = month;
        snapshot.date = monthDate;
        for (const auto& debt : working) {
            snapshot.balances.push_back(debt.balance);
        }
        result.schedule.push_back(std::move(snapshot));
    }

    result.monthsSimulated = month;

    bool allPaid = true;
    std::optional<Date> latest;
    for (size_t i = 0; i < working.size(); ++i) {
        result.debts[i].estimatedPayoffDate = working[i].payoffDate;
        result.debts[i].interestAccrued = working[i].interest;
        if (!working[i].payoffDate) {
            allPaid = false;
        } else if (!latest || *latest < *working[i].payoffDate) {
            latest = working[i].payoffDate;
        }
    }

    if (allPaid) {
        result.overallEstimatedDebtFreeDate = latest;
    }

    fillProgress(result, mode);
    return result;
}

} // namespace finance::domain
