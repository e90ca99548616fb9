#include "domain/NetWorthCalculator.hpp"

#include <algorithm>
#include <cmath>

namespace finance::domain {

NetWorthTotals NetWorthCalculator::calculate(const std::vector<Account>& accounts) {
    double totalAssets = 0.0;
    double totalDebts = 0.0;

    for (const auto& account : accounts) {
        double balance = account.balance.toDouble();
        if (account.isDebt() && balance < 0) {
            totalDebts += std::fabs(balance);
        } else {
            totalAssets += balance;
        }
    }

    NetWorthTotals totals;
    totals.netWorth = roundToCents(totalAssets - totalDebts);
    totals.totalAssets = roundToCents(totalAssets);
    totals.totalDebts = roundToCents(totalDebts);
    return totals;
}

double NetWorthCalculator::roundToCents(double value) {
    return std::floor(value * 100.0 + 0.5) / 100.0;
}

NetWorthSnapshot NetWorthCalculator::snapshot(const std::vector<Account>& accounts, const Date& date) {
    auto totals = calculate(accounts);

    NetWorthSnapshot result;
    result.date = date.toString();
    result.value = totals.netWorth;
    result.totalAssets = totals.totalAssets;
    result.totalDebts = totals.totalDebts;
    return result;
}

void NetWorthCalculator::upsert(
    std::vector<NetWorthSnapshot>& history,
    const NetWorthSnapshot& snapshot,
    std::size_t maxPoints
) {
    auto it = std::find_if(history.begin(), history.end(),
        [&snapshot](const NetWorthSnapshot& entry) { return entry.date == snapshot.date; });

    if (it != history.end()) {
        *it = snapshot;
    } else {
        history.push_back(snapshot);
    }

    if (maxPoints > 0 && history.size() > maxPoints) {
        history.erase(history.begin(), history.begin() + (history.size() - maxPoints));
    }
}

} // namespace finance::domain
