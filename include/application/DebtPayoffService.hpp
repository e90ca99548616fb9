#pragma once

#include "ports/input/IDebtPayoffService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "domain/DebtPayoff.hpp"
#include <iostream>
#include <memory>
#include <utility>

namespace finance::application {

/**
 * @brief Сервис прогноза погашения долгов
 * 
 * Реализует IDebtPayoffService.
 * Берёт текущие долговые счета из журнала и передаёт их в DebtPayoffCalculator.
 * Первый месяц прогноза - следующий за текущим.
 */
class DebtPayoffService : public ports::input::IDebtPayoffService {
public:
    DebtPayoffService(
        std::shared_ptr<ports::input::ILedgerService> ledger,
        std::shared_ptr<ports::output::IClock> clock
    ) : ledger_(std::move(ledger))
      , clock_(std::move(clock))
    {
        std::cout << "[DebtPayoffService] Created" << std::endl;
    }

    domain::DebtPayoffResult project() override {
        return project(ledger_->getDebtPayoffSettings());
    }

    domain::DebtPayoffResult project(const domain::DebtPayoffSettings& settings) override {
        auto debts = ledger_->getDebtInputs();

        auto result = domain::DebtPayoffCalculator::calculate(
            debts,
            settings.mode,
            settings.monthlyAllocation.toDouble(),
            clock_->today().firstOfMonth()
        );

        if (result.insufficientAllocation && !debts.empty()) {
            std::cout << "[DebtPayoffService] Allocation " << settings.monthlyAllocation.toDouble()
                      << " does not cover minimum payments " << totalMinimumPayments() << std::endl;
        }

        return result;
    }

    double totalMinimumPayments() override {
        double total = 0.0;
        for (const auto& debt : ledger_->getDebtInputs()) {
            total += debt.minimumPayment;
        }
        return total;
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace finance::application
