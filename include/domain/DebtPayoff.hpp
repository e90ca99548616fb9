#pragma once

#include "enums/DebtPayoffMode.hpp"
#include "Date.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finance::domain {

/**
 * @brief Долг на входе планировщика
 * 
 * balance - положительная величина долга (модуль баланса счёта).
 */
struct DebtInput {
    std::string id;
    std::string name;
    double balance = 0.0;
    double minimumPayment = 0.0;
    double apr = 0.0;               ///< Годовая ставка (0.24 = 24%)
    double startingBalance = 0.0;
};

/**
 * @brief Прогноз по одному долгу
 */
struct DebtProjection {
    std::string id;
    std::string name;
    double balance = 0.0;                       ///< Текущий долг (не симулированный)
    double minimumPayment = 0.0;
    double apr = 0.0;
    double startingBalance = 0.0;
    std::optional<Date> estimatedPayoffDate;    ///< nullopt, если не погашен за 600 месяцев
    double interestAccrued = 0.0;               ///< Сумма начисленных процентов за прогноз
};

/**
 * @brief Состояние долгов на конец месяца прогноза
 */
struct PayoffMonth {
    int month = 0;                  ///< 1, 2, ...
    Date date;                      ///< Первое число месяца
    std::vector<double> balances;   ///< Остатки в порядке приоритета
};

/**
 * @brief Результат прогноза погашения
 */
struct DebtPayoffResult {
    std::vector<DebtProjection> debts;              ///< В порядке приоритета стратегии
    std::optional<std::string> nextDebtId;
    std::optional<Date> nextDebtEstimatedPayoffDate;
    std::optional<Date> overallEstimatedDebtFreeDate;
    double progressToNextDebt = 0.0;                ///< [0, 1], только snowball
    double progressTotalPaid = 0.0;                 ///< [0, 1], только avalanche
    bool insufficientAllocation = false;
    int monthsSimulated = 0;
    std::vector<PayoffMonth> schedule;

    const DebtProjection* findDebt(const std::string& id) const {
        for (const auto& debt : debts) {
            if (debt.id == id) {
                return &debt;
            }
        }
        return nullptr;
    }
};

/**
 * @brief Симулятор погашения долгов по месяцам
 * 
 * Каждый месяц: начисление процентов, минимальные платежи по всем долгам
 * в порядке приоритета, остаток бюджета - первому непогашенному долгу.
 * Не изменяет журнал, результат полностью определяется входными данными.
 */
class DebtPayoffCalculator {
public:
    /// Ограничение симуляции: 50 лет
    static constexpr int MAX_MONTHS = 600;

    /// Порог "долг погашен", гасит погрешность многократного начисления процентов
    static constexpr double PAID_OFF_EPSILON = 0.01;

    /**
     * @brief Построить прогноз
     * 
     * @param debts Долги (с нулевым балансом отбрасываются)
     * @param mode Стратегия: snowball - по возрастанию долга, avalanche - по убыванию ставки
     * @param monthlyAllocation Ежемесячный бюджет
     * @param startMonth Месяц отсчёта; первый месяц прогноза = startMonth + 1
     * 
     * @note Если бюджет меньше суммы минимальных платежей или не положителен,
     *       симуляция не запускается и возвращается insufficientAllocation = true.
     */
    static DebtPayoffResult calculate(
        const std::vector<DebtInput>& debts,
        DebtPayoffMode mode,
        double monthlyAllocation,
        const Date& startMonth
    );

    /**
     * @brief Упорядочить долги по стратегии
     */
    static std::vector<DebtInput> prioritize(std::vector<DebtInput> debts, DebtPayoffMode mode);
};

} // namespace finance::domain
