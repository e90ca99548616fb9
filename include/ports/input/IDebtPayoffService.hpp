#pragma once

#include "domain/DebtPayoff.hpp"
#include "domain/DebtPayoffSettings.hpp"

namespace finance::ports::input {

/**
 * @brief Интерфейс планировщика погашения долгов
 * 
 * Input Port для прогноза по текущим долговым счетам.
 * Прогноз пересчитывается по запросу и не изменяет журнал.
 */
class IDebtPayoffService {
public:
    virtual ~IDebtPayoffService() = default;

    /**
     * @brief Прогноз с сохранёнными настройками профиля
     */
    virtual domain::DebtPayoffResult project() = 0;

    /**
     * @brief Прогноз с произвольными настройками ("что если")
     */
    virtual domain::DebtPayoffResult project(const domain::DebtPayoffSettings& settings) = 0;

    /**
     * @brief Сумма минимальных платежей по всем долгам
     */
    virtual double totalMinimumPayments() = 0;
};

} // namespace finance::ports::input
