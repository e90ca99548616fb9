#pragma once

#include "enums/DebtPayoffMode.hpp"
#include "Money.hpp"

namespace finance::domain {

/**
 * @brief Настройки планировщика погашения долгов
 */
struct DebtPayoffSettings {
    DebtPayoffMode mode = DebtPayoffMode::SNOWBALL;
    Money monthlyAllocation;        ///< Ежемесячный бюджет на долги (неотрицательный)
    bool showInterest = false;      ///< Только для отображения
};

} // namespace finance::domain
