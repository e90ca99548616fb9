#pragma once

#include <string>
#include <stdexcept>

namespace finance::domain {

/**
 * @brief Стратегия погашения долгов
 */
enum class DebtPayoffMode {
    SNOWBALL,   ///< Сначала самый маленький долг
    AVALANCHE   ///< Сначала долг с самой высокой ставкой
};

inline std::string toString(DebtPayoffMode mode) {
    switch (mode) {
        case DebtPayoffMode::SNOWBALL:  return "snowball";
        case DebtPayoffMode::AVALANCHE: return "avalanche";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline DebtPayoffMode debtPayoffModeFromString(const std::string& str) {
    if (str == "snowball")  return DebtPayoffMode::SNOWBALL;
    if (str == "avalanche") return DebtPayoffMode::AVALANCHE;
    throw std::invalid_argument("Unknown DebtPayoffMode: " + str);
}

} // namespace finance::domain
