#pragma once

#include <string>

namespace finance::domain {

/**
 * @brief Снимок капитала за один календарный день
 */
struct NetWorthSnapshot {
    std::string date;           ///< "YYYY-MM-DD", не более одного снимка на день
    double value = 0.0;         ///< Капитал = активы - долги
    double totalAssets = 0.0;
    double totalDebts = 0.0;
};

} // namespace finance::domain
