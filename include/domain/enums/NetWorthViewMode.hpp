#pragma once

#include <string>
#include <stdexcept>

namespace finance::domain {

/**
 * @brief Режим отображения карточки капитала
 */
enum class NetWorthViewMode {
    MINIMAL,
    DETAILED
};

inline std::string toString(NetWorthViewMode mode) {
    switch (mode) {
        case NetWorthViewMode::MINIMAL:  return "minimal";
        case NetWorthViewMode::DETAILED: return "detailed";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline NetWorthViewMode netWorthViewModeFromString(const std::string& str) {
    if (str == "minimal")  return NetWorthViewMode::MINIMAL;
    if (str == "detailed") return NetWorthViewMode::DETAILED;
    throw std::invalid_argument("Unknown NetWorthViewMode: " + str);
}

} // namespace finance::domain
