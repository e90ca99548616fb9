#pragma once

#include <string>
#include <stdexcept>

namespace finance::domain {

/**
 * @brief Периодичность счёта к оплате
 */
enum class BillFrequency {
    ONCE,       ///< Разовый
    WEEKLY,     ///< Раз в неделю
    BIWEEKLY,   ///< Раз в две недели
    MONTHLY     ///< Раз в месяц
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(BillFrequency frequency) {
    switch (frequency) {
        case BillFrequency::ONCE:     return "once";
        case BillFrequency::WEEKLY:   return "weekly";
        case BillFrequency::BIWEEKLY: return "biweekly";
        case BillFrequency::MONTHLY:  return "monthly";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline BillFrequency billFrequencyFromString(const std::string& str) {
    if (str == "once")     return BillFrequency::ONCE;
    if (str == "weekly")   return BillFrequency::WEEKLY;
    if (str == "biweekly") return BillFrequency::BIWEEKLY;
    if (str == "monthly")  return BillFrequency::MONTHLY;
    throw std::invalid_argument("Unknown BillFrequency: " + str);
}

/**
 * @brief Повторяется ли счёт после оплаты
 */
inline bool isRecurring(BillFrequency frequency) {
    return frequency != BillFrequency::ONCE;
}

} // namespace finance::domain
