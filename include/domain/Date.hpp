#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace finance::domain {

/**
 * @brief Календарная дата без времени (YYYY-MM-DD)
 * 
 * Используется для дат транзакций, сроков счетов к оплате,
 * снимков капитала и прогноза погашения долгов.
 */
struct Date {
    int year = 1970;
    int month = 1;      ///< 1..12
    int day = 1;        ///< 1..31

    Date() = default;

    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Разобрать строку формата "2025-12-16"
     * @return Date или nullopt, если строка не является корректной датой
     */
    static std::optional<Date> fromString(const std::string& iso);

    /**
     * @brief Преобразовать в строку "YYYY-MM-DD"
     */
    std::string toString() const;

    /**
     * @brief Номер дня относительно 1970-01-01
     */
    int64_t toDayNumber() const;

    static Date fromDayNumber(int64_t days);

    Date addDays(int64_t days) const;

    /**
     * @brief Сдвинуть на N месяцев
     * 
     * День месяца сохраняется; если в целевом месяце его нет,
     * излишек переносится на следующий месяц (31 января + 1 месяц = 3 марта).
     */
    Date addMonths(int months) const;

    /**
     * @brief Первое число того же месяца
     */
    Date firstOfMonth() const { return Date(year, month, 1); }

    /**
     * @brief Разница в днях (this - other)
     */
    int64_t daysSince(const Date& other) const {
        return toDayNumber() - other.toDayNumber();
    }

    static bool isLeapYear(int y);
    static int daysInMonth(int y, int m);

    bool operator==(const Date& other) const { return toDayNumber() == other.toDayNumber(); }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const { return toDayNumber() < other.toDayNumber(); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

} // namespace finance::domain
