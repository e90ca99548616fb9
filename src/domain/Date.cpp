#include "domain/Date.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace finance::domain {

namespace {

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Алгоритм days_from_civil (Howard Hinnant)
int64_t daysFromCivil(int64_t y, int64_t m, int64_t d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = floorDiv(y, 400);
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

bool parseNumber(const std::string& text, size_t pos, size_t len, int& out) {
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

bool Date::isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int Date::daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return kDays[m - 1];
}

std::optional<Date> Date::fromString(const std::string& iso) {
    if (iso.size() != 10 || iso[4] != '-' || iso[7] != '-') {
        return std::nullopt;
    }

    int y = 0;
    int m = 0;
    int d = 0;
    if (!parseNumber(iso, 0, 4, y) || !parseNumber(iso, 5, 2, m) || !parseNumber(iso, 8, 2, d)) {
        return std::nullopt;
    }

    if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) {
        return std::nullopt;
    }

    return Date(y, m, d);
}

std::string Date::toString() const {
    std::ostringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << year << "-"
       << std::setw(2) << month << "-"
       << std::setw(2) << day;
    return ss.str();
}

int64_t Date::toDayNumber() const {
    return daysFromCivil(year, month, day);
}

Date Date::fromDayNumber(int64_t days) {
    // Алгоритм civil_from_days (Howard Hinnant)
    days += 719468;
    const int64_t era = floorDiv(days, 146097);
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const int64_t d = doy - (153 * mp + 2) / 5 + 1;
    const int64_t m = mp + (mp < 10 ? 3 : -9);
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return Date(static_cast<int>(y), static_cast<int>(m), static_cast<int>(d));
}

Date Date::addDays(int64_t days) const {
    return fromDayNumber(toDayNumber() + days);
}

Date Date::addMonths(int months) const {
    const int64_t total = static_cast<int64_t>(year) * 12 + (month - 1) + months;
    const int64_t y = floorDiv(total, 12);
    const int64_t m = total - y * 12 + 1;
    // Переполнение дня уходит в следующий месяц
    return fromDayNumber(daysFromCivil(y, m, 1) + day - 1);
}

} // namespace finance::domain
