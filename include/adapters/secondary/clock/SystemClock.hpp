#pragma once

#include "ports/output/IClock.hpp"
#include <ctime>

namespace finance::adapters::secondary {

/**
 * @brief Текущая дата по системным часам (UTC)
 */
class SystemClock : public ports::output::IClock {
public:
    domain::Date today() const override {
        std::time_t now = std::time(nullptr);
        std::tm utc{};
        gmtime_r(&now, &utc);
        return domain::Date(utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday);
    }
};

} // namespace finance::adapters::secondary
