#pragma once

#include "domain/Date.hpp"

namespace finance::ports::output {

/**
 * @brief Источник текущей даты
 * 
 * Нужен для дат корректирующих транзакций, оплаты счетов,
 * снимков капитала и начала прогноза погашения.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Date today() const = 0;
};

} // namespace finance::ports::output
