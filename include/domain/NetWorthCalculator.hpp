#pragma once

#include "Account.hpp"
#include "Date.hpp"
#include "NetWorthSnapshot.hpp"
#include <cstddef>
#include <vector>

namespace finance::domain {

/**
 * @brief Итоги по капиталу
 */
struct NetWorthTotals {
    double netWorth = 0.0;
    double totalAssets = 0.0;
    double totalDebts = 0.0;
};

/**
 * @brief Расчёт капитала по списку счетов
 * 
 * Чистые функции без состояния.
 */
class NetWorthCalculator {
public:
    /// Длина хранимой истории по умолчанию (полгода ежедневных снимков)
    static constexpr std::size_t DEFAULT_MAX_POINTS = 180;

    /**
     * @brief Посчитать активы, долги и капитал
     * 
     * Балансы не-долговых счетов и положительные балансы долговых счетов
     * идут в активы; модуль отрицательных балансов долговых счетов - в долги.
     * Все три значения округлены до центов (половина - вверх).
     */
    static NetWorthTotals calculate(const std::vector<Account>& accounts);

    /**
     * @brief Округление до центов, 0.005 -> 0.01
     */
    static double roundToCents(double value);

    /**
     * @brief Снимок капитала на дату
     */
    static NetWorthSnapshot snapshot(const std::vector<Account>& accounts, const Date& date);

    /**
     * @brief Добавить снимок в историю или заменить снимок того же дня
     * 
     * При превышении maxPoints удаляются самые старые записи.
     */
    static void upsert(
        std::vector<NetWorthSnapshot>& history,
        const NetWorthSnapshot& snapshot,
        std::size_t maxPoints = DEFAULT_MAX_POINTS
    );
};

} // namespace finance::domain
