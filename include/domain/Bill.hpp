#pragma once

#include "enums/BillFrequency.hpp"
#include "Date.hpp"
#include "Money.hpp"
#include <cstdint>
#include <string>

namespace finance::domain {

/**
 * @brief Состояние срока оплаты
 */
enum class DueState {
    NO_DUE_DATE,    ///< Дата не задана или некорректна
    OVERDUE,        ///< Просрочен
    DUE_TODAY,
    DUE_TOMORROW,
    DUE_SOON,       ///< В ближайшие 7 дней
    UPCOMING
};

struct DueStatus {
    DueState state = DueState::NO_DUE_DATE;
    int64_t days = 0;   ///< Дней до срока (для OVERDUE - дней просрочки)
};

/**
 * @brief Счёт к оплате (регулярный или разовый платёж)
 * 
 * Оплата создаёт отрицательную транзакцию на счёте accountId.
 * Регулярный счёт после оплаты переносится на следующий период.
 */
struct Bill {
    std::string id;
    std::string name;
    Money amount;                               ///< Положительная величина платежа
    std::string dueDate;                        ///< "YYYY-MM-DD"
    std::string accountId;                      ///< Счёт, с которого обычно платится
    BillFrequency frequency = BillFrequency::ONCE;
    bool isPaid = false;

    /**
     * @brief Следующий срок оплаты после текущего
     * 
     * Отсчёт идёт от dueDate, а если она пустая или некорректная - от today.
     */
    std::string nextDueDate(const Date& today) const {
        Date base = Date::fromString(dueDate).value_or(today);
        switch (frequency) {
            case BillFrequency::WEEKLY:   return base.addDays(7).toString();
            case BillFrequency::BIWEEKLY: return base.addDays(14).toString();
            case BillFrequency::MONTHLY:
            case BillFrequency::ONCE:
            default:                      return base.addMonths(1).toString();
        }
    }

    /**
     * @brief Классифицировать срок относительно сегодняшней даты
     */
    DueStatus dueStatus(const Date& today) const {
        auto due = Date::fromString(dueDate);
        if (!due) {
            return {DueState::NO_DUE_DATE, 0};
        }

        int64_t diff = due->daysSince(today);
        if (diff < 0)  return {DueState::OVERDUE, -diff};
        if (diff == 0) return {DueState::DUE_TODAY, 0};
        if (diff == 1) return {DueState::DUE_TOMORROW, 1};
        if (diff <= 7) return {DueState::DUE_SOON, diff};
        return {DueState::UPCOMING, diff};
    }
};

/**
 * @brief Запрос на создание счёта к оплате
 */
struct BillRequest {
    std::string name;
    Money amount;
    std::string dueDate;
    std::string accountId;
    BillFrequency frequency = BillFrequency::ONCE;
};

} // namespace finance::domain
