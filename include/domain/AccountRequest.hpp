#pragma once

#include "enums/AccountCategory.hpp"
#include "Money.hpp"
#include <optional>
#include <string>

namespace finance::domain {

/**
 * @brief Запрос на создание счёта
 */
struct AccountRequest {
    std::string name;
    Money balance;                              ///< Начальный баланс
    AccountCategory category = AccountCategory::ASSET;
    std::optional<Money> creditLimit;
    std::optional<double> annualPercentageRate;
    std::optional<Money> minimumPayment;        ///< По умолчанию 3% от долга
    std::optional<Money> startingBalance;       ///< По умолчанию |balance|
};

/**
 * @brief Частичное обновление счёта
 * 
 * Незаданные поля остаются без изменений.
 */
struct AccountUpdate {
    std::optional<std::string> name;
    std::optional<AccountCategory> category;
    std::optional<Money> balance;               ///< Изменение порождает корректирующую транзакцию
    std::optional<Money> creditLimit;
    std::optional<double> annualPercentageRate;
    std::optional<Money> minimumPayment;
    std::optional<Money> startingBalance;
};

} // namespace finance::domain
