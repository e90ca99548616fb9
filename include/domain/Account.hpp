#pragma once

#include "enums/AccountCategory.hpp"
#include "Money.hpp"
#include <optional>
#include <string>

namespace finance::domain {

/**
 * @brief Счёт пользователя (актив или долг)
 * 
 * Баланс - материализованная сумма: начальный баланс плюс все транзакции счёта.
 * Для долгового счёта баланс неположительный, погашение двигает его к нулю.
 */
struct Account {
    std::string id;                             ///< Уникальный идентификатор
    std::string name;                           ///< Название ("Checking", "Visa")
    Money balance;                              ///< Текущий баланс
    AccountCategory category = AccountCategory::ASSET;

    // Только для долговых счетов
    std::optional<Money> creditLimit;           ///< Кредитный лимит
    std::optional<double> annualPercentageRate; ///< Годовая ставка (0.1999 = 19.99%)
    std::optional<Money> minimumPayment;        ///< Минимальный ежемесячный платёж
    std::optional<Money> startingBalance;       ///< Размер долга на старте (для прогресса погашения)

    Account() = default;

    Account(
        const std::string& id,
        const std::string& name,
        const Money& balance,
        AccountCategory category = AccountCategory::ASSET
    ) : id(id), name(name), balance(balance), category(category) {}

    bool isDebt() const {
        return category == AccountCategory::DEBT;
    }
};

} // namespace finance::domain
