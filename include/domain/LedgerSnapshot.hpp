#pragma once

#include "enums/NetWorthViewMode.hpp"
#include "Account.hpp"
#include "Bill.hpp"
#include "DebtPayoffSettings.hpp"
#include "NetWorthSnapshot.hpp"
#include "Transaction.hpp"
#include <optional>
#include <vector>

namespace finance::domain {

/**
 * @brief Полное состояние журнала одного профиля
 * 
 * Единица сохранения: хранилище сериализует его целиком, не разбирая содержимое.
 */
struct LedgerSnapshot {
    std::vector<Account> accounts;
    std::vector<Account> deletedAccounts;       ///< Удалённые, но восстановимые счета
    std::vector<Transaction> transactions;
    std::vector<Bill> bills;
    std::vector<NetWorthSnapshot> netWorthHistory;
    std::optional<NetWorthViewMode> netWorthViewMode;
    std::optional<bool> hideMoney;
    DebtPayoffSettings debtPayoffSettings;
};

} // namespace finance::domain
