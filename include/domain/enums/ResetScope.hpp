#pragma once

#include <string>
#include <stdexcept>

namespace finance::domain {

/**
 * @brief Что именно сбрасывает операция reset
 */
enum class ResetScope {
    TRANSACTIONS,               ///< Только обычные транзакции (с откатом балансов)
    TRANSFERS,                  ///< Только переводы (с откатом балансов)
    TRANSACTIONS_AND_TRANSFERS, ///< Все транзакции (с откатом балансов)
    EVERYTHING                  ///< Счета, транзакции, счета к оплате и история
};

inline std::string toString(ResetScope scope) {
    switch (scope) {
        case ResetScope::TRANSACTIONS:               return "transactions";
        case ResetScope::TRANSFERS:                  return "transfers";
        case ResetScope::TRANSACTIONS_AND_TRANSFERS: return "transactions-and-transfers";
        case ResetScope::EVERYTHING:                 return "all";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ResetScope resetScopeFromString(const std::string& str) {
    if (str == "transactions")               return ResetScope::TRANSACTIONS;
    if (str == "transfers")                  return ResetScope::TRANSFERS;
    if (str == "transactions-and-transfers") return ResetScope::TRANSACTIONS_AND_TRANSFERS;
    if (str == "all")                        return ResetScope::EVERYTHING;
    throw std::invalid_argument("Unknown ResetScope: " + str);
}

} // namespace finance::domain
