#pragma once

#include <string>
#include <stdexcept>

namespace finance::domain {

/**
 * @brief Вид транзакции
 */
enum class TransactionKind {
    PLAIN,          ///< Обычный приход/расход
    TRANSFER_LEG    ///< Одна из двух половин перевода между счетами
};

inline std::string toString(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::PLAIN:        return "plain";
        case TransactionKind::TRANSFER_LEG: return "transfer";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionKind transactionKindFromString(const std::string& str) {
    if (str == "plain")    return TransactionKind::PLAIN;
    if (str == "transfer") return TransactionKind::TRANSFER_LEG;
    throw std::invalid_argument("Unknown TransactionKind: " + str);
}

} // namespace finance::domain
