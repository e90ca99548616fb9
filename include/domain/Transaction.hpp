#pragma once

#include "enums/TransactionKind.hpp"
#include "Money.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace finance::domain {

/**
 * @brief Транзакция по счёту
 * 
 * Положительная сумма - приход, отрицательная - расход.
 * Перевод между счетами - это две транзакции с общим transferGroupId:
 * отрицательная на счёте-источнике и положительная на счёте-получателе.
 */
struct Transaction {
    std::string id;                             ///< Уникальный идентификатор
    std::string accountId;                      ///< Счёт-владелец
    Money amount;                               ///< Сумма со знаком
    std::string date;                           ///< "YYYY-MM-DD"
    std::string description;
    TransactionKind kind = TransactionKind::PLAIN;
    std::optional<std::string> transferGroupId; ///< Связь двух половин перевода

    Transaction() = default;

    Transaction(
        const std::string& id,
        const std::string& accountId,
        const Money& amount,
        const std::string& date,
        const std::string& description,
        TransactionKind kind = TransactionKind::PLAIN
    ) : id(id), accountId(accountId), amount(amount), date(date),
        description(description), kind(kind) {}

    /**
     * @brief Является ли транзакция половиной перевода
     * 
     * Для старых данных без разметки признаком служит слово "transfer" в описании.
     */
    bool isTransferLeg() const {
        if (kind == TransactionKind::TRANSFER_LEG || transferGroupId.has_value()) {
            return true;
        }
        std::string lowered = description;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered.find("transfer") != std::string::npos;
    }
};

/**
 * @brief Запрос на создание транзакции
 */
struct TransactionRequest {
    std::string accountId;
    Money amount;
    std::string date;           ///< Пустая строка - сегодня
    std::string description;
};

/**
 * @brief Частичное обновление транзакции
 */
struct TransactionUpdate {
    std::optional<Money> amount;
    std::optional<std::string> date;
    std::optional<std::string> description;
};

/**
 * @brief Запрос на перевод между счетами
 */
struct TransferRequest {
    std::string fromAccountId;
    std::string toAccountId;
    Money amount;               ///< Строго положительная сумма
    std::string date;           ///< Пустая строка - сегодня
    std::string note;           ///< Необязательное описание обеих половин
};

} // namespace finance::domain
