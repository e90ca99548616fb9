#pragma once

#include "enums/MutationStatus.hpp"
#include "Money.hpp"
#include "Transaction.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace finance::domain {

/**
 * @brief Запрос подтверждения переплаты долгового счёта
 * 
 * Содержит всё, что нужно вызывающему, чтобы показать предупреждение
 * и повторить ту же операцию с skipGuard = true.
 */
struct PendingConfirmation {
    std::string accountId;      ///< Долговой счёт, который уйдёт в плюс
    Money delta;                ///< Изменение баланса, которое будет применено
    Money resultingBalance;     ///< Баланс после применения
};

/**
 * @brief Результат операции над журналом
 */
struct MutationResult {
    MutationStatus status = MutationStatus::REJECTED;
    std::vector<Transaction> transactions;      ///< Созданные или изменённые транзакции
    std::optional<PendingConfirmation> pending;
    std::string message;                        ///< Причина отказа

    bool isApplied() const { return status == MutationStatus::APPLIED; }
    bool needsConfirmation() const { return status == MutationStatus::PENDING_CONFIRMATION; }
    bool isRejected() const { return status == MutationStatus::REJECTED; }

    static MutationResult applied(std::vector<Transaction> transactions = {}) {
        MutationResult result;
        result.status = MutationStatus::APPLIED;
        result.transactions = std::move(transactions);
        return result;
    }

    static MutationResult pendingConfirmation(const PendingConfirmation& pending) {
        MutationResult result;
        result.status = MutationStatus::PENDING_CONFIRMATION;
        result.pending = pending;
        return result;
    }

    static MutationResult rejected(const std::string& message) {
        MutationResult result;
        result.status = MutationStatus::REJECTED;
        result.message = message;
        return result;
    }
};

} // namespace finance::domain
