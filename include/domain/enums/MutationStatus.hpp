#pragma once

#include <string>

namespace finance::domain {

/**
 * @brief Итог операции, изменяющей журнал
 */
enum class MutationStatus {
    APPLIED,                ///< Применена полностью (счёт и транзакции синхронно)
    PENDING_CONFIRMATION,   ///< Отложена: нужна явная повторная отправка с обходом проверки
    REJECTED                ///< Отклонена, состояние не изменилось
};

inline std::string toString(MutationStatus status) {
    switch (status) {
        case MutationStatus::APPLIED:              return "APPLIED";
        case MutationStatus::PENDING_CONFIRMATION: return "PENDING_CONFIRMATION";
        case MutationStatus::REJECTED:             return "REJECTED";
    }
    return "UNKNOWN";
}

} // namespace finance::domain
