#pragma once

#include <string>
#include <stdexcept>

namespace finance::domain {

/**
 * @brief Категория счёта
 */
enum class AccountCategory {
    ASSET,  ///< Актив (наличные, расчётный, сберегательный счёт)
    DEBT    ///< Долг (кредитная карта, заём); баланс хранится как неположительное число
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(AccountCategory category) {
    switch (category) {
        case AccountCategory::ASSET: return "asset";
        case AccountCategory::DEBT:  return "debt";
    }
    return "unknown";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline AccountCategory accountCategoryFromString(const std::string& str) {
    if (str == "asset") return AccountCategory::ASSET;
    if (str == "debt")  return AccountCategory::DEBT;
    throw std::invalid_argument("Unknown AccountCategory: " + str);
}

/**
 * @brief Получить человекочитаемое название
 */
inline std::string getDisplayName(AccountCategory category) {
    switch (category) {
        case AccountCategory::ASSET: return "Asset";
        case AccountCategory::DEBT:  return "Debt";
    }
    return "Unknown";
}

} // namespace finance::domain
