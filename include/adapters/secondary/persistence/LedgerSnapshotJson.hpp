#pragma once

#include "domain/LedgerSnapshot.hpp"
#include <nlohmann/json.hpp>

namespace finance::adapters::secondary {

/**
 * @brief JSON-представление состояния журнала
 * 
 * Ключи в camelCase, суммы - числа с двумя знаками после запятой.
 * Разбор нестрогий: отсутствующие или некорректные массивы становятся пустыми,
 * элементы, не являющиеся объектами, пропускаются, неизвестные значения
 * перечислений заменяются значениями по умолчанию.
 */
class LedgerSnapshotJson {
public:
    static nlohmann::json toJson(const domain::LedgerSnapshot& snapshot);

    /**
     * @throws std::invalid_argument если корень не является объектом
     */
    static domain::LedgerSnapshot fromJson(const nlohmann::json& j);
};

} // namespace finance::adapters::secondary
