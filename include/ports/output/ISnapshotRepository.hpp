#pragma once

#include "domain/LedgerSnapshot.hpp"
#include <optional>
#include <string>

namespace finance::ports::output {

/**
 * @brief Интерфейс репозитория состояния журнала
 * 
 * Output Port для загрузки и сохранения LedgerSnapshot по профилю.
 * Ошибки носителя не пробрасываются: они логируются, а журнал в памяти
 * остаётся источником истины до конца сессии.
 */
class ISnapshotRepository {
public:
    virtual ~ISnapshotRepository() = default;

    /**
     * @brief Загрузить состояние профиля
     * 
     * @param profileId Идентификатор профиля
     * @return LedgerSnapshot или nullopt, если данных нет или они повреждены
     */
    virtual std::optional<domain::LedgerSnapshot> load(const std::string& profileId) = 0;

    /**
     * @brief Сохранить состояние профиля целиком
     * 
     * @param profileId Идентификатор профиля
     * @param snapshot Состояние журнала
     */
    virtual void save(const std::string& profileId, const domain::LedgerSnapshot& snapshot) = 0;
};

} // namespace finance::ports::output
