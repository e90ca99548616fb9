#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include "ports/output/ISnapshotRepository.hpp"
#include <memory>
#include <string>

namespace finance::adapters::secondary {

/**
 * @brief Репозиторий состояния журнала поверх хранилища "ключ -> blob"
 * 
 * Состояние профиля хранится одним JSON-документом под ключом
 * "finance-web:dashboard:<profileId>".
 * Повреждённые данные и ошибки записи логируются и не пробрасываются.
 */
class KeyValueSnapshotRepository : public ports::output::ISnapshotRepository {
public:
    explicit KeyValueSnapshotRepository(std::shared_ptr<ports::output::IKeyValueStore> store);

    std::optional<domain::LedgerSnapshot> load(const std::string& profileId) override;

    void save(const std::string& profileId, const domain::LedgerSnapshot& snapshot) override;

    static std::string storageKey(const std::string& profileId);

    static constexpr const char* KEY_PREFIX = "finance-web:dashboard:";

private:
    std::shared_ptr<ports::output::IKeyValueStore> store_;
};

} // namespace finance::adapters::secondary
