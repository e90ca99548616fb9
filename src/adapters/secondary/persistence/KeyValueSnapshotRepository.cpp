#include "adapters/secondary/persistence/KeyValueSnapshotRepository.hpp"
#include "adapters/secondary/persistence/LedgerSnapshotJson.hpp"

#include <iostream>
#include <utility>

namespace finance::adapters::secondary {

KeyValueSnapshotRepository::KeyValueSnapshotRepository(
    std::shared_ptr<ports::output::IKeyValueStore> store
) : store_(std::move(store)) {}

std::string KeyValueSnapshotRepository::storageKey(const std::string& profileId) {
    return std::string(KEY_PREFIX) + profileId;
}

std::optional<domain::LedgerSnapshot> KeyValueSnapshotRepository::load(const std::string& profileId) {
    const std::string key = storageKey(profileId);

    try {
        auto raw = store_->get(key);
        if (!raw) {
            return std::nullopt;
        }

        auto j = nlohmann::json::parse(*raw);
        if (!j.is_object()) {
            std::cerr << "[KeyValueSnapshotRepository] Ignoring non-object data under " << key << std::endl;
            return std::nullopt;
        }

        return LedgerSnapshotJson::fromJson(j);

    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[KeyValueSnapshotRepository] Corrupt data under " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::exception& e) {
        std::cerr << "[KeyValueSnapshotRepository] load() failed for " << key << ": " << e.what() << std::endl;
        return std::nullopt;
    }
}

void KeyValueSnapshotRepository::save(const std::string& profileId, const domain::LedgerSnapshot& snapshot) {
    const std::string key = storageKey(profileId);

    try {
        store_->set(key, LedgerSnapshotJson::toJson(snapshot).dump());
    } catch (const std::exception& e) {
        std::cerr << "[KeyValueSnapshotRepository] save() failed for " << key << ": " << e.what() << std::endl;
    }
}

} // namespace finance::adapters::secondary
