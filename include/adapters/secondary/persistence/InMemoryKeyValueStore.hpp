// include/adapters/secondary/persistence/InMemoryKeyValueStore.hpp
#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include <map>
#include <mutex>

namespace finance::adapters::secondary {

/**
 * @brief In-memory реализация хранилища "ключ -> blob"
 * 
 * Данные живут до конца процесса. Используется по умолчанию и в тестах.
 */
class InMemoryKeyValueStore : public ports::output::IKeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = values_.find(key);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.erase(key) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.size();
    }

private:
    std::map<std::string, std::string> values_;
    mutable std::mutex mutex_;
};

} // namespace finance::adapters::secondary
