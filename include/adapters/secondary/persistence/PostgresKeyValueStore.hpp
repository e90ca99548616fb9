#pragma once

#include "ports/output/IKeyValueStore.hpp"
#include <pqxx/pqxx>
#include <mutex>
#include <memory>
#include <iostream>

namespace finance::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища "ключ -> blob"
 * 
 * Одна таблица (key TEXT PRIMARY KEY, value TEXT), создаётся при подключении.
 */
class PostgresKeyValueStore : public ports::output::IKeyValueStore {
public:
    /**
     * @brief Конструктор с connection string и именем таблицы
     */
    PostgresKeyValueStore(const std::string& connectionString, const std::string& table) {
        std::cout << "[PostgresKeyValueStore] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            table_ = connection_->quote_name(table);
            ensureTable();
            std::cout << "[PostgresKeyValueStore] Connected successfully, table " << table << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresKeyValueStore() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "SELECT value FROM " + table_ + " WHERE key = $1",
                key
            );

            txn.commit();

            if (result.empty()) {
                return std::nullopt;
            }

            return result[0]["value"].as<std::string>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] get() failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    void set(const std::string& key, const std::string& value) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            txn.exec_params(
                "INSERT INTO " + table_ + " (key, value) VALUES ($1, $2) "
                "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value",
                key,
                value
            );

            txn.commit();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] set() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                "DELETE FROM " + table_ + " WHERE key = $1",
                key
            );

            txn.commit();

            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresKeyValueStore] remove() failed: " << e.what() << std::endl;
            return false;
        }
    }

private:
    void ensureTable() {
        pqxx::work txn(*connection_);
        txn.exec(
            "CREATE TABLE IF NOT EXISTS " + table_ + " ("
            "key TEXT PRIMARY KEY, "
            "value TEXT NOT NULL)"
        );
        txn.commit();
    }

    std::string table_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;
};

} // namespace finance::adapters::secondary
