#pragma once

#include "domain/NetWorthCalculator.hpp"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace finance::settings {

/**
 * @brief Настройки журнала
 * 
 * Читает из ENV:
 * - LEDGER_STORAGE (default: memory) - memory | postgres
 * - LEDGER_PROFILE_ID (default: пусто) - профиль, загружаемый при старте
 * - LEDGER_NET_WORTH_MAX_POINTS (default: 180) - длина истории капитала
 */
class LedgerSettings {
public:
    LedgerSettings() {
        if (const char* val = std::getenv("LEDGER_STORAGE")) {
            storage_ = val;
        }
        if (const char* val = std::getenv("LEDGER_PROFILE_ID")) {
            if (*val != '\0') {
                profileId_ = std::string(val);
            }
        }
        if (const char* val = std::getenv("LEDGER_NET_WORTH_MAX_POINTS")) {
            netWorthMaxPoints_ = parseMaxPoints(val);
        }
    }

    std::string getStorage() const { return storage_; }
    std::optional<std::string> getProfileId() const { return profileId_; }
    size_t getNetWorthMaxPoints() const { return netWorthMaxPoints_; }

    bool usePostgres() const { return storage_ == "postgres"; }

    void setProfileId(const std::string& profileId) { profileId_ = profileId; }
    void setNetWorthMaxPoints(size_t points) {
        netWorthMaxPoints_ = points > 0 ? points : domain::NetWorthCalculator::DEFAULT_MAX_POINTS;
    }

private:
    /**
     * @brief История капитала всегда ограничена: 0, отрицательные и нечисловые значения игнорируются
     */
    static size_t parseMaxPoints(const char* value) {
        int points = 0;
        try {
            points = std::stoi(value);
        } catch (const std::exception& e) {
            std::cerr << "[LedgerSettings] LEDGER_NET_WORTH_MAX_POINTS is not a number: " << e.what() << std::endl;
        }
        if (points <= 0) {
            std::cerr << "[LedgerSettings] Ignoring LEDGER_NET_WORTH_MAX_POINTS='" << value
                      << "', using " << domain::NetWorthCalculator::DEFAULT_MAX_POINTS << std::endl;
            return domain::NetWorthCalculator::DEFAULT_MAX_POINTS;
        }
        return static_cast<size_t>(points);
    }

    std::string storage_ = "memory";
    std::optional<std::string> profileId_;
    size_t netWorthMaxPoints_ = domain::NetWorthCalculator::DEFAULT_MAX_POINTS;
};

} // namespace finance::settings
