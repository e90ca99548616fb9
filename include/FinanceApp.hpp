#pragma once

#include <boost/di.hpp>
#include <memory>

// Forward declarations - Ports
namespace finance::ports::input {
    class ILedgerService;
    class IDebtPayoffService;
}

namespace finance::ports::output {
    class IClock;
}

namespace finance::settings {
    class LedgerSettings;
    class DbSettings;
}

/**
 * @class FinanceApp
 * @brief Главное приложение Finance Ledger
 * 
 * Template Method:
 * 1. loadEnvironment() - настройки из ENV и аргументов командной строки
 * 2. configureInjection() - настройка Boost.DI
 * 3. start() - загрузка профиля и вывод сводки
 * 
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: InMemory/Postgres KeyValueStore, KeyValueSnapshotRepository, SystemClock
 * - Application Services: LedgerService, DebtPayoffService
 */
class FinanceApp
{
public:
    FinanceApp();
    ~FinanceApp();

    /**
     * @brief Запустить приложение
     * @return Код завершения процесса
     */
    int run(int argc, char* argv[]);

protected:
    /**
     * @brief Загрузить настройки
     * 
     * Первый аргумент командной строки (если есть) переопределяет LEDGER_PROFILE_ID.
     */
    void loadEnvironment(int argc, char* argv[]);

    /**
     * @brief Настроить Boost.DI контейнер
     * 
     * Хранилище выбирается по LEDGER_STORAGE: memory или postgres.
     */
    void configureInjection();

    /**
     * @brief Загрузить профиль и вывести счета, капитал, счета к оплате и план погашения
     */
    void start();

private:
    void printStartupBanner();

    std::shared_ptr<finance::settings::LedgerSettings> settings_;
    std::shared_ptr<finance::settings::DbSettings> dbSettings_;
    std::shared_ptr<finance::ports::input::ILedgerService> ledger_;
    std::shared_ptr<finance::ports::input::IDebtPayoffService> debtPayoff_;
    std::shared_ptr<finance::ports::output::IClock> clock_;
};
