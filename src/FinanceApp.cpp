#include "FinanceApp.hpp"

// Application Services
#include "application/LedgerService.hpp"
#include "application/DebtPayoffService.hpp"

// Secondary Adapters
#include "adapters/secondary/clock/SystemClock.hpp"
#include "adapters/secondary/persistence/InMemoryKeyValueStore.hpp"
#include "adapters/secondary/persistence/KeyValueSnapshotRepository.hpp"
#include "adapters/secondary/persistence/PostgresKeyValueStore.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

#include <iomanip>
#include <iostream>

namespace di = boost::di;

using namespace finance;

// ============================================================================
// FinanceApp Implementation
// ============================================================================

FinanceApp::FinanceApp()
{
    std::cout << "[FinanceApp] Application created" << std::endl;
}

FinanceApp::~FinanceApp()
{
    std::cout << "[FinanceApp] Application destroyed" << std::endl;
}

int FinanceApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
    return 0;
}

void FinanceApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[FinanceApp] Loading environment..." << std::endl;

    settings_ = std::make_shared<settings::LedgerSettings>();
    dbSettings_ = std::make_shared<settings::DbSettings>();

    if (argc > 1 && argv[1][0] != '\0') {
        settings_->setProfileId(argv[1]);
    }

    std::cout << "[FinanceApp] Storage: " << settings_->getStorage()
              << ", profile: " << settings_->getProfileId().value_or("<none>")
              << ", net worth history: " << settings_->getNetWorthMaxPoints() << " points" << std::endl;
}

void FinanceApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[FinanceApp] Configuring Boost.DI injection..." << std::endl;

    std::shared_ptr<ports::output::IKeyValueStore> store;
    if (settings_->usePostgres()) {
        store = std::make_shared<adapters::secondary::PostgresKeyValueStore>(
            dbSettings_->getConnectionString(),
            dbSettings_->getTable());
    } else {
        store = std::make_shared<adapters::secondary::InMemoryKeyValueStore>();
    }

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<settings::LedgerSettings>().to(settings_),

        di::bind<ports::output::IKeyValueStore>().to(store),

        // ISnapshotRepository ← KeyValueSnapshotRepository(IKeyValueStore)
        di::bind<ports::output::ISnapshotRepository>()
            .to<adapters::secondary::KeyValueSnapshotRepository>()
            .in(di::singleton),

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::ILedgerService>()
            .to<application::LedgerService>()
            .in(di::singleton),

        di::bind<ports::input::IDebtPayoffService>()
            .to<application::DebtPayoffService>()
            .in(di::singleton));

    ledger_ = injector.create<std::shared_ptr<ports::input::ILedgerService>>();
    debtPayoff_ = injector.create<std::shared_ptr<ports::input::IDebtPayoffService>>();
    clock_ = injector.create<std::shared_ptr<ports::output::IClock>>();

    std::cout << "\n📦 Boost.DI Injector configured:" << std::endl;
    std::cout << "  ✓ Secondary Adapters (4 bindings)" << std::endl;
    std::cout << "  ✓ Application Services (2 bindings)" << std::endl;
}

void FinanceApp::start()
{
    ledger_->switchProfile(settings_->getProfileId());

    std::cout << std::fixed << std::setprecision(2);

    // ========================================================================
    // ACCOUNTS
    // ========================================================================
    std::cout << "\nAccounts:" << std::endl;
    for (const auto& account : ledger_->getAccounts()) {
        std::cout << "  " << (ledger_->selectedAccountId() == account.id ? "* " : "  ")
                  << std::left << std::setw(24) << account.name
                  << std::setw(6) << domain::getDisplayName(account.category)
                  << std::right << std::setw(14) << account.balance.toDouble() << std::endl;
    }

    auto totals = ledger_->getNetWorth();
    std::cout << "\nNet worth: " << totals.netWorth
              << " (assets " << totals.totalAssets
              << ", debts " << totals.totalDebts << ")" << std::endl;

    // ========================================================================
    // BILLS
    // ========================================================================
    auto bills = ledger_->getUnpaidBills();
    if (!bills.empty()) {
        auto today = clock_->today();

        std::cout << "\nUnpaid bills:" << std::endl;
        for (const auto& bill : bills) {
            auto status = bill.dueStatus(today);
            std::cout << "  " << std::left << std::setw(24) << bill.name
                      << std::right << std::setw(12) << bill.amount.toDouble()
                      << "  " << (bill.dueDate.empty() ? "no due date" : bill.dueDate);
            if (status.state == domain::DueState::OVERDUE) {
                std::cout << " (overdue " << status.days << " days)";
            }
            std::cout << std::endl;
        }
    }

    // ========================================================================
    // DEBT PAYOFF
    // ========================================================================
    auto settings = ledger_->getDebtPayoffSettings();
    auto plan = debtPayoff_->project(settings);
    if (!plan.debts.empty()) {
        std::cout << "\nDebt payoff (" << domain::toString(settings.mode)
                  << ", " << settings.monthlyAllocation.toDouble() << "/month):" << std::endl;

        if (plan.insufficientAllocation) {
            std::cout << "  Allocation is below minimum payments ("
                      << debtPayoff_->totalMinimumPayments() << ")" << std::endl;
        }

        for (const auto& debt : plan.debts) {
            std::cout << "  " << std::left << std::setw(24) << debt.name
                      << std::right << std::setw(12) << debt.balance << "  "
                      << (debt.estimatedPayoffDate ? debt.estimatedPayoffDate->toString() : "-")
                      << std::endl;
        }

        if (plan.overallEstimatedDebtFreeDate) {
            std::cout << "  Debt free by " << plan.overallEstimatedDebtFreeDate->toString() << std::endl;
        }
    }
}

void FinanceApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║                  Finance Ledger                      ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  Storage:      in-memory / PostgreSQL                ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}
