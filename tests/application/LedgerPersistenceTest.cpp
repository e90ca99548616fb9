/**
 * @file LedgerPersistenceTest.cpp
 * @brief Write-through persistence and profile switching
 */

#include "LedgerTestFixture.hpp"
#include "adapters/secondary/persistence/InMemoryKeyValueStore.hpp"
#include "adapters/secondary/persistence/KeyValueSnapshotRepository.hpp"
#include <stdexcept>

using namespace finance;
using namespace finance::tests;

namespace {

/**
 * @brief Репозиторий, у которого всегда отказывает запись
 */
class FailingSnapshotRepository : public ports::output::ISnapshotRepository {
public:
    std::optional<domain::LedgerSnapshot> load(const std::string&) override {
        return std::nullopt;
    }

    void save(const std::string&, const domain::LedgerSnapshot&) override {
        ++attempts;
        throw std::runtime_error("quota exceeded");
    }

    int attempts = 0;
};

} // namespace

class LedgerPersistenceTest : public LedgerTestFixture {};

// ============================================================================
// WRITE-THROUGH TESTS
// ============================================================================

TEST_F(LedgerPersistenceTest, EveryMutationIsSaved) {
    auto checking = addAsset("Checking", 100000);
    int saves = repo_->saveCallCount();

    addTx(checking, -1000);
    EXPECT_EQ(repo_->saveCallCount(), saves + 1);

    const auto* stored = repo_->stored(PROFILE);
    ASSERT_NE(stored, nullptr);
    ASSERT_EQ(stored->transactions.size(), 1u);
    EXPECT_EQ(stored->accounts[0].balance.cents, 99000);
}

TEST_F(LedgerPersistenceTest, RejectedMutationIsNotSaved) {
    auto checking = addAsset("Checking", 100000);
    int saves = repo_->saveCallCount();

    addTx(checking, 0);
    transfer(checking, checking, 100);

    EXPECT_EQ(repo_->saveCallCount(), saves);
}

TEST_F(LedgerPersistenceTest, NoProfile_NothingSaved) {
    ledger_->switchProfile(std::nullopt);
    int saves = repo_->saveCallCount();

    auto checking = addAsset("Checking", 100000);
    addTx(checking, -1000);

    EXPECT_EQ(repo_->saveCallCount(), saves);
    EXPECT_EQ(ledger_->getTransactions().size(), 1u);
    EXPECT_FALSE(ledger_->activeProfileId().has_value());
}

// ============================================================================
// PROFILE SWITCH TESTS
// ============================================================================

TEST_F(LedgerPersistenceTest, SwitchProfile_ReplacesState) {
    addAsset("Checking", 100000);

    ledger_->switchProfile(std::string("profile-2"));

    EXPECT_EQ(ledger_->activeProfileId(), "profile-2");
    EXPECT_TRUE(ledger_->getAccounts().empty());
    EXPECT_FALSE(ledger_->selectedAccountId().has_value());

    ledger_->switchProfile(std::string(PROFILE));

    ASSERT_EQ(ledger_->getAccounts().size(), 1u);
    EXPECT_EQ(ledger_->selectedAccountId(), ledger_->getAccounts()[0].id);
}

TEST_F(LedgerPersistenceTest, SwitchProfile_LoadDoesNotSave) {
    addAsset("Checking", 100000);
    int saves = repo_->saveCallCount();

    ledger_->switchProfile(std::string(PROFILE));

    EXPECT_EQ(repo_->saveCallCount(), saves);
}

TEST_F(LedgerPersistenceTest, FailedSave_KeepsInMemoryState) {
    auto failing = std::make_shared<FailingSnapshotRepository>();
    application::LedgerService ledger(failing, clock_, settings_);
    ledger.switchProfile(std::string("profile-x"));

    domain::AccountRequest request;
    request.name = "Checking";
    request.balance = domain::Money(1000);
    auto account = ledger.addAccount(request);

    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(failing->attempts, 1);
    EXPECT_EQ(ledger.getAccounts().size(), 1u);
}

// ============================================================================
// FULL STACK
// ============================================================================

TEST_F(LedgerPersistenceTest, RestartRestoresLedger) {
    auto store = std::make_shared<adapters::secondary::InMemoryKeyValueStore>();
    auto repository = std::make_shared<adapters::secondary::KeyValueSnapshotRepository>(store);

    std::string checkingId;
    std::string visaId;
    {
        application::LedgerService ledger(repository, clock_, settings_);
        ledger.switchProfile(std::string("household"));

        domain::AccountRequest checking;
        checking.name = "Checking";
        checking.balance = domain::Money(100000);
        checkingId = ledger.addAccount(checking)->id;

        domain::AccountRequest visa;
        visa.name = "Visa";
        visa.balance = domain::Money(-40000);
        visa.category = domain::AccountCategory::DEBT;
        visa.annualPercentageRate = 0.1999;
        visaId = ledger.addAccount(visa)->id;

        domain::TransferRequest payment;
        payment.fromAccountId = checkingId;
        payment.toAccountId = visaId;
        payment.amount = domain::Money(15000);
        ASSERT_TRUE(ledger.transfer(payment).isApplied());

        ledger.setNetWorthViewMode(domain::NetWorthViewMode::MINIMAL);
    }

    application::LedgerService restarted(repository, clock_, settings_);
    restarted.switchProfile(std::string("household"));

    ASSERT_EQ(restarted.getAccounts().size(), 2u);
    EXPECT_EQ(restarted.getAccount(checkingId)->balance.cents, 85000);
    EXPECT_EQ(restarted.getAccount(visaId)->balance.cents, -25000);
    EXPECT_EQ(restarted.getAccount(visaId)->minimumPayment->cents, 1200);
    EXPECT_EQ(restarted.getTransactions().size(), 2u);
    EXPECT_EQ(restarted.getNetWorthHistory().size(), 1u);
    EXPECT_EQ(restarted.snapshot().netWorthViewMode, domain::NetWorthViewMode::MINIMAL);

    auto legs = restarted.getTransactions();
    auto partner = restarted.findTransferPartner(legs[0].id);
    ASSERT_TRUE(partner.has_value());
    EXPECT_EQ(partner->id, legs[1].id);

    EXPECT_TRUE(store->get("finance-web:dashboard:household").has_value());
}
