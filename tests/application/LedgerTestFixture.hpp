#pragma once

#include <gtest/gtest.h>
#include "application/LedgerService.hpp"
#include "mocks/FixedClock.hpp"
#include "mocks/RecordingSnapshotRepository.hpp"
#include <map>
#include <memory>

namespace finance::tests {

/**
 * @brief Общая подготовка для тестов LedgerService
 * 
 * Запоминает начальные балансы созданных счетов, чтобы проверять
 * равенство "баланс = начальный баланс + сумма транзакций".
 */
class LedgerTestFixture : public ::testing::Test {
protected:
    static constexpr const char* PROFILE = "profile-1";

    void SetUp() override {
        repo_ = std::make_shared<RecordingSnapshotRepository>();
        clock_ = std::make_shared<FixedClock>(domain::Date(2025, 6, 10));
        settings_ = std::make_shared<settings::LedgerSettings>();
        settings_->setNetWorthMaxPoints(domain::NetWorthCalculator::DEFAULT_MAX_POINTS);

        ledger_ = std::make_shared<application::LedgerService>(repo_, clock_, settings_);
        ledger_->switchProfile(std::string(PROFILE));
    }

    std::string addAsset(const std::string& name, int64_t cents) {
        domain::AccountRequest request;
        request.name = name;
        request.balance = domain::Money(cents);
        request.category = domain::AccountCategory::ASSET;
        auto account = ledger_->addAccount(request);
        EXPECT_TRUE(account.has_value());
        initial_[account->id] = domain::Money(cents);
        return account->id;
    }

    std::string addDebt(const std::string& name, int64_t cents, double apr = 0.2, int64_t minimumCents = 2500) {
        domain::AccountRequest request;
        request.name = name;
        request.balance = domain::Money(cents);
        request.category = domain::AccountCategory::DEBT;
        request.annualPercentageRate = apr;
        request.minimumPayment = domain::Money(minimumCents);
        auto account = ledger_->addAccount(request);
        EXPECT_TRUE(account.has_value());
        initial_[account->id] = domain::Money(cents);
        return account->id;
    }

    domain::MutationResult addTx(const std::string& accountId, int64_t cents,
                                 const std::string& description = "Expense", bool skipGuard = false) {
        domain::TransactionRequest request;
        request.accountId = accountId;
        request.amount = domain::Money(cents);
        request.description = description;
        return ledger_->addTransaction(request, skipGuard);
    }

    domain::MutationResult transfer(const std::string& from, const std::string& to, int64_t cents,
                                    const std::string& note = "", bool skipGuard = false) {
        domain::TransferRequest request;
        request.fromAccountId = from;
        request.toAccountId = to;
        request.amount = domain::Money(cents);
        request.note = note;
        return ledger_->transfer(request, skipGuard);
    }

    int64_t balanceOf(const std::string& accountId) const {
        auto account = ledger_->getAccount(accountId);
        return account ? account->balance.cents : 0;
    }

    /**
     * @brief Баланс каждого счёта равен начальному плюс сумма его транзакций
     */
    void expectBalancesConsistent() const {
        for (const auto& account : ledger_->getAccounts()) {
            auto it = initial_.find(account.id);
            domain::Money expected = it != initial_.end() ? it->second : domain::Money();
            for (const auto& tx : ledger_->getTransactionsForAccount(account.id)) {
                expected += tx.amount;
            }
            EXPECT_EQ(account.balance, expected) << "account " << account.name;
        }
    }

    std::shared_ptr<RecordingSnapshotRepository> repo_;
    std::shared_ptr<FixedClock> clock_;
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<application::LedgerService> ledger_;
    std::map<std::string, domain::Money> initial_;
};

} // namespace finance::tests
