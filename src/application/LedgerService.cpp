#include "application/LedgerService.hpp"
#include "domain/Date.hpp"
#include "utils/UuidGenerator.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <iterator>
#include <utility>

namespace finance::application {

using domain::Account;
using domain::Bill;
using domain::Money;
using domain::MutationResult;
using domain::Transaction;
using domain::TransactionKind;

namespace {

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

LedgerService::LedgerService(
    std::shared_ptr<ports::output::ISnapshotRepository> repository,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<settings::LedgerSettings> settings
) : repository_(std::move(repository))
  , clock_(std::move(clock))
  , settings_(std::move(settings))
{
    std::cout << "[LedgerService] Created" << std::endl;
}

// ============================================================================
// Профиль
// ============================================================================

void LedgerService::switchProfile(const std::optional<std::string>& profileId) {
    profileId_ = profileId;
    state_ = domain::LedgerSnapshot{};
    selectedAccountId_.reset();

    if (!profileId_) {
        std::cout << "[LedgerService] No active profile, using empty in-memory ledger" << std::endl;
        return;
    }

    if (auto loaded = repository_->load(*profileId_)) {
        state_ = std::move(*loaded);
    }

    if (!state_.accounts.empty()) {
        selectedAccountId_ = state_.accounts.front().id;
    }

    std::cout << "[LedgerService] Loaded profile " << *profileId_ << ": "
              << state_.accounts.size() << " accounts, "
              << state_.transactions.size() << " transactions, "
              << state_.bills.size() << " bills" << std::endl;
}

std::optional<std::string> LedgerService::activeProfileId() const {
    return profileId_;
}

// ============================================================================
// Счета
// ============================================================================

std::optional<Account> LedgerService::addAccount(const domain::AccountRequest& request) {
    std::string name = trim(request.name);
    if (name.empty()) {
        std::cerr << "[LedgerService] REJECTED: account name is empty" << std::endl;
        return std::nullopt;
    }

    if (request.category == domain::AccountCategory::DEBT && request.balance.isPositive()) {
        std::cerr << "[LedgerService] REJECTED: debt account '" << name
                  << "' cannot start with a positive balance" << std::endl;
        return std::nullopt;
    }

    Account account(utils::UuidGenerator::generate(), name, request.balance, request.category);

    if (account.isDebt()) {
        Money owed = request.balance.abs();
        account.creditLimit = request.creditLimit;
        account.annualPercentageRate = request.annualPercentageRate;
        account.startingBalance = request.startingBalance ? request.startingBalance->abs() : owed;
        account.minimumPayment = request.minimumPayment.value_or(owed.percentOf(DEFAULT_MINIMUM_PAYMENT_RATE));
    }

    state_.accounts.push_back(account);
    selectedAccountId_ = account.id;

    std::cout << "[LedgerService] Account added: " << account.id
              << " (" << account.name << ", " << domain::toString(account.category) << ")" << std::endl;

    recordNetWorth();
    persist();
    return account;
}

MutationResult LedgerService::editAccount(const std::string& accountId, const domain::AccountUpdate& update) {
    Account* account = findAccount(accountId);
    if (!account) {
        return MutationResult::rejected("Account not found: " + accountId);
    }

    if (update.name) {
        std::string name = trim(*update.name);
        if (!name.empty()) {
            account->name = name;
        }
    }
    if (update.category) account->category = *update.category;
    if (update.creditLimit) account->creditLimit = update.creditLimit;
    if (update.annualPercentageRate) account->annualPercentageRate = update.annualPercentageRate;
    if (update.minimumPayment) account->minimumPayment = update.minimumPayment;
    if (update.startingBalance) account->startingBalance = update.startingBalance->abs();

    std::vector<Transaction> created;
    if (update.balance && *update.balance != account->balance) {
        // Баланс не меняется без записи в истории
        Money delta = *update.balance - account->balance;
        Transaction adjustment(
            utils::UuidGenerator::generate(),
            account->id,
            delta,
            clock_->today().toString(),
            delta.isPositive() ? "Balance adjustment (increase)" : "Balance adjustment (decrease)"
        );

        account->balance = *update.balance;
        state_.transactions.push_back(adjustment);
        created.push_back(adjustment);
    }

    recordNetWorth();
    persist();
    return MutationResult::applied(created);
}

bool LedgerService::deleteAccount(const std::string& accountId) {
    auto it = std::find_if(state_.accounts.begin(), state_.accounts.end(),
        [&accountId](const Account& a) { return a.id == accountId; });
    if (it == state_.accounts.end()) {
        return false;
    }

    const auto position = static_cast<size_t>(it - state_.accounts.begin());
    Account removed = *it;
    state_.accounts.erase(it);

    auto& deleted = state_.deletedAccounts;
    deleted.erase(std::remove_if(deleted.begin(), deleted.end(),
        [&accountId](const Account& a) { return a.id == accountId; }), deleted.end());
    deleted.push_back(removed);

    // Счёт исчез целиком, откатывать балансы некуда
    auto& txs = state_.transactions;
    txs.erase(std::remove_if(txs.begin(), txs.end(),
        [&accountId](const Transaction& t) { return t.accountId == accountId; }), txs.end());

    auto& bills = state_.bills;
    bills.erase(std::remove_if(bills.begin(), bills.end(),
        [&accountId](const Bill& b) { return b.accountId == accountId; }), bills.end());

    if (selectedAccountId_ == accountId) {
        if (state_.accounts.empty()) {
            selectedAccountId_.reset();
        } else if (position < state_.accounts.size()) {
            selectedAccountId_ = state_.accounts[position].id;
        } else {
            selectedAccountId_ = state_.accounts.back().id;
        }
    }

    std::cout << "[LedgerService] Account deleted: " << accountId << std::endl;

    recordNetWorth();
    persist();
    return true;
}

bool LedgerService::restoreAccount(const std::string& accountId) {
    auto& deleted = state_.deletedAccounts;
    auto it = std::find_if(deleted.begin(), deleted.end(),
        [&accountId](const Account& a) { return a.id == accountId; });

    if (findAccount(accountId)) {
        if (it != deleted.end()) {
            deleted.erase(it);
            persist();
        }
        return true;
    }

    if (it == deleted.end()) {
        return false;
    }

    Account restored = *it;
    deleted.erase(it);
    state_.accounts.push_back(restored);
    if (!selectedAccountId_) {
        selectedAccountId_ = restored.id;
    }

    std::cout << "[LedgerService] Account restored: " << accountId << std::endl;

    recordNetWorth();
    persist();
    return true;
}

bool LedgerService::selectAccount(const std::string& accountId) {
    if (!findAccount(accountId)) {
        return false;
    }
    selectedAccountId_ = accountId;
    return true;
}

std::optional<std::string> LedgerService::selectedAccountId() const {
    return selectedAccountId_;
}

// ============================================================================
// Транзакции и переводы
// ============================================================================

MutationResult LedgerService::addTransaction(const domain::TransactionRequest& request, bool skipGuard) {
    Account* account = findAccount(request.accountId);
    if (!account) {
        return MutationResult::rejected("Account not found: " + request.accountId);
    }
    if (request.amount.isZero()) {
        return MutationResult::rejected("Transaction amount must be non-zero");
    }
    auto date = resolveDate(request.date);
    if (!date) {
        return MutationResult::rejected("Invalid transaction date: " + request.date);
    }

    if (!skipGuard) {
        if (auto pending = checkOverpayment(*account, request.amount)) {
            return MutationResult::pendingConfirmation(*pending);
        }
    }

    Transaction tx(
        utils::UuidGenerator::generate(),
        account->id,
        request.amount,
        *date,
        trim(request.description)
    );

    account->balance += tx.amount;
    state_.transactions.push_back(tx);

    recordNetWorth();
    persist();
    return MutationResult::applied({tx});
}

MutationResult LedgerService::updateTransaction(
    const std::string& transactionId,
    const domain::TransactionUpdate& update,
    bool skipGuard
) {
    auto index = findTransactionIndex(transactionId);
    if (!index) {
        return MutationResult::rejected("Transaction not found: " + transactionId);
    }
    if (update.amount && update.amount->isZero()) {
        return MutationResult::rejected("Transaction amount must be non-zero");
    }
    std::optional<std::string> newDate;
    if (update.date) {
        newDate = resolveDate(*update.date);
        if (!newDate) {
            return MutationResult::rejected("Invalid transaction date: " + *update.date);
        }
    }

    const Transaction& current = state_.transactions[*index];
    const Money newAmount = update.amount.value_or(current.amount);
    const Money delta = newAmount - current.amount;

    std::optional<size_t> partnerIndex;
    if (current.isTransferLeg()) {
        partnerIndex = findTransferPartnerIndex(*index);
    }

    // Вторая половина перевода всегда получает сумму с противоположным знаком
    Money partnerDelta;
    if (partnerIndex) {
        partnerDelta = -newAmount - state_.transactions[*partnerIndex].amount;
    }

    if (!skipGuard) {
        if (const Account* account = findAccount(current.accountId)) {
            if (auto pending = checkOverpayment(*account, delta)) {
                return MutationResult::pendingConfirmation(*pending);
            }
        }
        if (partnerIndex) {
            const auto& partner = state_.transactions[*partnerIndex];
            if (const Account* partnerAccount = findAccount(partner.accountId)) {
                if (auto pending = checkOverpayment(*partnerAccount, partnerDelta)) {
                    return MutationResult::pendingConfirmation(*pending);
                }
            }
        }
    }

    Transaction& tx = state_.transactions[*index];
    tx.amount = newAmount;
    if (newDate) tx.date = *newDate;
    if (update.description) tx.description = trim(*update.description);
    applyDelta(tx.accountId, delta);

    std::vector<Transaction> changed{tx};

    if (partnerIndex) {
        Transaction& partner = state_.transactions[*partnerIndex];
        partner.amount = -newAmount;
        if (newDate) partner.date = tx.date;
        if (update.description) partner.description = tx.description;
        applyDelta(partner.accountId, partnerDelta);

        // Пара, найденная эвристикой, получает явную связь
        if (!tx.transferGroupId) {
            std::string groupId = utils::UuidGenerator::generate();
            tx.transferGroupId = groupId;
            tx.kind = TransactionKind::TRANSFER_LEG;
            partner.transferGroupId = groupId;
            partner.kind = TransactionKind::TRANSFER_LEG;
            changed[0] = tx;
        }
        changed.push_back(partner);
    }

    recordNetWorth();
    persist();
    return MutationResult::applied(changed);
}

bool LedgerService::deleteTransaction(const std::string& transactionId) {
    auto index = findTransactionIndex(transactionId);
    if (!index) {
        return false;
    }

    std::vector<Transaction> removed{state_.transactions[*index]};
    if (removed.front().isTransferLeg()) {
        if (auto partnerIndex = findTransferPartnerIndex(*index)) {
            removed.push_back(state_.transactions[*partnerIndex]);
        }
    }

    auto& txs = state_.transactions;
    txs.erase(std::remove_if(txs.begin(), txs.end(), [&removed](const Transaction& t) {
        return std::any_of(removed.begin(), removed.end(),
            [&t](const Transaction& r) { return r.id == t.id; });
    }), txs.end());

    rollback(removed);

    recordNetWorth();
    persist();
    return true;
}

MutationResult LedgerService::transfer(const domain::TransferRequest& request, bool skipGuard) {
    if (!request.amount.isPositive()) {
        std::cerr << "[LedgerService] REJECTED: transfer amount must be positive" << std::endl;
        return MutationResult::rejected("Transfer amount must be positive");
    }
    if (request.fromAccountId == request.toAccountId) {
        std::cerr << "[LedgerService] REJECTED: transfer to the same account" << std::endl;
        return MutationResult::rejected("Cannot transfer to the same account");
    }

    Account* from = findAccount(request.fromAccountId);
    Account* to = findAccount(request.toAccountId);
    if (!from || !to) {
        return MutationResult::rejected("Transfer account not found");
    }

    const Money amount = request.amount;
    const auto date = resolveDate(request.date);
    if (!date) {
        return MutationResult::rejected("Invalid transfer date: " + request.date);
    }

    // Источник переплатить нельзя, проверяется только получатель
    if (!skipGuard) {
        if (auto pending = checkOverpayment(*to, amount)) {
            return MutationResult::pendingConfirmation(*pending);
        }
    }

    const std::string groupId = utils::UuidGenerator::generate();
    const std::string note = trim(request.note);

    Transaction out(
        utils::UuidGenerator::generate(), from->id, -amount, *date,
        note.empty() ? "Transfer out" : note, TransactionKind::TRANSFER_LEG);
    out.transferGroupId = groupId;

    Transaction in(
        utils::UuidGenerator::generate(), to->id, amount, *date,
        note.empty() ? "Transfer in" : note, TransactionKind::TRANSFER_LEG);
    in.transferGroupId = groupId;

    from->balance -= amount;
    to->balance += amount;
    state_.transactions.push_back(out);
    state_.transactions.push_back(in);

    recordNetWorth();
    persist();
    return MutationResult::applied({out, in});
}

void LedgerService::reset(domain::ResetScope scope) {
    std::cout << "[LedgerService] Reset: " << domain::toString(scope) << std::endl;

    if (scope == domain::ResetScope::EVERYTHING) {
        state_.accounts.clear();
        state_.deletedAccounts.clear();
        state_.transactions.clear();
        state_.bills.clear();
        state_.netWorthHistory.clear();
        selectedAccountId_.reset();
        persist();
        return;
    }

    auto shouldRemove = [scope](const Transaction& t) {
        switch (scope) {
            case domain::ResetScope::TRANSACTIONS: return !t.isTransferLeg();
            case domain::ResetScope::TRANSFERS:    return t.isTransferLeg();
            default:                               return true;
        }
    };

    std::vector<Transaction> removed;
    std::vector<Transaction> kept;
    for (const auto& tx : state_.transactions) {
        if (shouldRemove(tx)) {
            removed.push_back(tx);
        } else {
            kept.push_back(tx);
        }
    }

    state_.transactions = std::move(kept);
    rollback(removed);

    recordNetWorth();
    persist();
}

// ============================================================================
// Счета к оплате
// ============================================================================

std::optional<Bill> LedgerService::addBill(const domain::BillRequest& request) {
    std::string name = trim(request.name);
    if (name.empty() || request.amount.isZero() || !findAccount(request.accountId)) {
        std::cerr << "[LedgerService] REJECTED: invalid bill '" << name << "'" << std::endl;
        return std::nullopt;
    }

    Bill bill;
    bill.id = utils::UuidGenerator::generate();
    bill.name = name;
    bill.amount = request.amount.abs();
    bill.dueDate = request.dueDate;
    bill.accountId = request.accountId;
    bill.frequency = request.frequency;
    bill.isPaid = false;

    state_.bills.push_back(bill);
    persist();
    return bill;
}

bool LedgerService::updateBill(const Bill& bill) {
    auto it = std::find_if(state_.bills.begin(), state_.bills.end(),
        [&bill](const Bill& b) { return b.id == bill.id; });
    if (it == state_.bills.end() || !findAccount(bill.accountId)) {
        return false;
    }

    *it = bill;
    it->amount = bill.amount.abs();
    persist();
    return true;
}

bool LedgerService::removeBill(const std::string& billId) {
    auto& bills = state_.bills;
    auto it = std::remove_if(bills.begin(), bills.end(),
        [&billId](const Bill& b) { return b.id == billId; });
    if (it == bills.end()) {
        return false;
    }

    bills.erase(it, bills.end());
    persist();
    return true;
}

MutationResult LedgerService::markBillPaid(const std::string& billId) {
    auto it = std::find_if(state_.bills.begin(), state_.bills.end(),
        [&billId](const Bill& b) { return b.id == billId; });
    if (it == state_.bills.end()) {
        return MutationResult::rejected("Bill not found: " + billId);
    }

    Account* account = findAccount(it->accountId);
    if (!account) {
        return MutationResult::rejected("Bill account not found: " + it->accountId);
    }

    const domain::Date today = clock_->today();
    const Money amount = it->amount.abs();

    Transaction tx(
        utils::UuidGenerator::generate(),
        account->id,
        -amount,
        today.toString(),
        it->name.empty() ? "Bill payment" : it->name
    );

    account->balance -= amount;
    state_.transactions.push_back(tx);

    if (domain::isRecurring(it->frequency)) {
        it->dueDate = it->nextDueDate(today);
        it->isPaid = false;
    } else {
        it->isPaid = true;
    }

    recordNetWorth();
    persist();
    return MutationResult::applied({tx});
}

// ============================================================================
// Настройки отображения
// ============================================================================

void LedgerService::setNetWorthViewMode(domain::NetWorthViewMode mode) {
    state_.netWorthViewMode = mode;
    persist();
}

void LedgerService::setHideMoney(bool hide) {
    state_.hideMoney = hide;
    persist();
}

void LedgerService::setDebtPayoffSettings(const domain::DebtPayoffSettings& settings) {
    state_.debtPayoffSettings = settings;
    if (state_.debtPayoffSettings.monthlyAllocation.isNegative()) {
        state_.debtPayoffSettings.monthlyAllocation = Money();
    }
    persist();
}

// ============================================================================
// Чтение
// ============================================================================

const domain::LedgerSnapshot& LedgerService::snapshot() const {
    return state_;
}

std::vector<Account> LedgerService::getAccounts() const {
    return state_.accounts;
}

std::vector<Account> LedgerService::getDeletedAccounts() const {
    return state_.deletedAccounts;
}

std::optional<Account> LedgerService::getAccount(const std::string& accountId) const {
    if (const Account* account = findAccount(accountId)) {
        return *account;
    }
    return std::nullopt;
}

std::vector<Transaction> LedgerService::getTransactions() const {
    return state_.transactions;
}

std::vector<Transaction> LedgerService::getTransactionsForAccount(const std::string& accountId) const {
    std::vector<Transaction> result;
    for (const auto& tx : state_.transactions) {
        if (tx.accountId == accountId) {
            result.push_back(tx);
        }
    }
    return result;
}

std::optional<Transaction> LedgerService::getTransaction(const std::string& transactionId) const {
    if (auto index = findTransactionIndex(transactionId)) {
        return state_.transactions[*index];
    }
    return std::nullopt;
}

std::optional<Transaction> LedgerService::findTransferPartner(const std::string& transactionId) const {
    auto index = findTransactionIndex(transactionId);
    if (!index || !state_.transactions[*index].isTransferLeg()) {
        return std::nullopt;
    }
    if (auto partnerIndex = findTransferPartnerIndex(*index)) {
        return state_.transactions[*partnerIndex];
    }
    return std::nullopt;
}

std::vector<Bill> LedgerService::getBills() const {
    return state_.bills;
}

std::vector<Bill> LedgerService::getUnpaidBills() const {
    std::vector<Bill> result;
    std::copy_if(state_.bills.begin(), state_.bills.end(), std::back_inserter(result),
        [](const Bill& b) { return !b.isPaid; });
    return result;
}

std::vector<domain::NetWorthSnapshot> LedgerService::getNetWorthHistory() const {
    return state_.netWorthHistory;
}

domain::NetWorthTotals LedgerService::getNetWorth() const {
    return domain::NetWorthCalculator::calculate(state_.accounts);
}

domain::DebtPayoffSettings LedgerService::getDebtPayoffSettings() const {
    return state_.debtPayoffSettings;
}

std::vector<domain::DebtInput> LedgerService::getDebtInputs() const {
    std::vector<domain::DebtInput> debts;
    for (const auto& account : state_.accounts) {
        if (!account.isDebt() || !account.balance.isNegative()) {
            continue;
        }

        Money owed = account.balance.abs();

        domain::DebtInput debt;
        debt.id = account.id;
        debt.name = account.name;
        debt.balance = owed.toDouble();
        debt.minimumPayment = account.minimumPayment.value_or(Money()).toDouble();
        debt.apr = account.annualPercentageRate.value_or(0.0);
        debt.startingBalance = account.startingBalance.value_or(owed).toDouble();
        debts.push_back(debt);
    }
    return debts;
}

// ============================================================================
// Внутренние помощники
// ============================================================================

Account* LedgerService::findAccount(const std::string& accountId) {
    for (auto& account : state_.accounts) {
        if (account.id == accountId) {
            return &account;
        }
    }
    return nullptr;
}

const Account* LedgerService::findAccount(const std::string& accountId) const {
    for (const auto& account : state_.accounts) {
        if (account.id == accountId) {
            return &account;
        }
    }
    return nullptr;
}

std::optional<size_t> LedgerService::findTransactionIndex(const std::string& transactionId) const {
    for (size_t i = 0; i < state_.transactions.size(); ++i) {
        if (state_.transactions[i].id == transactionId) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> LedgerService::findTransferPartnerIndex(size_t index) const {
    const auto& txs = state_.transactions;
    const Transaction& tx = txs[index];

    if (tx.transferGroupId) {
        for (size_t i = 0; i < txs.size(); ++i) {
            if (i != index && txs[i].transferGroupId == tx.transferGroupId) {
                return i;
            }
        }
        return std::nullopt;
    }

    // Старые данные: при нескольких кандидатах берётся первый по порядку добавления
    for (size_t i = 0; i < txs.size(); ++i) {
        const Transaction& candidate = txs[i];
        if (i == index || candidate.transferGroupId) continue;
        if (candidate.accountId == tx.accountId) continue;
        if (candidate.date != tx.date) continue;
        if (candidate.amount != -tx.amount) continue;
        if (!candidate.isTransferLeg()) continue;
        return i;
    }
    return std::nullopt;
}

std::optional<domain::PendingConfirmation> LedgerService::checkOverpayment(
    const Account& account,
    const Money& delta
) const {
    if (!account.isDebt() || !delta.isPositive()) {
        return std::nullopt;
    }

    Money resulting = account.balance + delta;
    if (!resulting.isPositive()) {
        return std::nullopt;
    }

    std::cout << "[LedgerService] Overpayment of debt account " << account.id
              << " deferred, resulting balance " << resulting.toDouble() << std::endl;

    return domain::PendingConfirmation{account.id, delta, resulting};
}

void LedgerService::applyDelta(const std::string& accountId, const Money& delta) {
    if (Account* account = findAccount(accountId)) {
        account->balance += delta;
    }
}

void LedgerService::rollback(const std::vector<Transaction>& removed) {
    for (const auto& tx : removed) {
        applyDelta(tx.accountId, -tx.amount);
    }
}

std::optional<std::string> LedgerService::resolveDate(const std::string& date) const {
    std::string trimmed = trim(date);
    if (trimmed.empty()) {
        return clock_->today().toString();
    }
    auto parsed = domain::Date::fromString(trimmed);
    if (!parsed) {
        std::cerr << "[LedgerService] REJECTED: invalid date '" << date << "'" << std::endl;
        return std::nullopt;
    }
    return parsed->toString();
}

void LedgerService::recordNetWorth() {
    if (state_.accounts.empty()) {
        return;
    }

    auto snapshot = domain::NetWorthCalculator::snapshot(state_.accounts, clock_->today());
    domain::NetWorthCalculator::upsert(state_.netWorthHistory, snapshot, settings_->getNetWorthMaxPoints());
}

void LedgerService::persist() {
    if (!profileId_) {
        return;
    }

    try {
        repository_->save(*profileId_, state_);
    } catch (const std::exception& e) {
        std::cerr << "[LedgerService] Failed to persist profile " << *profileId_
                  << ": " << e.what() << std::endl;
    }
}

} // namespace finance::application
