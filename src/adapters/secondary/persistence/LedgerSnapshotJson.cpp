#include "adapters/secondary/persistence/LedgerSnapshotJson.hpp"

#include <stdexcept>

namespace finance::adapters::secondary {

using nlohmann::json;

namespace {

// ============================================================================
// Чтение полей с подстановкой значений по умолчанию
// ============================================================================

std::string readString(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : fallback;
}

std::optional<double> readNumber(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

std::optional<domain::Money> readMoney(const json& j, const char* key) {
    if (auto value = readNumber(j, key)) {
        return domain::Money::fromDouble(*value);
    }
    return std::nullopt;
}

bool readBool(const json& j, const char* key, bool fallback) {
    auto it = j.find(key);
    return (it != j.end() && it->is_boolean()) ? it->get<bool>() : fallback;
}

const json& readArray(const json& j, const char* key) {
    static const json empty = json::array();
    auto it = j.find(key);
    return (it != j.end() && it->is_array()) ? *it : empty;
}

template <typename Enum, typename Parser>
Enum readEnum(const json& j, const char* key, Enum fallback, Parser parse) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    try {
        return parse(it->get<std::string>());
    } catch (const std::invalid_argument&) {
        return fallback;
    }
}

// ============================================================================
// Account
// ============================================================================

json accountToJson(const domain::Account& account) {
    json j;
    j["id"] = account.id;
    j["name"] = account.name;
    j["balance"] = account.balance.toDouble();
    j["accountCategory"] = domain::toString(account.category);

    if (account.creditLimit) j["creditLimit"] = account.creditLimit->toDouble();
    if (account.annualPercentageRate) j["apr"] = *account.annualPercentageRate;
    if (account.minimumPayment) j["minimumPayment"] = account.minimumPayment->toDouble();
    if (account.startingBalance) j["startingBalance"] = account.startingBalance->toDouble();
    return j;
}

domain::Account accountFromJson(const json& j) {
    domain::Account account;
    account.id = readString(j, "id");
    account.name = readString(j, "name");
    account.balance = readMoney(j, "balance").value_or(domain::Money());

    // Всё, что не "debt", считается активом
    account.category = readString(j, "accountCategory") == "debt"
        ? domain::AccountCategory::DEBT
        : domain::AccountCategory::ASSET;

    account.creditLimit = readMoney(j, "creditLimit");
    account.annualPercentageRate = readNumber(j, "apr");
    account.minimumPayment = readMoney(j, "minimumPayment");
    account.startingBalance = readMoney(j, "startingBalance");
    return account;
}

std::vector<domain::Account> accountsFromJson(const json& array) {
    std::vector<domain::Account> accounts;
    for (const auto& item : array) {
        if (item.is_object()) {
            accounts.push_back(accountFromJson(item));
        }
    }
    return accounts;
}

// ============================================================================
// Transaction
// ============================================================================

json transactionToJson(const domain::Transaction& tx) {
    json j;
    j["id"] = tx.id;
    j["accountId"] = tx.accountId;
    j["amount"] = tx.amount.toDouble();
    j["date"] = tx.date;
    j["description"] = tx.description;
    j["kind"] = domain::toString(tx.kind);
    if (tx.transferGroupId) {
        j["transferGroupId"] = *tx.transferGroupId;
    }
    return j;
}

domain::Transaction transactionFromJson(const json& j) {
    domain::Transaction tx;
    tx.id = readString(j, "id");
    tx.accountId = readString(j, "accountId");
    tx.amount = readMoney(j, "amount").value_or(domain::Money());
    tx.date = readString(j, "date");
    tx.description = readString(j, "description");
    tx.kind = readEnum(j, "kind", domain::TransactionKind::PLAIN, domain::transactionKindFromString);

    std::string groupId = readString(j, "transferGroupId");
    if (!groupId.empty()) {
        tx.transferGroupId = groupId;
    }
    return tx;
}

// ============================================================================
// Bill
// ============================================================================

json billToJson(const domain::Bill& bill) {
    json j;
    j["id"] = bill.id;
    j["name"] = bill.name;
    j["amount"] = bill.amount.toDouble();
    j["dueDate"] = bill.dueDate;
    j["accountId"] = bill.accountId;
    j["frequency"] = domain::toString(bill.frequency);
    j["isPaid"] = bill.isPaid;
    return j;
}

domain::Bill billFromJson(const json& j) {
    domain::Bill bill;
    bill.id = readString(j, "id");
    bill.name = readString(j, "name");
    bill.amount = readMoney(j, "amount").value_or(domain::Money());
    bill.dueDate = readString(j, "dueDate");
    bill.accountId = readString(j, "accountId");
    bill.frequency = readEnum(j, "frequency", domain::BillFrequency::MONTHLY, domain::billFrequencyFromString);
    bill.isPaid = readBool(j, "isPaid", false);
    return bill;
}

// ============================================================================
// NetWorthSnapshot
// ============================================================================

json netWorthToJson(const domain::NetWorthSnapshot& snapshot) {
    return {
        {"date", snapshot.date},
        {"value", snapshot.value},
        {"totalAssets", snapshot.totalAssets},
        {"totalDebts", snapshot.totalDebts}
    };
}

domain::NetWorthSnapshot netWorthFromJson(const json& j) {
    domain::NetWorthSnapshot snapshot;
    snapshot.date = readString(j, "date");
    snapshot.value = readNumber(j, "value").value_or(0.0);
    snapshot.totalAssets = readNumber(j, "totalAssets").value_or(0.0);
    snapshot.totalDebts = readNumber(j, "totalDebts").value_or(0.0);
    return snapshot;
}

} // namespace

nlohmann::json LedgerSnapshotJson::toJson(const domain::LedgerSnapshot& snapshot) {
    json j;

    j["accounts"] = json::array();
    for (const auto& account : snapshot.accounts) {
        j["accounts"].push_back(accountToJson(account));
    }

    j["deletedAccounts"] = json::array();
    for (const auto& account : snapshot.deletedAccounts) {
        j["deletedAccounts"].push_back(accountToJson(account));
    }

    j["transactions"] = json::array();
    for (const auto& tx : snapshot.transactions) {
        j["transactions"].push_back(transactionToJson(tx));
    }

    j["bills"] = json::array();
    for (const auto& bill : snapshot.bills) {
        j["bills"].push_back(billToJson(bill));
    }

    j["netWorthHistory"] = json::array();
    for (const auto& entry : snapshot.netWorthHistory) {
        j["netWorthHistory"].push_back(netWorthToJson(entry));
    }

    if (snapshot.netWorthViewMode) {
        j["netWorthViewMode"] = domain::toString(*snapshot.netWorthViewMode);
    }
    if (snapshot.hideMoney) {
        j["hideMoney"] = *snapshot.hideMoney;
    }

    j["debtPayoffSettings"] = {
        {"mode", domain::toString(snapshot.debtPayoffSettings.mode)},
        {"monthlyAllocation", snapshot.debtPayoffSettings.monthlyAllocation.toDouble()},
        {"showInterest", snapshot.debtPayoffSettings.showInterest}
    };

    return j;
}

domain::LedgerSnapshot LedgerSnapshotJson::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Ledger snapshot must be a JSON object");
    }

    domain::LedgerSnapshot snapshot;
    snapshot.accounts = accountsFromJson(readArray(j, "accounts"));
    snapshot.deletedAccounts = accountsFromJson(readArray(j, "deletedAccounts"));

    for (const auto& item : readArray(j, "transactions")) {
        if (item.is_object()) {
            snapshot.transactions.push_back(transactionFromJson(item));
        }
    }

    for (const auto& item : readArray(j, "bills")) {
        if (item.is_object()) {
            snapshot.bills.push_back(billFromJson(item));
        }
    }

    for (const auto& item : readArray(j, "netWorthHistory")) {
        if (item.is_object()) {
            snapshot.netWorthHistory.push_back(netWorthFromJson(item));
        }
    }

    // Только известные режимы, иначе поле считается незаданным
    std::string viewMode = readString(j, "netWorthViewMode");
    if (viewMode == "minimal" || viewMode == "detailed") {
        snapshot.netWorthViewMode = domain::netWorthViewModeFromString(viewMode);
    }

    auto hide = j.find("hideMoney");
    if (hide != j.end() && hide->is_boolean()) {
        snapshot.hideMoney = hide->get<bool>();
    }

    auto settings = j.find("debtPayoffSettings");
    if (settings != j.end() && settings->is_object()) {
        auto& target = snapshot.debtPayoffSettings;
        target.mode = readEnum(*settings, "mode", domain::DebtPayoffMode::SNOWBALL, domain::debtPayoffModeFromString);
        target.monthlyAllocation = readMoney(*settings, "monthlyAllocation").value_or(domain::Money());
        if (target.monthlyAllocation.isNegative()) {
            target.monthlyAllocation = domain::Money();
        }
        target.showInterest = readBool(*settings, "showInterest", false);
    }

    return snapshot;
}

} // namespace finance::adapters::secondary
