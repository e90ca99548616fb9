#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ISnapshotRepository.hpp"
#include "settings/LedgerSettings.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finance::application {

/**
 * @brief Журнал счетов, транзакций, переводов и счетов к оплате
 * 
 * Реализует ILedgerService. Единственный владелец состояния профиля:
 * - баланс счёта меняется только вместе с записью транзакции;
 * - половины перевода всегда равны по модулю и противоположны по знаку;
 * - долговой счёт не уходит в плюс без явного подтверждения (skipGuard).
 * 
 * После каждой успешной операции пересчитывается снимок капитала
 * и состояние сохраняется в репозиторий (write-through).
 * 
 * @note Однопоточный: все операции синхронные, блокировок нет.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::ISnapshotRepository> repository,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<settings::LedgerSettings> settings
    );

    void switchProfile(const std::optional<std::string>& profileId) override;
    std::optional<std::string> activeProfileId() const override;

    std::optional<domain::Account> addAccount(const domain::AccountRequest& request) override;
    domain::MutationResult editAccount(const std::string& accountId, const domain::AccountUpdate& update) override;
    bool deleteAccount(const std::string& accountId) override;
    bool restoreAccount(const std::string& accountId) override;
    bool selectAccount(const std::string& accountId) override;
    std::optional<std::string> selectedAccountId() const override;

    domain::MutationResult addTransaction(
        const domain::TransactionRequest& request,
        bool skipGuard = false
    ) override;

    domain::MutationResult updateTransaction(
        const std::string& transactionId,
        const domain::TransactionUpdate& update,
        bool skipGuard = false
    ) override;

    bool deleteTransaction(const std::string& transactionId) override;

    domain::MutationResult transfer(
        const domain::TransferRequest& request,
        bool skipGuard = false
    ) override;

    void reset(domain::ResetScope scope) override;

    std::optional<domain::Bill> addBill(const domain::BillRequest& request) override;
    bool updateBill(const domain::Bill& bill) override;
    bool removeBill(const std::string& billId) override;
    domain::MutationResult markBillPaid(const std::string& billId) override;

    void setNetWorthViewMode(domain::NetWorthViewMode mode) override;
    void setHideMoney(bool hide) override;
    void setDebtPayoffSettings(const domain::DebtPayoffSettings& settings) override;

    const domain::LedgerSnapshot& snapshot() const override;
    std::vector<domain::Account> getAccounts() const override;
    std::vector<domain::Account> getDeletedAccounts() const override;
    std::optional<domain::Account> getAccount(const std::string& accountId) const override;
    std::vector<domain::Transaction> getTransactions() const override;
    std::vector<domain::Transaction> getTransactionsForAccount(const std::string& accountId) const override;
    std::optional<domain::Transaction> getTransaction(const std::string& transactionId) const override;
    std::optional<domain::Transaction> findTransferPartner(const std::string& transactionId) const override;
    std::vector<domain::Bill> getBills() const override;
    std::vector<domain::Bill> getUnpaidBills() const override;
    std::vector<domain::NetWorthSnapshot> getNetWorthHistory() const override;
    domain::NetWorthTotals getNetWorth() const override;
    domain::DebtPayoffSettings getDebtPayoffSettings() const override;
    std::vector<domain::DebtInput> getDebtInputs() const override;

    /// Доля долга для минимального платежа по умолчанию
    static constexpr double DEFAULT_MINIMUM_PAYMENT_RATE = 0.03;

private:
    std::shared_ptr<ports::output::ISnapshotRepository> repository_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    std::optional<std::string> profileId_;
    std::optional<std::string> selectedAccountId_;
    domain::LedgerSnapshot state_;

    domain::Account* findAccount(const std::string& accountId);
    const domain::Account* findAccount(const std::string& accountId) const;
    std::optional<size_t> findTransactionIndex(const std::string& transactionId) const;

    /**
     * @brief Индекс второй половины перевода
     * 
     * Сначала по transferGroupId; для старых данных без разметки - первая по порядку
     * транзакция-перевод на другом счёте с той же датой и суммой противоположного знака.
     */
    std::optional<size_t> findTransferPartnerIndex(size_t index) const;

    /**
     * @brief Проверка переплаты долгового счёта
     * @return PendingConfirmation, если delta выводит баланс долга в плюс
     */
    std::optional<domain::PendingConfirmation> checkOverpayment(
        const domain::Account& account,
        const domain::Money& delta
    ) const;

    void applyDelta(const std::string& accountId, const domain::Money& delta);

    /**
     * @brief Откатить суммы удалённых транзакций на их счетах
     */
    void rollback(const std::vector<domain::Transaction>& removed);

    /**
     * @brief Пустая дата означает сегодня, некорректная даёт nullopt
     */
    std::optional<std::string> resolveDate(const std::string& date) const;

    void recordNetWorth();
    void persist();
};

} // namespace finance::application
