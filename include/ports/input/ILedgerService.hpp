#pragma once

#include "domain/AccountRequest.hpp"
#include "domain/DebtPayoff.hpp"
#include "domain/LedgerSnapshot.hpp"
#include "domain/MutationResult.hpp"
#include "domain/NetWorthCalculator.hpp"
#include "domain/enums/ResetScope.hpp"
#include <optional>
#include <string>
#include <vector>

namespace finance::ports::input {

/**
 * @brief Интерфейс журнала счетов и транзакций
 * 
 * Input Port для всех операций, меняющих балансы.
 * Каждая операция либо применяется полностью (счёт и список транзакций синхронно),
 * либо откладывается до подтверждения, либо отклоняется без изменений.
 * Успешная операция сразу сохраняет состояние активного профиля.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    // ------------------------------------------------------------------
    // Профиль
    // ------------------------------------------------------------------

    /**
     * @brief Переключить профиль
     * 
     * Полностью заменяет состояние загруженным (без слияния).
     * 
     * @param profileId Идентификатор профиля; nullopt - пустой журнал без сохранения
     */
    virtual void switchProfile(const std::optional<std::string>& profileId) = 0;

    virtual std::optional<std::string> activeProfileId() const = 0;

    // ------------------------------------------------------------------
    // Счета
    // ------------------------------------------------------------------

    /**
     * @brief Добавить счёт
     * 
     * Для долгового счёта по умолчанию startingBalance = |balance|,
     * minimumPayment = 3% от |balance|.
     * 
     * @return Созданный Account или nullopt (пустое имя, долг с положительным балансом)
     */
    virtual std::optional<domain::Account> addAccount(const domain::AccountRequest& request) = 0;

    /**
     * @brief Изменить счёт
     * 
     * Изменение баланса записывается корректирующей транзакцией на разницу.
     */
    virtual domain::MutationResult editAccount(const std::string& accountId, const domain::AccountUpdate& update) = 0;

    /**
     * @brief Удалить счёт (в корзину)
     * 
     * Транзакции и счета к оплате удаляются вместе со счётом.
     * 
     * @return true если счёт был удалён
     */
    virtual bool deleteAccount(const std::string& accountId) = 0;

    /**
     * @brief Восстановить счёт из корзины
     * 
     * @return true если счёт активен после вызова
     */
    virtual bool restoreAccount(const std::string& accountId) = 0;

    virtual bool selectAccount(const std::string& accountId) = 0;

    virtual std::optional<std::string> selectedAccountId() const = 0;

    // ------------------------------------------------------------------
    // Транзакции и переводы
    // ------------------------------------------------------------------

    /**
     * @brief Добавить транзакцию
     * 
     * @param skipGuard true - провести даже если долговой счёт уйдёт в плюс
     */
    virtual domain::MutationResult addTransaction(
        const domain::TransactionRequest& request,
        bool skipGuard = false
    ) = 0;

    /**
     * @brief Изменить транзакцию
     * 
     * Для половины перевода вторая половина получает сумму с противоположным
     * знаком и те же дату и описание.
     */
    virtual domain::MutationResult updateTransaction(
        const std::string& transactionId,
        const domain::TransactionUpdate& update,
        bool skipGuard = false
    ) = 0;

    /**
     * @brief Удалить транзакцию (перевод - обе половины) с откатом балансов
     */
    virtual bool deleteTransaction(const std::string& transactionId) = 0;

    /**
     * @brief Перевод между счетами
     * 
     * Проверка переплаты применяется только к счёту-получателю.
     */
    virtual domain::MutationResult transfer(
        const domain::TransferRequest& request,
        bool skipGuard = false
    ) = 0;

    /**
     * @brief Сбросить данные
     * 
     * Для первых трёх областей балансы счетов откатываются на сумму
     * удалённых транзакций.
     */
    virtual void reset(domain::ResetScope scope) = 0;

    // ------------------------------------------------------------------
    // Счета к оплате
    // ------------------------------------------------------------------

    virtual std::optional<domain::Bill> addBill(const domain::BillRequest& request) = 0;

    virtual bool updateBill(const domain::Bill& bill) = 0;

    virtual bool removeBill(const std::string& billId) = 0;

    /**
     * @brief Оплатить счёт
     * 
     * Создаёт расход на счёте, разовый счёт помечается оплаченным,
     * регулярный переносится на следующий период.
     */
    virtual domain::MutationResult markBillPaid(const std::string& billId) = 0;

    // ------------------------------------------------------------------
    // Настройки отображения
    // ------------------------------------------------------------------

    virtual void setNetWorthViewMode(domain::NetWorthViewMode mode) = 0;

    virtual void setHideMoney(bool hide) = 0;

    virtual void setDebtPayoffSettings(const domain::DebtPayoffSettings& settings) = 0;

    // ------------------------------------------------------------------
    // Чтение
    // ------------------------------------------------------------------

    virtual const domain::LedgerSnapshot& snapshot() const = 0;

    virtual std::vector<domain::Account> getAccounts() const = 0;

    virtual std::vector<domain::Account> getDeletedAccounts() const = 0;

    virtual std::optional<domain::Account> getAccount(const std::string& accountId) const = 0;

    virtual std::vector<domain::Transaction> getTransactions() const = 0;

    virtual std::vector<domain::Transaction> getTransactionsForAccount(const std::string& accountId) const = 0;

    virtual std::optional<domain::Transaction> getTransaction(const std::string& transactionId) const = 0;

    /**
     * @brief Найти вторую половину перевода
     */
    virtual std::optional<domain::Transaction> findTransferPartner(const std::string& transactionId) const = 0;

    virtual std::vector<domain::Bill> getBills() const = 0;

    virtual std::vector<domain::Bill> getUnpaidBills() const = 0;

    virtual std::vector<domain::NetWorthSnapshot> getNetWorthHistory() const = 0;

    virtual domain::NetWorthTotals getNetWorth() const = 0;

    virtual domain::DebtPayoffSettings getDebtPayoffSettings() const = 0;

    /**
     * @brief Долги для планировщика погашения
     * 
     * Только долговые счета с отрицательным балансом.
     */
    virtual std::vector<domain::DebtInput> getDebtInputs() const = 0;
};

} // namespace finance::ports::input
