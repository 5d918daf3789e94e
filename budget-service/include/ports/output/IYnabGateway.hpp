#pragma once

#include "domain/Entity.hpp"
#include "domain/TransactionDraft.hpp"
#include "domain/ScheduledTransactionDraft.hpp"
#include "domain/TransactionQuery.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace budget::ports::output {

/**
 * @brief Интерфейс шлюза к YNAB API
 *
 * Каждый метод возвращает снимок сущностей за один вызов.
 * Ошибки YNAB приходят как domain::UpstreamError (статус + причина),
 * сетевые приходят как domain::TransportError.
 */
class IYnabGateway {
public:
    virtual ~IYnabGateway() = default;

    // ============================================
    // БЮДЖЕТЫ
    // ============================================

    /**
     * @brief Список бюджетов; при includeAccounts в каждом есть поле accounts
     */
    virtual std::vector<domain::Budget> listBudgets(bool includeAccounts) = 0;

    /**
     * @brief Полный бюджет: accounts, category_groups, categories, ...
     */
    virtual domain::Budget getBudget(const std::string& budgetId) = 0;

    // ============================================
    // СЧЕТА
    // ============================================

    virtual std::vector<domain::Account> listAccounts(const std::string& budgetId) = 0;

    virtual domain::Account getAccount(const std::string& budgetId, const std::string& accountId) = 0;

    // ============================================
    // КАТЕГОРИИ
    // ============================================

    /**
     * @brief Группы категорий, у каждой вложенный массив categories
     */
    virtual std::vector<domain::CategoryGroup> listCategories(const std::string& budgetId) = 0;

    virtual domain::Category getCategory(const std::string& budgetId, const std::string& categoryId) = 0;

    /**
     * @brief Установить сумму budgeted категории в месяце
     */
    virtual domain::Category updateCategoryMonthBudget(
        const std::string& budgetId,
        const std::string& month,
        const std::string& categoryId,
        int64_t budgetedMilliunits) = 0;

    // ============================================
    // ПОЛУЧАТЕЛИ
    // ============================================

    virtual std::vector<domain::Payee> listPayees(const std::string& budgetId) = 0;

    // ============================================
    // ТРАНЗАКЦИИ
    // ============================================

    virtual std::vector<domain::Transaction> listTransactions(
        const std::string& budgetId,
        const domain::TransactionQuery& query) = 0;

    virtual domain::Transaction getTransaction(const std::string& budgetId, const std::string& transactionId) = 0;

    virtual domain::Transaction createTransaction(
        const std::string& budgetId,
        const domain::TransactionDraft& draft) = 0;

    virtual domain::Transaction updateTransaction(
        const std::string& budgetId,
        const std::string& transactionId,
        const domain::TransactionPatch& patch) = 0;

    // ============================================
    // МЕСЯЦЫ И ЗАПЛАНИРОВАННЫЕ ТРАНЗАКЦИИ
    // ============================================

    virtual domain::MonthBudget getMonthBudget(const std::string& budgetId, const std::string& month) = 0;

    virtual std::vector<domain::ScheduledTransaction> listScheduledTransactions(const std::string& budgetId) = 0;

    virtual domain::ScheduledTransaction createScheduledTransaction(
        const std::string& budgetId,
        const domain::ScheduledTransactionDraft& draft) = 0;
};

} // namespace budget::ports::output
