#pragma once

#include "domain/ToolRequests.hpp"
#include <string>

namespace budget::ports::input {

/**
 * @brief Интерфейс сервиса инструментов YNAB
 *
 * Каждый метод возвращает готовый текст ответа: markdown, JSON или
 * сообщение "Error: ...". Исключения наружу не выходят.
 */
class IBudgetToolService {
public:
    virtual ~IBudgetToolService() = default;

    // ============================================
    // БЮДЖЕТЫ И СЧЕТА
    // ============================================

    virtual std::string getBudgets(const domain::BudgetsRequest& request) = 0;

    virtual std::string getBudgetSummary(const domain::BudgetScopedRequest& request) = 0;

    virtual std::string getAccounts(const domain::BudgetScopedRequest& request) = 0;

    virtual std::string getAccount(const domain::EntityRequest& request) = 0;

    // ============================================
    // КАТЕГОРИИ И ПОЛУЧАТЕЛИ
    // ============================================

    virtual std::string getCategories(const domain::BudgetScopedRequest& request) = 0;

    virtual std::string getCategory(const domain::EntityRequest& request) = 0;

    /**
     * @brief Установить budgeted категории в месяце (ровно одна сумма)
     */
    virtual std::string updateCategoryBudget(const domain::UpdateCategoryBudgetRequest& request) = 0;

    virtual std::string getPayees(const domain::BudgetScopedRequest& request) = 0;

    // ============================================
    // ТРАНЗАКЦИИ
    // ============================================

    /**
     * @brief Транзакции с фильтром; по умолчанию результат пишется в файл
     */
    virtual std::string getTransactions(const domain::TransactionsRequest& request) = 0;

    virtual std::string getTransaction(const domain::EntityRequest& request) = 0;

    virtual std::string createTransaction(const domain::CreateTransactionRequest& request) = 0;

    /**
     * @brief Частичное обновление (не больше одной суммы)
     */
    virtual std::string updateTransaction(const domain::UpdateTransactionRequest& request) = 0;

    /**
     * @brief Поиск по payee_name или memo без учёта регистра
     */
    virtual std::string searchTransactions(const domain::SearchTransactionsRequest& request) = 0;

    // ============================================
    // МЕСЯЦЫ И ЗАПЛАНИРОВАННЫЕ ТРАНЗАКЦИИ
    // ============================================

    virtual std::string getMonthBudget(const domain::MonthBudgetRequest& request) = 0;

    virtual std::string getScheduledTransactions(const domain::BudgetScopedRequest& request) = 0;

    virtual std::string createScheduledTransaction(const domain::CreateScheduledTransactionRequest& request) = 0;
};

} // namespace budget::ports::input
