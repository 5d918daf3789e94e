#pragma once

#include "ports/input/IBudgetToolService.hpp"
#include "ports/output/IYnabGateway.hpp"
#include "application/ErrorClassifier.hpp"
#include "application/ResultSpiller.hpp"
#include "domain/Failure.hpp"
#include "domain/TransactionSummary.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace budget::application {

/**
 * @brief Сервис инструментов YNAB
 *
 * Конвейер вызова: проверка сумм → IYnabGateway → EntityTransformer →
 * ResponseFormatter (в ответе) или ResultSpiller (в файл).
 * Любое исключение на любом шаге превращается в Failure и в текст
 * через ErrorClassifier.
 */
class BudgetToolService : public ports::input::IBudgetToolService {
public:
    BudgetToolService(
        std::shared_ptr<ports::output::IYnabGateway> gateway,
        std::shared_ptr<ResultSpiller> spiller
    ) : gateway_(std::move(gateway))
      , spiller_(std::move(spiller))
    {
        std::cout << "[BudgetToolService] Created" << std::endl;
    }

    std::string getBudgets(const domain::BudgetsRequest& request) override;
    std::string getBudgetSummary(const domain::BudgetScopedRequest& request) override;
    std::string getAccounts(const domain::BudgetScopedRequest& request) override;
    std::string getAccount(const domain::EntityRequest& request) override;
    std::string getCategories(const domain::BudgetScopedRequest& request) override;
    std::string getCategory(const domain::EntityRequest& request) override;
    std::string updateCategoryBudget(const domain::UpdateCategoryBudgetRequest& request) override;
    std::string getPayees(const domain::BudgetScopedRequest& request) override;
    std::string getTransactions(const domain::TransactionsRequest& request) override;
    std::string getTransaction(const domain::EntityRequest& request) override;
    std::string createTransaction(const domain::CreateTransactionRequest& request) override;
    std::string updateTransaction(const domain::UpdateTransactionRequest& request) override;
    std::string searchTransactions(const domain::SearchTransactionsRequest& request) override;
    std::string getMonthBudget(const domain::MonthBudgetRequest& request) override;
    std::string getScheduledTransactions(const domain::BudgetScopedRequest& request) override;
    std::string createScheduledTransaction(const domain::CreateScheduledTransactionRequest& request) override;

private:
    std::shared_ptr<ports::output::IYnabGateway> gateway_;
    std::shared_ptr<ResultSpiller> spiller_;

    /**
     * @brief Выполнить операцию; исключение → классифицированный текст ошибки
     */
    template <typename Fn>
    std::string guarded(const std::string& operation, Fn&& fn) {
        try {
            return fn();
        } catch (const std::exception& e) {
            auto failure = domain::Failure::fromException(std::current_exception());
            std::cerr << "[BudgetToolService] " << operation << " failed: " << e.what() << std::endl;
            return ErrorClassifier::classify(failure);
        }
    }

    /**
     * @brief Коллекция транзакций: только итог, в ответе или через файл
     */
    std::string deliver(
        const domain::TransactionSummary& summary,
        const domain::OutputOptions& output,
        const std::string& prefix) const;

    static domain::TransactionSummary summarize(
        const std::vector<domain::Transaction>& transactions,
        std::optional<std::string> query = std::nullopt);

    static std::string acknowledge(const std::string& key, nlohmann::ordered_json entity);

    // Регистронезависимое сравнение для UTF-8, не только ASCII
    static std::string foldCase(const std::string& s);
};

} // namespace budget::application
