#pragma once

#include "TransactionQuery.hpp"
#include "enums/ClearedStatus.hpp"
#include "enums/Frequency.hpp"
#include "enums/ResponseFormat.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Параметры вызовов инструментов после разбора аргументов
 *
 * Строковые поля уже обрезаны и проверены; суммы остаются парой
 * optional-значений и проверяются сервисом через AmountInput.
 */

struct BudgetsRequest {
    bool includeAccounts = false;
    bool includeHidden = false;
    ResponseFormat format = ResponseFormat::MARKDOWN;
};

/**
 * @brief Запрос коллекции внутри бюджета (счета, категории, получатели, ...)
 */
struct BudgetScopedRequest {
    std::string budgetId;
    bool includeHidden = false;
    ResponseFormat format = ResponseFormat::MARKDOWN;
};

/**
 * @brief Запрос одной сущности бюджета по id
 */
struct EntityRequest {
    std::string budgetId;
    std::string entityId;
    ResponseFormat format = ResponseFormat::JSON;
};

struct MonthBudgetRequest {
    std::string budgetId;
    std::string month;
    bool includeHidden = false;
    ResponseFormat format = ResponseFormat::MARKDOWN;
};

struct UpdateCategoryBudgetRequest {
    std::string budgetId;
    std::string categoryId;
    std::string month;
    std::optional<int64_t> amountMilliunits;
    std::optional<double> amountDollars;
};

struct TransactionsRequest {
    std::string budgetId;
    std::optional<std::string> accountId;
    std::optional<std::string> categoryId;
    std::optional<std::string> payeeId;
    std::optional<std::string> sinceDate;
    OutputOptions output;
};

struct SearchTransactionsRequest {
    std::string budgetId;
    std::string query;
    std::optional<std::string> sinceDate;
    OutputOptions output;
};

struct CreateTransactionRequest {
    std::string budgetId;
    std::string accountId;
    std::string date;
    std::optional<int64_t> amountMilliunits;
    std::optional<double> amountDollars;
    std::optional<std::string> payeeId;
    std::optional<std::string> payeeName;
    std::optional<std::string> categoryId;
    std::optional<std::string> memo;
    ClearedStatus cleared = ClearedStatus::UNCLEARED;
    bool approved = true;
};

struct UpdateTransactionRequest {
    std::string budgetId;
    std::string transactionId;
    std::optional<std::string> accountId;
    std::optional<std::string> date;
    std::optional<int64_t> amountMilliunits;
    std::optional<double> amountDollars;
    std::optional<std::string> payeeId;
    std::optional<std::string> payeeName;
    std::optional<std::string> categoryId;
    std::optional<std::string> memo;
    std::optional<ClearedStatus> cleared;
    std::optional<bool> approved;
};

struct CreateScheduledTransactionRequest {
    std::string budgetId;
    std::string accountId;
    std::string dateFirst;
    Frequency frequency = Frequency::NEVER;
    std::optional<int64_t> amountMilliunits;
    std::optional<double> amountDollars;
    std::optional<std::string> payeeId;
    std::optional<std::string> payeeName;
    std::optional<std::string> categoryId;
    std::optional<std::string> memo;
};

} // namespace budget::domain
