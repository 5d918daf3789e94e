#pragma once

#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Откуда брать транзакции: весь бюджет или один счёт / категория / получатель
 */
enum class TransactionScope {
    BUDGET,
    ACCOUNT,
    CATEGORY,
    PAYEE
};

/**
 * @brief Выборка транзакций
 *
 * Если задано несколько фильтров, действует первый по приоритету:
 * account → category → payee.
 */
struct TransactionQuery {
    TransactionScope scope = TransactionScope::BUDGET;
    std::string scopeId;
    std::optional<std::string> sinceDate;

    static TransactionQuery fromFilters(
        const std::optional<std::string>& accountId,
        const std::optional<std::string>& categoryId,
        const std::optional<std::string>& payeeId,
        const std::optional<std::string>& sinceDate)
    {
        TransactionQuery query;
        query.sinceDate = sinceDate;
        if (accountId && !accountId->empty()) {
            query.scope = TransactionScope::ACCOUNT;
            query.scopeId = *accountId;
        } else if (categoryId && !categoryId->empty()) {
            query.scope = TransactionScope::CATEGORY;
            query.scopeId = *categoryId;
        } else if (payeeId && !payeeId->empty()) {
            query.scope = TransactionScope::PAYEE;
            query.scopeId = *payeeId;
        }
        return query;
    }
};

/**
 * @brief Куда и в каком объёме отдавать коллекцию транзакций
 */
struct OutputOptions {
    bool outputToFile = true;
    std::optional<std::string> outputPath;
    bool summaryOnly = false;
};

} // namespace budget::domain
