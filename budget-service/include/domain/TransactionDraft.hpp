#pragma once

#include "AmountInput.hpp"
#include "enums/ClearedStatus.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Новая транзакция (POST /budgets/{id}/transactions)
 *
 * Сумма обязательна: AmountInput собирается через exactlyOne().
 */
struct TransactionDraft {
    std::string accountId;
    std::string date;
    AmountInput amount;
    std::optional<std::string> payeeId;
    std::optional<std::string> payeeName;
    std::optional<std::string> categoryId;
    std::optional<std::string> memo;
    ClearedStatus cleared = ClearedStatus::UNCLEARED;
    bool approved = true;

    nlohmann::ordered_json toJson() const {
        nlohmann::ordered_json j;
        j["account_id"] = accountId;
        j["date"] = date;
        j["amount"] = amount.toMilliunits();
        if (payeeId) j["payee_id"] = *payeeId;
        if (payeeName) j["payee_name"] = *payeeName;
        if (categoryId) j["category_id"] = *categoryId;
        if (memo) j["memo"] = *memo;
        j["cleared"] = toString(cleared);
        j["approved"] = approved;
        return j;
    }
};

/**
 * @brief Частичное обновление транзакции (PUT /budgets/{id}/transactions/{tid})
 *
 * В запрос попадают только заданные поля; пустые идентификаторы
 * считаются незаданными, memo передаётся даже пустым.
 */
struct TransactionPatch {
    std::optional<std::string> accountId;
    std::optional<std::string> date;
    std::optional<AmountInput> amount;
    std::optional<std::string> payeeId;
    std::optional<std::string> payeeName;
    std::optional<std::string> categoryId;
    std::optional<std::string> memo;
    std::optional<ClearedStatus> cleared;
    std::optional<bool> approved;

    nlohmann::ordered_json toJson() const {
        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        if (accountId && !accountId->empty()) j["account_id"] = *accountId;
        if (date && !date->empty()) j["date"] = *date;
        if (amount) j["amount"] = amount->toMilliunits();
        if (payeeId && !payeeId->empty()) j["payee_id"] = *payeeId;
        if (payeeName && !payeeName->empty()) j["payee_name"] = *payeeName;
        if (categoryId && !categoryId->empty()) j["category_id"] = *categoryId;
        if (memo) j["memo"] = *memo;
        if (cleared) j["cleared"] = toString(*cleared);
        if (approved) j["approved"] = *approved;
        return j;
    }
};

} // namespace budget::domain
