#pragma once

#include "AmountInput.hpp"
#include "enums/Frequency.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace budget::domain {

/**
 * @brief Новая запланированная транзакция
 */
struct ScheduledTransactionDraft {
    std::string accountId;
    std::string dateFirst;
    Frequency frequency = Frequency::NEVER;
    AmountInput amount;
    std::optional<std::string> payeeId;
    std::optional<std::string> payeeName;
    std::optional<std::string> categoryId;
    std::optional<std::string> memo;

    nlohmann::ordered_json toJson() const {
        nlohmann::ordered_json j;
        j["account_id"] = accountId;
        j["date"] = dateFirst;
        j["frequency"] = toString(frequency);
        j["amount"] = amount.toMilliunits();
        if (payeeId) j["payee_id"] = *payeeId;
        if (payeeName) j["payee_name"] = *payeeName;
        if (categoryId) j["category_id"] = *categoryId;
        if (memo) j["memo"] = *memo;
        return j;
    }
};

} // namespace budget::domain
