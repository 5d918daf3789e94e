#pragma once

#include "Milliunits.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Коллекция транзакций с количеством и итоговой суммой
 *
 * totalMilliunits: сумма исходных целых значений amount, посчитанная
 * до перевода в строки. Элементы items уже преобразованы EntityTransformer.
 */
struct TransactionSummary {
    std::optional<std::string> query;   ///< Только для поиска
    int64_t totalMilliunits = 0;
    nlohmann::ordered_json items = nlohmann::ordered_json::array();

    size_t count() const { return items.size(); }

    std::string total() const { return Milliunits::toDisplay(totalMilliunits); }

    /**
     * @brief {query?, count, total_milliunits, total} без коллекции
     */
    nlohmann::ordered_json header() const {
        nlohmann::ordered_json j;
        if (query) {
            j["query"] = *query;
        }
        j["count"] = count();
        j["total_milliunits"] = totalMilliunits;
        j["total"] = total();
        return j;
    }

    /**
     * @brief Полный документ: заголовок + transactions
     */
    nlohmann::ordered_json document() const {
        auto j = header();
        j["transactions"] = items;
        return j;
    }
};

} // namespace budget::domain
