#pragma once

#include "domain/RenderedResult.hpp"
#include "domain/enums/ResponseFormat.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace budget::application {

/**
 * @brief Что показывать в markdown
 */
struct RenderOptions {
    bool includeHidden = false;
    bool includeAccounts = false;
};

/**
 * @brief Рендеринг преобразованных данных в markdown или JSON
 *
 * На вход подаётся результат EntityTransformer (суммы уже строками).
 * JSON: документ целиком, ничего не пропускается.
 * Markdown: фиксированная раскладка на каждый вид; скрытые группы и
 * категории, закрытые счета внутри бюджета пропускаются, пока не
 * запрошен includeHidden.
 */
class ResponseFormatter {
public:
    static domain::RenderedResult budgets(
        const nlohmann::ordered_json& budgets, domain::ResponseFormat format, const RenderOptions& options = {});

    static domain::RenderedResult budgetSummary(
        const nlohmann::ordered_json& summary, domain::ResponseFormat format, const RenderOptions& options = {});

    static domain::RenderedResult accounts(const nlohmann::ordered_json& accounts, domain::ResponseFormat format);

    static domain::RenderedResult account(const nlohmann::ordered_json& account, domain::ResponseFormat format);

    static domain::RenderedResult categories(
        const nlohmann::ordered_json& groups, domain::ResponseFormat format, const RenderOptions& options = {});

    static domain::RenderedResult category(const nlohmann::ordered_json& category, domain::ResponseFormat format);

    static domain::RenderedResult payees(const nlohmann::ordered_json& payees, domain::ResponseFormat format);

    static domain::RenderedResult transaction(const nlohmann::ordered_json& transaction, domain::ResponseFormat format);

    static domain::RenderedResult monthBudget(
        const nlohmann::ordered_json& month, domain::ResponseFormat format, const RenderOptions& options = {});

    static domain::RenderedResult scheduledTransactions(
        const nlohmann::ordered_json& transactions, domain::ResponseFormat format);

private:
    /**
     * @brief Значение поля для вывода; fallback если поля нет или оно null
     */
    static std::string field(
        const nlohmann::ordered_json& entity, const std::string& key, const std::string& fallback = "");

    static bool flag(const nlohmann::ordered_json& entity, const std::string& key);

    static bool present(const nlohmann::ordered_json& entity, const std::string& key);
};

} // namespace budget::application
