#include "application/ResponseFormatter.hpp"

#include <vector>

namespace budget::application {

using domain::RenderedResult;
using domain::ResponseFormat;
using nlohmann::ordered_json;

namespace {

const ordered_json& arrayOf(const ordered_json& parent, const std::string& key) {
    static const ordered_json empty = ordered_json::array();
    auto it = parent.find(key);
    if (it == parent.end() || !it->is_array()) {
        return empty;
    }
    return *it;
}

const ordered_json& items(const ordered_json& collection) {
    static const ordered_json empty = ordered_json::array();
    return collection.is_array() ? collection : empty;
}

} // namespace

// ============================================
// БЮДЖЕТЫ
// ============================================

RenderedResult ResponseFormatter::budgets(
    const ordered_json& budgets, ResponseFormat format, const RenderOptions& options)
{
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(budgets);
    }

    std::vector<std::string> lines = {"# YNAB Budgets", ""};
    for (const auto& b : items(budgets)) {
        lines.push_back("## " + field(b, "name"));
        lines.push_back("- **ID**: `" + field(b, "id") + "`");
        if (!field(b, "last_modified_on").empty()) {
            lines.push_back("- **Last Modified**: " + field(b, "last_modified_on"));
        }
        const auto& accounts = arrayOf(b, "accounts");
        if (options.includeAccounts && !accounts.empty()) {
            lines.push_back("- **Accounts**:");
            for (const auto& acc : accounts) {
                if (flag(acc, "closed") && !options.includeHidden) {
                    continue;
                }
                lines.push_back("  - " + field(acc, "name") + ": " + field(acc, "balance"));
            }
        }
        lines.push_back("");
    }
    return RenderedResult::markdown(std::move(lines));
}

RenderedResult ResponseFormatter::budgetSummary(
    const ordered_json& summary, ResponseFormat format, const RenderOptions& options)
{
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(summary);
    }

    std::vector<std::string> lines = {"# Budget: " + field(summary, "name"), ""};
    lines.push_back("**ID**: `" + field(summary, "id") + "`");
    if (!field(summary, "last_modified_on").empty()) {
        lines.push_back("**Last Modified**: " + field(summary, "last_modified_on"));
    }
    lines.push_back("");

    lines.push_back("## Accounts");
    for (const auto& acc : arrayOf(summary, "accounts")) {
        bool closed = flag(acc, "closed");
        if (closed && !options.includeHidden) {
            continue;
        }
        lines.push_back("- **" + field(acc, "name") + "**" + (closed ? " (closed)" : "") + ": "
            + field(acc, "balance") + " (cleared: " + field(acc, "cleared_balance") + ")");
    }
    lines.push_back("");

    lines.push_back("## Category Groups");
    for (const auto& group : arrayOf(summary, "category_groups")) {
        if (flag(group, "hidden") && !options.includeHidden) {
            continue;
        }
        lines.push_back("### " + field(group, "name"));
        for (const auto& cat : arrayOf(group, "categories")) {
            if (flag(cat, "hidden") && !options.includeHidden) {
                continue;
            }
            lines.push_back("  - " + field(cat, "name"));
        }
        lines.push_back("");
    }

    return RenderedResult::markdown(std::move(lines));
}

// ============================================
// СЧЕТА
// ============================================

RenderedResult ResponseFormatter::accounts(const ordered_json& accounts, ResponseFormat format) {
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(accounts);
    }

    std::vector<std::string> lines = {"# Accounts", ""};
    for (const auto& acc : items(accounts)) {
        std::string status = flag(acc, "closed") ? " (closed)" : "";
        std::string onBudget = flag(acc, "on_budget") ? "on-budget" : "off-budget";
        lines.push_back("## " + field(acc, "name") + status);
        lines.push_back("- **ID**: `" + field(acc, "id") + "`");
        lines.push_back("- **Type**: " + field(acc, "type", "unknown") + " (" + onBudget + ")");
        lines.push_back("- **Balance**: " + field(acc, "balance"));
        lines.push_back("- **Cleared**: " + field(acc, "cleared_balance"));
        lines.push_back("- **Uncleared**: " + field(acc, "uncleared_balance"));
        lines.push_back("");
    }
    return RenderedResult::markdown(std::move(lines));
}

RenderedResult ResponseFormatter::account(const ordered_json& account, ResponseFormat format) {
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(account);
    }

    std::vector<std::string> lines = {"# " + field(account, "name"), ""};
    lines.push_back("**ID**: `" + field(account, "id") + "`");
    lines.push_back("**Type**: " + field(account, "type", "unknown"));
    lines.push_back(std::string("**On Budget**: ") + (flag(account, "on_budget") ? "Yes" : "No"));
    lines.push_back(std::string("**Closed**: ") + (flag(account, "closed") ? "Yes" : "No"));
    lines.push_back("");
    lines.push_back("## Balances");
    lines.push_back("- **Balance**: " + field(account, "balance"));
    lines.push_back("- **Cleared**: " + field(account, "cleared_balance"));
    lines.push_back("- **Uncleared**: " + field(account, "uncleared_balance"));
    return RenderedResult::markdown(std::move(lines));
}

// ============================================
// КАТЕГОРИИ
// ============================================

RenderedResult ResponseFormatter::categories(
    const ordered_json& groups, ResponseFormat format, const RenderOptions& options)
{
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(groups);
    }

    std::vector<std::string> lines = {"# Categories", ""};
    for (const auto& group : items(groups)) {
        if (flag(group, "hidden") && !options.includeHidden) {
            continue;
        }
        lines.push_back("## " + field(group, "name"));
        for (const auto& cat : arrayOf(group, "categories")) {
            if (flag(cat, "hidden") && !options.includeHidden) {
                continue;
            }
            lines.push_back("- **" + field(cat, "name") + "** (`" + field(cat, "id") + "`)");
            lines.push_back("  - Budgeted: " + field(cat, "budgeted")
                + " | Activity: " + field(cat, "activity")
                + " | Balance: " + field(cat, "balance"));
        }
        lines.push_back("");
    }
    return RenderedResult::markdown(std::move(lines));
}

RenderedResult ResponseFormatter::category(const ordered_json& category, ResponseFormat format) {
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(category);
    }

    std::vector<std::string> lines = {"# " + field(category, "name"), ""};
    lines.push_back("**ID**: `" + field(category, "id") + "`");
    lines.push_back("**Budgeted**: " + field(category, "budgeted"));
    lines.push_back("**Activity**: " + field(category, "activity"));
    lines.push_back("**Balance**: " + field(category, "balance"));
    if (!field(category, "goal_type").empty()) {
        lines.push_back("");
        lines.push_back("## Goal");
        lines.push_back("- Type: " + field(category, "goal_type"));
        if (present(category, "goal_target")) {
            lines.push_back("- Target: " + field(category, "goal_target"));
        }
        if (present(category, "goal_percentage_complete")) {
            lines.push_back("- Progress: " + field(category, "goal_percentage_complete") + "%");
        }
    }
    return RenderedResult::markdown(std::move(lines));
}

// ============================================
// ПОЛУЧАТЕЛИ И ТРАНЗАКЦИИ
// ============================================

RenderedResult ResponseFormatter::payees(const ordered_json& payees, ResponseFormat format) {
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(payees);
    }

    std::vector<std::string> lines = {"# Payees", ""};
    for (const auto& p : items(payees)) {
        lines.push_back("- **" + field(p, "name") + "** (`" + field(p, "id") + "`)");
    }
    return RenderedResult::markdown(std::move(lines));
}

RenderedResult ResponseFormatter::transaction(const ordered_json& transaction, ResponseFormat format) {
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(transaction);
    }

    std::vector<std::string> lines = {"# Transaction: " + field(transaction, "date"), ""};
    lines.push_back("**ID**: `" + field(transaction, "id") + "`");
    lines.push_back("**Amount**: " + field(transaction, "amount"));
    lines.push_back("**Payee**: " + field(transaction, "payee_name", "Unknown Payee"));
    lines.push_back("**Category**: " + field(transaction, "category_name", "Uncategorized"));
    lines.push_back("**Account**: " + field(transaction, "account_name"));
    lines.push_back("**Cleared**: " + field(transaction, "cleared"));
    lines.push_back(std::string("**Approved**: ") + (flag(transaction, "approved") ? "Yes" : "No"));
    if (!field(transaction, "memo").empty()) {
        lines.push_back("**Memo**: " + field(transaction, "memo"));
    }
    return RenderedResult::markdown(std::move(lines));
}

RenderedResult ResponseFormatter::scheduledTransactions(const ordered_json& transactions, ResponseFormat format) {
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(transactions);
    }

    std::vector<std::string> lines = {"# Scheduled Transactions", ""};
    for (const auto& t : items(transactions)) {
        lines.push_back("## " + field(t, "payee_name", "Unknown Payee"));
        lines.push_back("- **ID**: `" + field(t, "id") + "`");
        lines.push_back("- **Amount**: " + field(t, "amount"));
        lines.push_back("- **Frequency**: " + field(t, "frequency", "unknown"));
        lines.push_back("- **Next Date**: " + field(t, "date_next", "unknown"));
        if (!field(t, "memo").empty()) {
            lines.push_back("- **Memo**: " + field(t, "memo"));
        }
        lines.push_back("");
    }
    return RenderedResult::markdown(std::move(lines));
}

// ============================================
// МЕСЯЦ
// ============================================

RenderedResult ResponseFormatter::monthBudget(
    const ordered_json& month, ResponseFormat format, const RenderOptions& options)
{
    if (format == ResponseFormat::JSON) {
        return RenderedResult::structured(month);
    }

    std::vector<std::string> lines = {"# Budget: " + field(month, "month"), ""};
    lines.push_back("**Income**: " + field(month, "income"));
    lines.push_back("**Budgeted**: " + field(month, "budgeted"));
    lines.push_back("**Activity**: " + field(month, "activity"));
    lines.push_back("**To Be Budgeted**: " + field(month, "to_be_budgeted"));
    auto ageOfMoney = month.find("age_of_money");
    if (ageOfMoney != month.end() && ageOfMoney->is_number() && ageOfMoney->get<double>() != 0) {
        lines.push_back("**Age of Money**: " + field(month, "age_of_money") + " days");
    }
    lines.push_back("");

    lines.push_back("## Categories");
    for (const auto& cat : arrayOf(month, "categories")) {
        if (flag(cat, "hidden") && !options.includeHidden) {
            continue;
        }
        lines.push_back("### " + field(cat, "name"));
        lines.push_back("- Budgeted: " + field(cat, "budgeted"));
        lines.push_back("- Activity: " + field(cat, "activity"));
        lines.push_back("- Balance: " + field(cat, "balance"));
        lines.push_back("");
    }

    return RenderedResult::markdown(std::move(lines));
}

// ============================================
// ХЕЛПЕРЫ
// ============================================

std::string ResponseFormatter::field(
    const ordered_json& entity, const std::string& key, const std::string& fallback)
{
    if (!entity.is_object()) {
        return fallback;
    }
    auto it = entity.find(key);
    if (it == entity.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump(-1, ' ', false, ordered_json::error_handler_t::replace);
}

bool ResponseFormatter::flag(const ordered_json& entity, const std::string& key) {
    if (!entity.is_object()) {
        return false;
    }
    auto it = entity.find(key);
    return it != entity.end() && it->is_boolean() && it->get<bool>();
}

bool ResponseFormatter::present(const ordered_json& entity, const std::string& key) {
    if (!entity.is_object()) {
        return false;
    }
    auto it = entity.find(key);
    return it != entity.end() && !it->is_null();
}

} // namespace budget::application
