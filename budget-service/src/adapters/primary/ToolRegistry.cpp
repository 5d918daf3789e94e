#include "adapters/primary/ToolRegistry.hpp"
#include "application/ErrorClassifier.hpp"
#include "domain/Failure.hpp"

#include <exception>
#include <iostream>

namespace budget::adapters::primary {

using nlohmann::json;
using domain::ResponseFormat;

namespace {

json prop(const std::string& type, const std::string& description) {
    return {{"type", type}, {"description", description}};
}

json idProp(const std::string& description) {
    return {{"type", "string"}, {"description", description}, {"minLength", 1}};
}

json dateProp(const std::string& description) {
    return {{"type", "string"}, {"description", description}, {"pattern", R"(^\d{4}-\d{2}-\d{2}$)"}};
}

json memoProp(const std::string& description) {
    return {{"type", "string"}, {"description", description}, {"maxLength", 200}};
}

json formatProp(ResponseFormat defaultFormat) {
    return {
        {"type", "string"},
        {"enum", {"markdown", "json"}},
        {"default", domain::toString(defaultFormat)},
        {"description", "Output format: 'markdown' or 'json'"}
    };
}

json schema(json properties, json required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

void addSpillOptions(json& properties) {
    properties["output_to_file"] = {
        {"type", "boolean"}, {"default", true},
        {"description", "Write results to file. Recommended for large results to avoid clogging context. "
                        "Set False only for small result sets."}
    };
    properties["output_path"] = prop("string",
        "Custom file path for output. If not set, writes to default location with timestamp.");
    properties["summary_only"] = {
        {"type", "boolean"}, {"default", false},
        {"description", "Return only count and total, without individual transactions. "
                        "Useful for quick aggregations."}
    };
}

domain::OutputOptions outputOptions(const ToolArguments& args) {
    domain::OutputOptions output;
    output.outputToFile = args.flag("output_to_file", true);
    output.outputPath = args.optionalText("output_path");
    output.summaryOnly = args.flag("summary_only", false);
    return output;
}

const char* BUDGET_ID = "The budget ID. Use 'last-used' to get the last accessed budget.";
const char* INCLUDE_HIDDEN = "Include hidden categories and closed accounts in markdown output";

} // namespace

// ============================================
// ToolDefinition
// ============================================

json ToolDefinition::toJson() const {
    return {
        {"name", name},
        {"title", title},
        {"description", description},
        {"inputSchema", inputSchema},
        {"annotations", {
            {"title", title},
            {"readOnlyHint", readOnly},
            {"destructiveHint", destructive},
            {"idempotentHint", idempotent},
            {"openWorldHint", openWorld}
        }}
    };
}

// ============================================
// ToolRegistry
// ============================================

ToolRegistry::ToolRegistry(std::shared_ptr<ports::input::IBudgetToolService> service)
    : service_(std::move(service))
{
    registerBudgetTools();
    registerCategoryTools();
    registerTransactionTools();
    registerScheduleTools();
    std::cout << "[ToolRegistry] Registered " << tools_.size() << " tools" << std::endl;
}

json ToolRegistry::catalog() const {
    json result = json::array();
    for (const auto& tool : tools_) {
        result.push_back(tool.toJson());
    }
    return result;
}

std::optional<std::string> ToolRegistry::call(const std::string& name, const json& arguments) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }

    try {
        ToolArguments args(arguments);
        return tools_[it->second].invoke(args);
    } catch (const std::exception& e) {
        std::cerr << "[ToolRegistry] " << name << " rejected: " << e.what() << std::endl;
        return application::ErrorClassifier::classify(domain::Failure::fromException(std::current_exception()));
    }
}

void ToolRegistry::add(ToolDefinition definition) {
    index_[definition.name] = tools_.size();
    tools_.push_back(std::move(definition));
}

// ============================================
// БЮДЖЕТЫ, СЧЕТА, ПОЛУЧАТЕЛИ
// ============================================

void ToolRegistry::registerBudgetTools() {
    add({
        "ynab_get_budgets",
        "List YNAB Budgets",
        "List all budgets the user has access to. Returns budget names and IDs. Use the budget_id in other tools.",
        true, false, true, true,
        schema({
            {"include_accounts", {{"type", "boolean"}, {"default", false},
                                  {"description", "Include account info in the response"}}},
            {"include_hidden", {{"type", "boolean"}, {"default", false}, {"description", INCLUDE_HIDDEN}}},
            {"response_format", formatProp(ResponseFormat::MARKDOWN)}
        }, json::array()),
        [this](const ToolArguments& args) {
            domain::BudgetsRequest request;
            request.includeAccounts = args.flag("include_accounts", false);
            request.includeHidden = args.flag("include_hidden", false);
            request.format = args.format(ResponseFormat::MARKDOWN);
            return service_->getBudgets(request);
        }
    });

    add({
        "ynab_get_budget_summary",
        "Get Budget Summary",
        "Get a summary of a budget including accounts and category groups. "
        "Returns a curated overview, not the full budget export.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID. Use 'last-used' for most recent.")},
            {"include_hidden", {{"type", "boolean"}, {"default", false}, {"description", INCLUDE_HIDDEN}}},
            {"response_format", formatProp(ResponseFormat::MARKDOWN)}
        }, {"budget_id"}),
        [this](const ToolArguments& args) {
            domain::BudgetScopedRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.includeHidden = args.flag("include_hidden", false);
            request.format = args.format(ResponseFormat::MARKDOWN);
            return service_->getBudgetSummary(request);
        }
    });

    add({
        "ynab_get_accounts",
        "List Accounts",
        "List all accounts in a budget with balances.",
        true, false, true, true,
        schema({
            {"budget_id", idProp(BUDGET_ID)},
            {"response_format", formatProp(ResponseFormat::MARKDOWN)}
        }, {"budget_id"}),
        [this](const ToolArguments& args) {
            domain::BudgetScopedRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.format = args.format(ResponseFormat::MARKDOWN);
            return service_->getAccounts(request);
        }
    });

    add({
        "ynab_get_account",
        "Get Single Account",
        "Get details for a single account.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"account_id", idProp("The account ID")},
            {"response_format", formatProp(ResponseFormat::JSON)}
        }, {"budget_id", "account_id"}),
        [this](const ToolArguments& args) {
            domain::EntityRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.entityId = args.requiredId("account_id");
            request.format = args.format(ResponseFormat::JSON);
            return service_->getAccount(request);
        }
    });

    add({
        "ynab_get_payees",
        "List Payees",
        "List all payees in a budget.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"response_format", formatProp(ResponseFormat::MARKDOWN)}
        }, {"budget_id"}),
        [this](const ToolArguments& args) {
            domain::BudgetScopedRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.format = args.format(ResponseFormat::MARKDOWN);
            return service_->getPayees(request);
        }
    });
}

// ============================================
// КАТЕГОРИИ И МЕСЯЦЫ
// ============================================

void ToolRegistry::registerCategoryTools() {
    add({
        "ynab_get_categories",
        "List Categories",
        "List all categories in a budget grouped by category group.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"include_hidden", {{"type", "boolean"}, {"default", false}, {"description", INCLUDE_HIDDEN}}},
            {"response_format", formatProp(ResponseFormat::MARKDOWN)}
        }, {"budget_id"}),
        [this](const ToolArguments& args) {
            domain::BudgetScopedRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.includeHidden = args.flag("include_hidden", false);
            request.format = args.format(ResponseFormat::MARKDOWN);
            return service_->getCategories(request);
        }
    });

    add({
        "ynab_get_category",
        "Get Single Category",
        "Get details for a single category including goal info.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"category_id", idProp("The category ID")},
            {"response_format", formatProp(ResponseFormat::JSON)}
        }, {"budget_id", "category_id"}),
        [this](const ToolArguments& args) {
            domain::EntityRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.entityId = args.requiredId("category_id");
            request.format = args.format(ResponseFormat::JSON);
            return service_->getCategory(request);
        }
    });

    add({
        "ynab_update_category_budget",
        "Update Category Budget",
        "Update the budgeted amount for a category in a specific month.",
        false, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"category_id", idProp("The category ID")},
            {"month", dateProp("The budget month in ISO format (YYYY-MM-DD, use first of month)")},
            {"amount_milliunits", prop("integer",
                "RECOMMENDED. Budgeted amount in milliunits (1000 = $1.00). Mutually exclusive with amount_dollars.")},
            {"amount_dollars", prop("number",
                "Budgeted amount in dollars. Mutually exclusive with amount_milliunits. "
                "Use amount_milliunits for precision.")}
        }, {"budget_id", "category_id", "month"}),
        [this](const ToolArguments& args) {
            domain::UpdateCategoryBudgetRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.categoryId = args.requiredId("category_id");
            request.month = args.requiredDate("month");
            request.amountMilliunits = args.optionalInteger("amount_milliunits");
            request.amountDollars = args.optionalNumber("amount_dollars");
            return service_->updateCategoryBudget(request);
        }
    });

    add({
        "ynab_get_month_budget",
        "Get Month Budget",
        "Get budget details for a specific month including category allocations and activity.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"month", dateProp("The budget month (YYYY-MM-DD, use first of month)")},
            {"include_hidden", {{"type", "boolean"}, {"default", false}, {"description", INCLUDE_HIDDEN}}},
            {"response_format", formatProp(ResponseFormat::MARKDOWN)}
        }, {"budget_id", "month"}),
        [this](const ToolArguments& args) {
            domain::MonthBudgetRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.month = args.requiredDate("month");
            request.includeHidden = args.flag("include_hidden", false);
            request.format = args.format(ResponseFormat::MARKDOWN);
            return service_->getMonthBudget(request);
        }
    });
}

// ============================================
// ТРАНЗАКЦИИ
// ============================================

void ToolRegistry::registerTransactionTools() {
    json listProperties = {
        {"budget_id", idProp("The budget ID")},
        {"account_id", prop("string", "Filter by account ID")},
        {"category_id", prop("string", "Filter by category ID")},
        {"payee_id", prop("string", "Filter by payee ID")},
        {"since_date", dateProp("Only return transactions on or after this date (YYYY-MM-DD)")}
    };
    addSpillOptions(listProperties);

    add({
        "ynab_get_transactions",
        "Get Transactions",
        "Get transactions from a budget with optional filters. Can return large amounts of data. "
        "Defaults to file output to avoid clogging context. Use since_date and filters to limit results.",
        true, false, true, true,
        schema(listProperties, {"budget_id"}),
        [this](const ToolArguments& args) {
            domain::TransactionsRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.accountId = args.optionalText("account_id");
            request.categoryId = args.optionalText("category_id");
            request.payeeId = args.optionalText("payee_id");
            request.sinceDate = args.optionalDate("since_date");
            request.output = outputOptions(args);
            return service_->getTransactions(request);
        }
    });

    add({
        "ynab_get_transaction",
        "Get Single Transaction",
        "Get details for a single transaction.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"transaction_id", idProp("The transaction ID")},
            {"response_format", formatProp(ResponseFormat::JSON)}
        }, {"budget_id", "transaction_id"}),
        [this](const ToolArguments& args) {
            domain::EntityRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.entityId = args.requiredId("transaction_id");
            request.format = args.format(ResponseFormat::JSON);
            return service_->getTransaction(request);
        }
    });

    add({
        "ynab_create_transaction",
        "Create Transaction",
        "Create a new transaction in YNAB.",
        false, false, false, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"account_id", idProp("The account ID for this transaction")},
            {"date", dateProp("Transaction date in ISO format (YYYY-MM-DD)")},
            {"amount_milliunits", prop("integer",
                "RECOMMENDED. Amount in milliunits (1000 = $1.00). Negative = outflow, positive = inflow. "
                "Mutually exclusive with amount_dollars.")},
            {"amount_dollars", prop("number",
                "Amount in dollars. Negative = outflow, positive = inflow. Mutually exclusive with "
                "amount_milliunits. Use amount_milliunits for precision.")},
            {"payee_id", prop("string", "The payee ID")},
            {"payee_name", prop("string", "Payee name (creates new payee if doesn't exist)")},
            {"category_id", prop("string", "The category ID")},
            {"memo", memoProp("Transaction memo")},
            {"cleared", {{"type", "string"}, {"enum", {"cleared", "uncleared", "reconciled"}},
                         {"default", "uncleared"},
                         {"description", "Cleared status: 'cleared', 'uncleared', or 'reconciled'"}}},
            {"approved", {{"type", "boolean"}, {"default", true},
                          {"description", "Whether the transaction is approved"}}}
        }, {"budget_id", "account_id", "date"}),
        [this](const ToolArguments& args) {
            domain::CreateTransactionRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.accountId = args.requiredId("account_id");
            request.date = args.requiredDate("date");
            request.amountMilliunits = args.optionalInteger("amount_milliunits");
            request.amountDollars = args.optionalNumber("amount_dollars");
            request.payeeId = args.optionalText("payee_id");
            request.payeeName = args.optionalText("payee_name");
            request.categoryId = args.optionalText("category_id");
            request.memo = args.memo();
            request.cleared = args.cleared().value_or(domain::ClearedStatus::UNCLEARED);
            request.approved = args.flag("approved", true);
            return service_->createTransaction(request);
        }
    });

    add({
        "ynab_update_transaction",
        "Update Transaction",
        "Update an existing transaction.",
        false, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"transaction_id", idProp("The transaction ID to update")},
            {"account_id", prop("string", "Move to different account")},
            {"date", dateProp("New date in ISO format (YYYY-MM-DD)")},
            {"amount_milliunits", prop("integer",
                "RECOMMENDED. New amount in milliunits. Mutually exclusive with amount_dollars.")},
            {"amount_dollars", prop("number",
                "New amount in dollars. Mutually exclusive with amount_milliunits.")},
            {"payee_id", prop("string", "New payee ID")},
            {"payee_name", prop("string", "New payee name")},
            {"category_id", prop("string", "New category ID")},
            {"memo", memoProp("New memo")},
            {"cleared", {{"type", "string"}, {"enum", {"cleared", "uncleared", "reconciled"}},
                         {"description", "New cleared status"}}},
            {"approved", prop("boolean", "New approved status")}
        }, {"budget_id", "transaction_id"}),
        [this](const ToolArguments& args) {
            domain::UpdateTransactionRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.transactionId = args.requiredId("transaction_id");
            request.accountId = args.optionalText("account_id");
            request.date = args.optionalDate("date");
            request.amountMilliunits = args.optionalInteger("amount_milliunits");
            request.amountDollars = args.optionalNumber("amount_dollars");
            request.payeeId = args.optionalText("payee_id");
            request.payeeName = args.optionalText("payee_name");
            request.categoryId = args.optionalText("category_id");
            request.memo = args.memo();
            request.cleared = args.cleared();
            request.approved = args.optionalFlag("approved");
            return service_->updateTransaction(request);
        }
    });

    json searchProperties = {
        {"budget_id", idProp("The budget ID")},
        {"query", {{"type", "string"}, {"minLength", 1},
                   {"description", "Search query to match against payee name or memo"}}},
        {"since_date", dateProp("Only search transactions on or after this date (YYYY-MM-DD)")}
    };
    addSpillOptions(searchProperties);

    add({
        "ynab_search_transactions",
        "Search Transactions",
        "Search transactions by payee name or memo. Fetches transactions and filters locally. "
        "Use since_date to limit scope.",
        true, false, true, true,
        schema(searchProperties, {"budget_id", "query"}),
        [this](const ToolArguments& args) {
            domain::SearchTransactionsRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.query = args.requiredText("query");
            request.sinceDate = args.optionalDate("since_date");
            request.output = outputOptions(args);
            return service_->searchTransactions(request);
        }
    });
}

// ============================================
// ЗАПЛАНИРОВАННЫЕ ТРАНЗАКЦИИ
// ============================================

void ToolRegistry::registerScheduleTools() {
    add({
        "ynab_get_scheduled_transactions",
        "List Scheduled Transactions",
        "List all scheduled (recurring) transactions in a budget.",
        true, false, true, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"response_format", formatProp(ResponseFormat::MARKDOWN)}
        }, {"budget_id"}),
        [this](const ToolArguments& args) {
            domain::BudgetScopedRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.format = args.format(ResponseFormat::MARKDOWN);
            return service_->getScheduledTransactions(request);
        }
    });

    add({
        "ynab_create_scheduled_transaction",
        "Create Scheduled Transaction",
        "Create a new scheduled (recurring) transaction.",
        false, false, false, true,
        schema({
            {"budget_id", idProp("The budget ID")},
            {"account_id", idProp("The account ID")},
            {"date_first", dateProp("First occurrence date (YYYY-MM-DD)")},
            {"frequency", {{"type", "string"},
                           {"enum", {"never", "daily", "weekly", "everyOtherWeek", "twiceAMonth", "every4Weeks",
                                     "monthly", "everyOtherMonth", "every3Months", "every4Months",
                                     "twiceAYear", "yearly", "everyOtherYear"}},
                           {"description", "How often the transaction repeats"}}},
            {"amount_milliunits", prop("integer",
                "RECOMMENDED. Amount in milliunits. Mutually exclusive with amount_dollars.")},
            {"amount_dollars", prop("number", "Amount in dollars. Mutually exclusive with amount_milliunits.")},
            {"payee_id", prop("string", "The payee ID")},
            {"payee_name", prop("string", "Payee name")},
            {"category_id", prop("string", "The category ID")},
            {"memo", memoProp("Memo")}
        }, {"budget_id", "account_id", "date_first", "frequency"}),
        [this](const ToolArguments& args) {
            domain::CreateScheduledTransactionRequest request;
            request.budgetId = args.requiredId("budget_id");
            request.accountId = args.requiredId("account_id");
            request.dateFirst = args.requiredDate("date_first");
            request.frequency = args.frequency();
            request.amountMilliunits = args.optionalInteger("amount_milliunits");
            request.amountDollars = args.optionalNumber("amount_dollars");
            request.payeeId = args.optionalText("payee_id");
            request.payeeName = args.optionalText("payee_name");
            request.categoryId = args.optionalText("category_id");
            request.memo = args.memo();
            return service_->createScheduledTransaction(request);
        }
    });
}

} // namespace budget::adapters::primary
