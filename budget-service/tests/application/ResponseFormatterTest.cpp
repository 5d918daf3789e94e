#include <gtest/gtest.h>

#include "application/ResponseFormatter.hpp"
#include <nlohmann/json.hpp>

using namespace budget;
using namespace budget::application;
using domain::ResponseFormat;
using nlohmann::ordered_json;

namespace {

bool containsLine(const std::string& text, const std::string& line) {
    return ("\n" + text + "\n").find("\n" + line + "\n") != std::string::npos;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class ResponseFormatterTest : public ::testing::Test {
protected:
    ordered_json categoryGroups() {
        return ordered_json::parse(R"([
            {"id": "g1", "name": "Bills", "hidden": false, "categories": [
                {"id": "c1", "name": "Rent", "hidden": false, "budgeted": "$1,500.00", "activity": "-$1,500.00", "balance": "$0.00"},
                {"id": "c2", "name": "Old Gym", "hidden": true, "budgeted": "$0.00", "activity": "$0.00", "balance": "$0.00"}
            ]},
            {"id": "g2", "name": "Hidden Group", "hidden": true, "categories": [
                {"id": "c3", "name": "Secret", "hidden": false, "budgeted": "$1.00", "activity": "$0.00", "balance": "$1.00"}
            ]}
        ])");
    }

    ordered_json budgetSummary() {
        return ordered_json::parse(R"({
            "id": "b1", "name": "Home", "last_modified_on": "2024-01-31",
            "currency_format": null,
            "accounts": [
                {"id": "a1", "name": "Checking", "closed": false, "balance": "$100.00", "cleared_balance": "$90.00"},
                {"id": "a2", "name": "Old Card", "closed": true, "balance": "$0.00", "cleared_balance": "$0.00"}
            ],
            "category_groups": [
                {"id": "g1", "name": "Bills", "hidden": false, "categories": [
                    {"id": "c1", "name": "Rent", "hidden": false},
                    {"id": "c2", "name": "Archived", "hidden": true}
                ]},
                {"id": "g2", "name": "Internal", "hidden": true, "categories": []}
            ]
        })");
    }
};

// ============================================================================
// ТЕСТЫ: JSON
// ============================================================================

TEST_F(ResponseFormatterTest, Json_NeverOmitsHidden) {
    auto groups = categoryGroups();

    auto result = ResponseFormatter::categories(groups, ResponseFormat::JSON);
    auto parsed = ordered_json::parse(result.text());

    EXPECT_EQ(result.format, ResponseFormat::JSON);
    EXPECT_EQ(parsed, groups);
}

TEST_F(ResponseFormatterTest, Json_UsesTwoSpaceIndent) {
    auto result = ResponseFormatter::transaction(ordered_json::parse(R"({"id": "t1"})"), ResponseFormat::JSON);

    EXPECT_EQ(result.text(), "{\n  \"id\": \"t1\"\n}");
}

// ============================================================================
// ТЕСТЫ: Markdown
// ============================================================================

TEST_F(ResponseFormatterTest, Categories_Markdown_OmitsHiddenByDefault) {
    auto text = ResponseFormatter::categories(categoryGroups(), ResponseFormat::MARKDOWN).text();

    EXPECT_TRUE(containsLine(text, "# Categories"));
    EXPECT_TRUE(containsLine(text, "## Bills"));
    EXPECT_TRUE(containsLine(text, "- **Rent** (`c1`)"));
    EXPECT_TRUE(containsLine(text, "  - Budgeted: $1,500.00 | Activity: -$1,500.00 | Balance: $0.00"));
    EXPECT_EQ(text.find("Old Gym"), std::string::npos);
    EXPECT_EQ(text.find("Hidden Group"), std::string::npos);
    EXPECT_EQ(text.find("Secret"), std::string::npos);
}

TEST_F(ResponseFormatterTest, Categories_Markdown_IncludeHidden) {
    RenderOptions options;
    options.includeHidden = true;

    auto text = ResponseFormatter::categories(categoryGroups(), ResponseFormat::MARKDOWN, options).text();

    EXPECT_NE(text.find("Old Gym"), std::string::npos);
    EXPECT_TRUE(containsLine(text, "## Hidden Group"));
    EXPECT_NE(text.find("Secret"), std::string::npos);
}

TEST_F(ResponseFormatterTest, BudgetSummary_Markdown_Layout) {
    auto text = ResponseFormatter::budgetSummary(budgetSummary(), ResponseFormat::MARKDOWN).text();

    EXPECT_EQ(text.rfind("# Budget: Home\n\n**ID**: `b1`\n**Last Modified**: 2024-01-31\n", 0), 0u);
    EXPECT_TRUE(containsLine(text, "## Accounts"));
    EXPECT_TRUE(containsLine(text, "- **Checking**: $100.00 (cleared: $90.00)"));
    EXPECT_EQ(text.find("Old Card"), std::string::npos);
    EXPECT_TRUE(containsLine(text, "### Bills"));
    EXPECT_TRUE(containsLine(text, "  - Rent"));
    EXPECT_EQ(text.find("Archived"), std::string::npos);
    EXPECT_EQ(text.find("Internal"), std::string::npos);
}

TEST_F(ResponseFormatterTest, BudgetSummary_Markdown_IncludeHiddenMarksClosed) {
    RenderOptions options;
    options.includeHidden = true;

    auto text = ResponseFormatter::budgetSummary(budgetSummary(), ResponseFormat::MARKDOWN, options).text();

    EXPECT_TRUE(containsLine(text, "- **Old Card** (closed): $0.00 (cleared: $0.00)"));
    EXPECT_TRUE(containsLine(text, "  - Archived"));
    EXPECT_TRUE(containsLine(text, "### Internal"));
}

TEST_F(ResponseFormatterTest, Budgets_Markdown_WithAccounts) {
    auto budgets = ordered_json::parse(R"([
        {"id": "b1", "name": "Home", "last_modified_on": "2024-01-31", "accounts": [
            {"name": "Cash", "balance": "$7.00", "closed": false},
            {"name": "Closed Card", "balance": "$0.00", "closed": true}
        ]},
        {"id": "b2", "name": "Work"}
    ])");
    RenderOptions options;
    options.includeAccounts = true;

    auto text = ResponseFormatter::budgets(budgets, ResponseFormat::MARKDOWN, options).text();

    EXPECT_EQ(text,
        "# YNAB Budgets\n"
        "\n"
        "## Home\n"
        "- **ID**: `b1`\n"
        "- **Last Modified**: 2024-01-31\n"
        "- **Accounts**:\n"
        "  - Cash: $7.00\n"
        "\n"
        "## Work\n"
        "- **ID**: `b2`\n");
}

TEST_F(ResponseFormatterTest, Accounts_Markdown_ShowsClosedMarker) {
    auto accounts = ordered_json::parse(R"([
        {"id": "a1", "name": "Card", "type": "creditCard", "on_budget": true, "closed": true,
         "balance": "-$50.00", "cleared_balance": "-$50.00", "uncleared_balance": "$0.00"}
    ])");

    auto text = ResponseFormatter::accounts(accounts, ResponseFormat::MARKDOWN).text();

    EXPECT_TRUE(containsLine(text, "## Card (closed)"));
    EXPECT_TRUE(containsLine(text, "- **Type**: creditCard (on-budget)"));
    EXPECT_TRUE(containsLine(text, "- **Balance**: -$50.00"));
}

TEST_F(ResponseFormatterTest, Account_Markdown_MissingTypeFallsBack) {
    auto account = ordered_json::parse(R"({
        "id": "a1", "name": "Cash", "on_budget": false, "closed": false,
        "balance": "$1.00", "cleared_balance": "$1.00", "uncleared_balance": "$0.00"
    })");

    auto text = ResponseFormatter::account(account, ResponseFormat::MARKDOWN).text();

    EXPECT_TRUE(containsLine(text, "# Cash"));
    EXPECT_TRUE(containsLine(text, "**Type**: unknown"));
    EXPECT_TRUE(containsLine(text, "**On Budget**: No"));
    EXPECT_TRUE(containsLine(text, "## Balances"));
}

TEST_F(ResponseFormatterTest, Category_Markdown_GoalSection) {
    auto category = ordered_json::parse(R"({
        "id": "c1", "name": "Vacation", "budgeted": "$100.00", "activity": "$0.00", "balance": "$400.00",
        "goal_type": "TB", "goal_target": "$1,000.00", "goal_percentage_complete": 40
    })");

    auto text = ResponseFormatter::category(category, ResponseFormat::MARKDOWN).text();

    EXPECT_TRUE(containsLine(text, "## Goal"));
    EXPECT_TRUE(containsLine(text, "- Type: TB"));
    EXPECT_TRUE(containsLine(text, "- Target: $1,000.00"));
    EXPECT_TRUE(containsLine(text, "- Progress: 40%"));
}

TEST_F(ResponseFormatterTest, Category_Markdown_NoGoal) {
    auto category = ordered_json::parse(R"({
        "id": "c1", "name": "Food", "budgeted": "$1.00", "activity": "$0.00", "balance": "$1.00", "goal_type": null
    })");

    auto text = ResponseFormatter::category(category, ResponseFormat::MARKDOWN).text();

    EXPECT_EQ(text.find("## Goal"), std::string::npos);
}

TEST_F(ResponseFormatterTest, Payees_Markdown) {
    auto payees = ordered_json::parse(R"([{"id": "p1", "name": "Grocer"}, {"id": "p2", "name": "Landlord"}])");

    auto text = ResponseFormatter::payees(payees, ResponseFormat::MARKDOWN).text();

    EXPECT_EQ(text, "# Payees\n\n- **Grocer** (`p1`)\n- **Landlord** (`p2`)");
}

TEST_F(ResponseFormatterTest, MonthBudget_Markdown_OmitsHiddenCategories) {
    auto month = ordered_json::parse(R"({
        "month": "2024-01-01", "income": "$500.00", "budgeted": "$400.00", "activity": "-$250.00",
        "to_be_budgeted": "$100.00", "age_of_money": 42,
        "categories": [
            {"name": "Rent", "hidden": false, "budgeted": "$150.00", "activity": "-$150.00", "balance": "$0.00"},
            {"name": "Gone", "hidden": true, "budgeted": "$0.00", "activity": "$0.00", "balance": "$0.00"}
        ]
    })");

    auto text = ResponseFormatter::monthBudget(month, ResponseFormat::MARKDOWN).text();

    EXPECT_TRUE(containsLine(text, "# Budget: 2024-01-01"));
    EXPECT_TRUE(containsLine(text, "**To Be Budgeted**: $100.00"));
    EXPECT_TRUE(containsLine(text, "**Age of Money**: 42 days"));
    EXPECT_TRUE(containsLine(text, "### Rent"));
    EXPECT_EQ(text.find("Gone"), std::string::npos);
}

TEST_F(ResponseFormatterTest, ScheduledTransactions_Markdown_UnknownPayee) {
    auto txns = ordered_json::parse(R"([
        {"id": "s1", "payee_name": null, "amount": "-$10.00", "frequency": "monthly", "date_next": "2024-02-01", "memo": "gym"}
    ])");

    auto text = ResponseFormatter::scheduledTransactions(txns, ResponseFormat::MARKDOWN).text();

    EXPECT_TRUE(containsLine(text, "## Unknown Payee"));
    EXPECT_TRUE(containsLine(text, "- **Frequency**: monthly"));
    EXPECT_TRUE(containsLine(text, "- **Memo**: gym"));
}
