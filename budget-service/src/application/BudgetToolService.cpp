#include "application/BudgetToolService.hpp"
#include "application/EntityTransformer.hpp"
#include "application/ResponseFormatter.hpp"
#include "domain/AmountInput.hpp"

#include <boost/locale.hpp>

namespace budget::application {

using nlohmann::ordered_json;

namespace {

std::string dumpDocument(const ordered_json& document) {
    return document.dump(2, ' ', false, ordered_json::error_handler_t::replace);
}

} // namespace

// ============================================
// БЮДЖЕТЫ И СЧЕТА
// ============================================

std::string BudgetToolService::getBudgets(const domain::BudgetsRequest& request) {
    return guarded("getBudgets", [&] {
        auto budgets = EntityTransformer::transformAll(gateway_->listBudgets(request.includeAccounts));
        RenderOptions options;
        options.includeAccounts = request.includeAccounts;
        options.includeHidden = request.includeHidden;
        return ResponseFormatter::budgets(budgets, request.format, options).text();
    });
}

std::string BudgetToolService::getBudgetSummary(const domain::BudgetScopedRequest& request) {
    return guarded("getBudgetSummary", [&] {
        auto summary = EntityTransformer::summarize(gateway_->getBudget(request.budgetId));
        RenderOptions options;
        options.includeHidden = request.includeHidden;
        return ResponseFormatter::budgetSummary(summary, request.format, options).text();
    });
}

std::string BudgetToolService::getAccounts(const domain::BudgetScopedRequest& request) {
    return guarded("getAccounts", [&] {
        auto accounts = EntityTransformer::transformAll(gateway_->listAccounts(request.budgetId));
        return ResponseFormatter::accounts(accounts, request.format).text();
    });
}

std::string BudgetToolService::getAccount(const domain::EntityRequest& request) {
    return guarded("getAccount", [&] {
        auto account = EntityTransformer::transform(gateway_->getAccount(request.budgetId, request.entityId));
        return ResponseFormatter::account(account, request.format).text();
    });
}

// ============================================
// КАТЕГОРИИ И ПОЛУЧАТЕЛИ
// ============================================

std::string BudgetToolService::getCategories(const domain::BudgetScopedRequest& request) {
    return guarded("getCategories", [&] {
        auto groups = EntityTransformer::transformAll(gateway_->listCategories(request.budgetId));
        RenderOptions options;
        options.includeHidden = request.includeHidden;
        return ResponseFormatter::categories(groups, request.format, options).text();
    });
}

std::string BudgetToolService::getCategory(const domain::EntityRequest& request) {
    return guarded("getCategory", [&] {
        auto category = EntityTransformer::transform(gateway_->getCategory(request.budgetId, request.entityId));
        return ResponseFormatter::category(category, request.format).text();
    });
}

std::string BudgetToolService::updateCategoryBudget(const domain::UpdateCategoryBudgetRequest& request) {
    return guarded("updateCategoryBudget", [&] {
        auto amount = domain::AmountInput::exactlyOne(request.amountMilliunits, request.amountDollars);
        auto category = gateway_->updateCategoryMonthBudget(
            request.budgetId, request.month, request.categoryId, amount.toMilliunits());
        return acknowledge("category", EntityTransformer::transform(category));
    });
}

std::string BudgetToolService::getPayees(const domain::BudgetScopedRequest& request) {
    return guarded("getPayees", [&] {
        auto payees = EntityTransformer::transformAll(gateway_->listPayees(request.budgetId));
        return ResponseFormatter::payees(payees, request.format).text();
    });
}

// ============================================
// ТРАНЗАКЦИИ
// ============================================

std::string BudgetToolService::getTransactions(const domain::TransactionsRequest& request) {
    return guarded("getTransactions", [&] {
        auto query = domain::TransactionQuery::fromFilters(
            request.accountId, request.categoryId, request.payeeId, request.sinceDate);
        auto summary = summarize(gateway_->listTransactions(request.budgetId, query));
        return deliver(summary, request.output, "transactions");
    });
}

std::string BudgetToolService::getTransaction(const domain::EntityRequest& request) {
    return guarded("getTransaction", [&] {
        auto transaction = EntityTransformer::transform(
            gateway_->getTransaction(request.budgetId, request.entityId));
        return ResponseFormatter::transaction(transaction, request.format).text();
    });
}

std::string BudgetToolService::createTransaction(const domain::CreateTransactionRequest& request) {
    return guarded("createTransaction", [&] {
        domain::TransactionDraft draft{
            request.accountId,
            request.date,
            domain::AmountInput::exactlyOne(request.amountMilliunits, request.amountDollars)};
        draft.payeeId = request.payeeId;
        draft.payeeName = request.payeeName;
        draft.categoryId = request.categoryId;
        draft.memo = request.memo;
        draft.cleared = request.cleared;
        draft.approved = request.approved;

        auto created = gateway_->createTransaction(request.budgetId, draft);
        return acknowledge("transaction", EntityTransformer::transform(created));
    });
}

std::string BudgetToolService::updateTransaction(const domain::UpdateTransactionRequest& request) {
    return guarded("updateTransaction", [&] {
        domain::TransactionPatch patch;
        patch.accountId = request.accountId;
        patch.date = request.date;
        patch.amount = domain::AmountInput::atMostOne(request.amountMilliunits, request.amountDollars);
        patch.payeeId = request.payeeId;
        patch.payeeName = request.payeeName;
        patch.categoryId = request.categoryId;
        patch.memo = request.memo;
        patch.cleared = request.cleared;
        patch.approved = request.approved;

        auto updated = gateway_->updateTransaction(request.budgetId, request.transactionId, patch);
        return acknowledge("transaction", EntityTransformer::transform(updated));
    });
}

std::string BudgetToolService::searchTransactions(const domain::SearchTransactionsRequest& request) {
    return guarded("searchTransactions", [&] {
        // YNAB не умеет искать по тексту: берём весь бюджет и фильтруем здесь
        domain::TransactionQuery query;
        query.sinceDate = request.sinceDate;
        auto all = gateway_->listTransactions(request.budgetId, query);

        std::string needle = foldCase(request.query);
        std::vector<domain::Transaction> matches;
        for (const auto& txn : all) {
            if (foldCase(txn.text("payee_name")).find(needle) != std::string::npos ||
                foldCase(txn.text("memo")).find(needle) != std::string::npos) {
                matches.push_back(txn);
            }
        }

        std::cout << "[BudgetToolService] Search '" << request.query << "': "
                  << matches.size() << " of " << all.size() << " transactions" << std::endl;

        auto summary = summarize(matches, request.query);
        return deliver(summary, request.output, "search_transactions");
    });
}

// ============================================
// МЕСЯЦЫ И ЗАПЛАНИРОВАННЫЕ ТРАНЗАКЦИИ
// ============================================

std::string BudgetToolService::getMonthBudget(const domain::MonthBudgetRequest& request) {
    return guarded("getMonthBudget", [&] {
        auto month = EntityTransformer::transform(gateway_->getMonthBudget(request.budgetId, request.month));
        RenderOptions options;
        options.includeHidden = request.includeHidden;
        return ResponseFormatter::monthBudget(month, request.format, options).text();
    });
}

std::string BudgetToolService::getScheduledTransactions(const domain::BudgetScopedRequest& request) {
    return guarded("getScheduledTransactions", [&] {
        auto transactions = EntityTransformer::transformAll(gateway_->listScheduledTransactions(request.budgetId));
        return ResponseFormatter::scheduledTransactions(transactions, request.format).text();
    });
}

std::string BudgetToolService::createScheduledTransaction(const domain::CreateScheduledTransactionRequest& request) {
    return guarded("createScheduledTransaction", [&] {
        domain::ScheduledTransactionDraft draft{
            request.accountId,
            request.dateFirst,
            request.frequency,
            domain::AmountInput::exactlyOne(request.amountMilliunits, request.amountDollars)};
        draft.payeeId = request.payeeId;
        draft.payeeName = request.payeeName;
        draft.categoryId = request.categoryId;
        draft.memo = request.memo;

        auto created = gateway_->createScheduledTransaction(request.budgetId, draft);
        return acknowledge("scheduled_transaction", EntityTransformer::transform(created));
    });
}

// ============================================
// ХЕЛПЕРЫ
// ============================================

std::string BudgetToolService::deliver(
    const domain::TransactionSummary& summary,
    const domain::OutputOptions& output,
    const std::string& prefix) const
{
    if (output.summaryOnly) {
        return dumpDocument(summary.header());
    }
    return spiller_->deliver(summary, output, prefix);
}

domain::TransactionSummary BudgetToolService::summarize(
    const std::vector<domain::Transaction>& transactions,
    std::optional<std::string> query)
{
    domain::TransactionSummary summary;
    summary.query = std::move(query);
    for (const auto& txn : transactions) {
        summary.totalMilliunits += txn.amount("amount").value_or(0);
    }
    summary.items = EntityTransformer::transformAll(transactions);
    return summary;
}

std::string BudgetToolService::acknowledge(const std::string& key, ordered_json entity) {
    ordered_json ack;
    ack["success"] = true;
    ack[key] = std::move(entity);
    return dumpDocument(ack);
}

std::string BudgetToolService::foldCase(const std::string& s) {
    static const std::locale utf8 = boost::locale::generator()("en_US.UTF-8");
    return boost::locale::fold_case(s, utf8);
}

} // namespace budget::application
