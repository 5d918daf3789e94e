#pragma once

#include "ports/output/IYnabGateway.hpp"
#include "settings/IYnabClientSettings.hpp"
#include "domain/Errors.hpp"
#include <IHttpClient.hpp>
#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace budget::adapters::secondary {

/**
 * @brief HTTP клиент к YNAB API v1
 *
 * Ответы приходят в конверте {"data": {...}}. Статус вне 2xx превращается
 * в domain::UpstreamError со статусом и reason phrase, недоставленный
 * запрос и ответ без конверта дают domain::TransportError.
 */
class HttpYnabGateway : public ports::output::IYnabGateway {
public:
    HttpYnabGateway(
        std::shared_ptr<IHttpClient> httpClient,
        std::shared_ptr<settings::IYnabClientSettings> settings
    ) : httpClient_(std::move(httpClient))
      , settings_(std::move(settings))
    {
        std::cout << "[HttpYnabGateway] Created, target: "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << settings_->getBasePath() << std::endl;
    }

    // ============================================
    // БЮДЖЕТЫ
    // ============================================

    std::vector<domain::Budget> listBudgets(bool includeAccounts) override {
        std::string path = "/budgets";
        if (includeAccounts) {
            path += "?include_accounts=true";
        }
        return listOf<domain::EntityKind::BUDGET>(doRequest("GET", path), "budgets");
    }

    domain::Budget getBudget(const std::string& budgetId) override {
        return oneOf<domain::EntityKind::BUDGET>(doRequest("GET", budgetPath(budgetId)), "budget");
    }

    // ============================================
    // СЧЕТА
    // ============================================

    std::vector<domain::Account> listAccounts(const std::string& budgetId) override {
        return listOf<domain::EntityKind::ACCOUNT>(
            doRequest("GET", budgetPath(budgetId) + "/accounts"), "accounts");
    }

    domain::Account getAccount(const std::string& budgetId, const std::string& accountId) override {
        return oneOf<domain::EntityKind::ACCOUNT>(
            doRequest("GET", budgetPath(budgetId) + "/accounts/" + encode(accountId)), "account");
    }

    // ============================================
    // КАТЕГОРИИ
    // ============================================

    std::vector<domain::CategoryGroup> listCategories(const std::string& budgetId) override {
        return listOf<domain::EntityKind::CATEGORY_GROUP>(
            doRequest("GET", budgetPath(budgetId) + "/categories"), "category_groups");
    }

    domain::Category getCategory(const std::string& budgetId, const std::string& categoryId) override {
        return oneOf<domain::EntityKind::CATEGORY>(
            doRequest("GET", budgetPath(budgetId) + "/categories/" + encode(categoryId)), "category");
    }

    domain::Category updateCategoryMonthBudget(
        const std::string& budgetId,
        const std::string& month,
        const std::string& categoryId,
        int64_t budgetedMilliunits) override
    {
        nlohmann::ordered_json body;
        body["category"]["budgeted"] = budgetedMilliunits;

        std::string path = budgetPath(budgetId) + "/months/" + encode(month) + "/categories/" + encode(categoryId);
        return oneOf<domain::EntityKind::CATEGORY>(doRequest("PATCH", path, body.dump()), "category");
    }

    // ============================================
    // ПОЛУЧАТЕЛИ
    // ============================================

    std::vector<domain::Payee> listPayees(const std::string& budgetId) override {
        return listOf<domain::EntityKind::PAYEE>(
            doRequest("GET", budgetPath(budgetId) + "/payees"), "payees");
    }

    // ============================================
    // ТРАНЗАКЦИИ
    // ============================================

    std::vector<domain::Transaction> listTransactions(
        const std::string& budgetId,
        const domain::TransactionQuery& query) override
    {
        std::string path = budgetPath(budgetId);
        switch (query.scope) {
            case domain::TransactionScope::ACCOUNT:
                path += "/accounts/" + encode(query.scopeId);
                break;
            case domain::TransactionScope::CATEGORY:
                path += "/categories/" + encode(query.scopeId);
                break;
            case domain::TransactionScope::PAYEE:
                path += "/payees/" + encode(query.scopeId);
                break;
            case domain::TransactionScope::BUDGET:
                break;
        }
        path += "/transactions";
        if (query.sinceDate && !query.sinceDate->empty()) {
            path += "?since_date=" + encode(*query.sinceDate);
        }

        return listOf<domain::EntityKind::TRANSACTION>(doRequest("GET", path), "transactions");
    }

    domain::Transaction getTransaction(const std::string& budgetId, const std::string& transactionId) override {
        return oneOf<domain::EntityKind::TRANSACTION>(
            doRequest("GET", budgetPath(budgetId) + "/transactions/" + encode(transactionId)), "transaction");
    }

    domain::Transaction createTransaction(
        const std::string& budgetId,
        const domain::TransactionDraft& draft) override
    {
        nlohmann::ordered_json body;
        body["transaction"] = draft.toJson();
        return oneOf<domain::EntityKind::TRANSACTION>(
            doRequest("POST", budgetPath(budgetId) + "/transactions", body.dump()), "transaction");
    }

    domain::Transaction updateTransaction(
        const std::string& budgetId,
        const std::string& transactionId,
        const domain::TransactionPatch& patch) override
    {
        nlohmann::ordered_json body;
        body["transaction"] = patch.toJson();
        return oneOf<domain::EntityKind::TRANSACTION>(
            doRequest("PUT", budgetPath(budgetId) + "/transactions/" + encode(transactionId), body.dump()),
            "transaction");
    }

    // ============================================
    // МЕСЯЦЫ И ЗАПЛАНИРОВАННЫЕ ТРАНЗАКЦИИ
    // ============================================

    domain::MonthBudget getMonthBudget(const std::string& budgetId, const std::string& month) override {
        return oneOf<domain::EntityKind::MONTH_BUDGET>(
            doRequest("GET", budgetPath(budgetId) + "/months/" + encode(month)), "month");
    }

    std::vector<domain::ScheduledTransaction> listScheduledTransactions(const std::string& budgetId) override {
        return listOf<domain::EntityKind::SCHEDULED_TRANSACTION>(
            doRequest("GET", budgetPath(budgetId) + "/scheduled_transactions"), "scheduled_transactions");
    }

    domain::ScheduledTransaction createScheduledTransaction(
        const std::string& budgetId,
        const domain::ScheduledTransactionDraft& draft) override
    {
        nlohmann::ordered_json body;
        body["scheduled_transaction"] = draft.toJson();
        return oneOf<domain::EntityKind::SCHEDULED_TRANSACTION>(
            doRequest("POST", budgetPath(budgetId) + "/scheduled_transactions", body.dump()),
            "scheduled_transaction");
    }

private:
    std::shared_ptr<IHttpClient> httpClient_;
    std::shared_ptr<settings::IYnabClientSettings> settings_;

    static std::string budgetPath(const std::string& budgetId) {
        return "/budgets/" + encode(budgetId);
    }

    /**
     * @brief Percent-encoding сегмента пути / значения query
     */
    static std::string encode(const std::string& value) {
        std::string result;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                result += static_cast<char>(c);
            } else {
                char buf[4];
                std::snprintf(buf, sizeof(buf), "%%%02X", c);
                result += buf;
            }
        }
        return result;
    }

    /**
     * @brief Выполнить запрос и вернуть содержимое конверта "data"
     */
    nlohmann::ordered_json doRequest(
        const std::string& method,
        const std::string& path,
        const std::string& body = "")
    {
        auto token = settings_->getAccessToken();
        if (!token) {
            throw domain::ConfigurationError("YNAB_API_KEY environment variable is required");
        }

        SimpleRequest request(
            method,
            settings_->getBasePath() + path,
            body,
            settings_->getHost(),
            settings_->getPort(),
            {
                {"Authorization", "Bearer " + *token},
                {"Accept", "application/json"},
                {"Content-Type", "application/json"}
            }
        );

        SimpleResponse response;
        if (!httpClient_->send(request, response)) {
            throw domain::TransportError(
                "Failed to reach YNAB API at " + settings_->getHost() + ":" + std::to_string(settings_->getPort()));
        }

        int status = response.getStatus();
        if (status < 200 || status >= 300) {
            std::cerr << "[HttpYnabGateway] " << method << " " << path << " failed: " << status << std::endl;
            throw domain::UpstreamError(status, reasonOf(status, response.getBody()));
        }

        auto json = nlohmann::ordered_json::parse(response.getBody());
        auto data = json.find("data");
        if (!json.is_object() || data == json.end() || !data->is_object()) {
            throw domain::TransportError("YNAB response for " + path + " has no data envelope");
        }
        return *data;
    }

    /**
     * @brief HTTP reason phrase; для нестандартного статуса error.detail из тела
     */
    static std::string reasonOf(int status, const std::string& body) {
        namespace http = boost::beast::http;
        auto phrase = http::obsolete_reason(http::int_to_status(static_cast<unsigned>(status)));
        if (http::int_to_status(static_cast<unsigned>(status)) != http::status::unknown) {
            return std::string(phrase);
        }

        auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_object() && json.contains("error") && json["error"].is_object()) {
            auto detail = json["error"].find("detail");
            if (detail != json["error"].end() && detail->is_string() &&
                !detail->get<std::string>().empty()) {
                return detail->get<std::string>();
            }
        }
        return "Unknown";
    }

    template <domain::EntityKind K>
    static domain::Entity<K> oneOf(const nlohmann::ordered_json& data, const std::string& key) {
        auto it = data.find(key);
        if (it == data.end() || !it->is_object()) {
            throw domain::TransportError("YNAB response has no '" + key + "' object");
        }
        return domain::Entity<K>(*it);
    }

    template <domain::EntityKind K>
    static std::vector<domain::Entity<K>> listOf(const nlohmann::ordered_json& data, const std::string& key) {
        auto it = data.find(key);
        if (it == data.end() || !it->is_array()) {
            throw domain::TransportError("YNAB response has no '" + key + "' array");
        }

        std::vector<domain::Entity<K>> result;
        result.reserve(it->size());
        for (const auto& item : *it) {
            if (!item.is_object()) {
                throw domain::TransportError("YNAB response '" + key + "' contains a non-object item");
            }
            result.emplace_back(item);
        }
        return result;
    }
};

} // namespace budget::adapters::secondary
