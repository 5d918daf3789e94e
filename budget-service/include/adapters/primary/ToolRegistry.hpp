#pragma once

#include "adapters/primary/ToolArguments.hpp"
#include "ports/input/IBudgetToolService.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace budget::adapters::primary {

/**
 * @brief Описание инструмента для tools/list и его вызов
 */
struct ToolDefinition {
    std::string name;
    std::string title;
    std::string description;
    bool readOnly = true;
    bool destructive = false;
    bool idempotent = true;
    bool openWorld = true;
    nlohmann::json inputSchema;
    std::function<std::string(const ToolArguments&)> invoke;

    nlohmann::json toJson() const;
};

/**
 * @brief Каталог инструментов YNAB
 *
 * Разбирает аргументы (ToolArguments) в запросы сервиса и вызывает
 * IBudgetToolService. Ошибки разбора возвращаются тем же текстом
 * "Error: ...", что и ошибки сервиса.
 */
class ToolRegistry {
public:
    explicit ToolRegistry(std::shared_ptr<ports::input::IBudgetToolService> service);

    const std::vector<ToolDefinition>& tools() const { return tools_; }

    bool has(const std::string& name) const { return index_.count(name) > 0; }

    /**
     * @brief Массив описаний инструментов в формате MCP tools/list
     */
    nlohmann::json catalog() const;

    /**
     * @brief Вызвать инструмент; nullopt если инструмента с таким именем нет
     */
    std::optional<std::string> call(const std::string& name, const nlohmann::json& arguments) const;

private:
    std::shared_ptr<ports::input::IBudgetToolService> service_;
    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, size_t> index_;

    void add(ToolDefinition definition);

    void registerBudgetTools();
    void registerCategoryTools();
    void registerTransactionTools();
    void registerScheduleTools();
};

} // namespace budget::adapters::primary
