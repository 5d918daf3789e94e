#pragma once

#include "domain/Entity.hpp"
#include "domain/Milliunits.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace budget::application {

/**
 * @brief Преобразование сущностей для ответа
 *
 * Для каждого денежного поля сущности, которое есть и не null:
 *   <field>_milliunits = исходное целое, <field> = строка вида "$1,234.56".
 * Остальные поля и их порядок не меняются. Вложенные коллекции
 * (categories у месяца и группы, accounts у бюджета) преобразуются по
 * правилам своего типа. Исходная сущность не изменяется.
 */
class EntityTransformer {
public:
    template <domain::EntityKind K>
    static nlohmann::ordered_json transform(const domain::Entity<K>& entity) {
        return transformFields<K>(entity.fields());
    }

    template <domain::EntityKind K>
    static nlohmann::ordered_json transformAll(const std::vector<domain::Entity<K>>& entities) {
        nlohmann::ordered_json result = nlohmann::ordered_json::array();
        for (const auto& entity : entities) {
            result.push_back(transform(entity));
        }
        return result;
    }

    /**
     * @brief Сводка бюджета: счета и группы категорий без полного экспорта
     *
     * Категории группируются по category_group_id; от каждой остаются
     * id, name и hidden.
     */
    static nlohmann::ordered_json summarize(const domain::Budget& budget) {
        const auto& fields = budget.fields();

        std::unordered_map<std::string, nlohmann::ordered_json> categoriesByGroup;
        for (const auto& category : arrayField(fields, "categories")) {
            if (!category.is_object()) {
                continue;
            }
            nlohmann::ordered_json brief;
            brief["id"] = valueOrNull(category, "id");
            brief["name"] = valueOrNull(category, "name");
            brief["hidden"] = flagOf(category, "hidden");

            auto groupId = textOf(category, "category_group_id");
            auto it = categoriesByGroup.try_emplace(groupId, nlohmann::ordered_json::array()).first;
            it->second.push_back(std::move(brief));
        }

        nlohmann::ordered_json summary;
        summary["id"] = budget.id();
        summary["name"] = budget.name();
        summary["last_modified_on"] = fields.contains("last_modified_on")
            ? fields["last_modified_on"] : nlohmann::ordered_json();
        summary["currency_format"] = fields.contains("currency_format")
            ? fields["currency_format"] : nlohmann::ordered_json();

        summary["accounts"] = nlohmann::ordered_json::array();
        for (const auto& account : arrayField(fields, "accounts")) {
            summary["accounts"].push_back(transformFields<domain::EntityKind::ACCOUNT>(account));
        }

        summary["category_groups"] = nlohmann::ordered_json::array();
        for (const auto& group : arrayField(fields, "category_groups")) {
            if (!group.is_object()) {
                continue;
            }
            nlohmann::ordered_json entry;
            entry["id"] = valueOrNull(group, "id");
            entry["name"] = valueOrNull(group, "name");
            entry["hidden"] = flagOf(group, "hidden");

            auto it = categoriesByGroup.find(textOf(group, "id"));
            entry["categories"] = it != categoriesByGroup.end()
                ? it->second : nlohmann::ordered_json::array();
            summary["category_groups"].push_back(std::move(entry));
        }

        return summary;
    }

private:
    template <domain::EntityKind K>
    static nlohmann::ordered_json transformFields(const nlohmann::ordered_json& fields) {
        if (!fields.is_object()) {
            return fields;
        }

        nlohmann::ordered_json result = fields;
        for (auto field : domain::EntitySchema<K>::amountFields) {
            std::string key(field);
            auto it = fields.find(key);
            if (it == fields.end() || !it->is_number_integer()) {
                continue;
            }
            auto milliunits = it->get<int64_t>();
            result[key + "_milliunits"] = milliunits;
            result[key] = domain::Milliunits::toDisplay(milliunits);
        }

        if constexpr (K == domain::EntityKind::MONTH_BUDGET || K == domain::EntityKind::CATEGORY_GROUP) {
            transformNested<domain::EntityKind::CATEGORY>(result, "categories");
        }
        if constexpr (K == domain::EntityKind::BUDGET) {
            transformNested<domain::EntityKind::ACCOUNT>(result, "accounts");
        }

        return result;
    }

    template <domain::EntityKind Nested>
    static void transformNested(nlohmann::ordered_json& parent, const std::string& key) {
        auto it = parent.find(key);
        if (it == parent.end() || !it->is_array()) {
            return;
        }
        for (auto& item : *it) {
            item = transformFields<Nested>(item);
        }
    }

    // Поле как есть; отсутствующее поле становится null
    static nlohmann::ordered_json valueOrNull(const nlohmann::ordered_json& fields, const std::string& key) {
        auto it = fields.find(key);
        return it != fields.end() ? *it : nlohmann::ordered_json();
    }

    static std::string textOf(const nlohmann::ordered_json& fields, const std::string& key) {
        auto it = fields.find(key);
        return it != fields.end() && it->is_string() ? it->get<std::string>() : std::string();
    }

    static bool flagOf(const nlohmann::ordered_json& fields, const std::string& key) {
        auto it = fields.find(key);
        return it != fields.end() && it->is_boolean() && it->get<bool>();
    }

    static const nlohmann::ordered_json& arrayField(const nlohmann::ordered_json& fields, const std::string& key) {
        static const nlohmann::ordered_json empty = nlohmann::ordered_json::array();
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_array()) {
            return empty;
        }
        return *it;
    }
};

} // namespace budget::application
