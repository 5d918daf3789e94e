#pragma once

#include "enums/EntityKind.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace budget::domain {

/**
 * @brief Статическая схема сущности: какие поля хранят суммы в milliunits
 */
template <EntityKind K>
struct EntitySchema {
    static constexpr std::array<std::string_view, 0> amountFields{};
};

template <>
struct EntitySchema<EntityKind::ACCOUNT> {
    static constexpr std::array<std::string_view, 3> amountFields{
        "balance", "cleared_balance", "uncleared_balance"};
};

template <>
struct EntitySchema<EntityKind::CATEGORY> {
    static constexpr std::array<std::string_view, 5> amountFields{
        "budgeted", "activity", "balance", "goal_target", "goal_overall_left"};
};

template <>
struct EntitySchema<EntityKind::TRANSACTION> {
    static constexpr std::array<std::string_view, 1> amountFields{"amount"};
};

template <>
struct EntitySchema<EntityKind::SCHEDULED_TRANSACTION> {
    static constexpr std::array<std::string_view, 1> amountFields{"amount"};
};

template <>
struct EntitySchema<EntityKind::MONTH_BUDGET> {
    static constexpr std::array<std::string_view, 4> amountFields{
        "income", "budgeted", "activity", "to_be_budgeted"};
};

/**
 * @brief Снимок сущности YNAB, полученный за один вызов
 *
 * Поля хранятся в исходном порядке (ordered_json) и после создания не меняются.
 * Преобразованная копия строится EntityTransformer.
 */
template <EntityKind K>
class Entity {
public:
    using Schema = EntitySchema<K>;
    static constexpr EntityKind kind = K;

    Entity() : fields_(nlohmann::ordered_json::object()) {}

    explicit Entity(nlohmann::ordered_json fields) : fields_(std::move(fields)) {
        if (!fields_.is_object()) {
            throw std::invalid_argument(toString(K) + " payload must be a JSON object");
        }
    }

    const nlohmann::ordered_json& fields() const { return fields_; }

    /**
     * @brief Поле есть и не null
     */
    bool has(const std::string& field) const {
        auto it = fields_.find(field);
        return it != fields_.end() && !it->is_null();
    }

    /**
     * @brief Строковое поле; "" если поля нет, оно null или не строка
     */
    std::string text(const std::string& field) const {
        auto it = fields_.find(field);
        if (it == fields_.end() || !it->is_string()) {
            return "";
        }
        return it->get<std::string>();
    }

    bool flag(const std::string& field) const {
        auto it = fields_.find(field);
        return it != fields_.end() && it->is_boolean() && it->get<bool>();
    }

    std::optional<int64_t> amount(const std::string& field) const {
        auto it = fields_.find(field);
        if (it == fields_.end() || !it->is_number_integer()) {
            return std::nullopt;
        }
        return it->get<int64_t>();
    }

    std::string id() const { return text("id"); }
    std::string name() const { return text("name"); }

private:
    nlohmann::ordered_json fields_;
};

using Budget = Entity<EntityKind::BUDGET>;
using Account = Entity<EntityKind::ACCOUNT>;
using CategoryGroup = Entity<EntityKind::CATEGORY_GROUP>;
using Category = Entity<EntityKind::CATEGORY>;
using Payee = Entity<EntityKind::PAYEE>;
using Transaction = Entity<EntityKind::TRANSACTION>;
using ScheduledTransaction = Entity<EntityKind::SCHEDULED_TRANSACTION>;
using MonthBudget = Entity<EntityKind::MONTH_BUDGET>;

} // namespace budget::domain
