#pragma once

#include "Errors.hpp"
#include "Milliunits.hpp"
#include <cmath>
#include <cstdint>
#include <optional>
#include <variant>

namespace budget::domain {

/**
 * @brief Сумма, заданная вызывающим: либо milliunits, либо доллары
 *
 * Пустого состояния и состояния "оба поля" у типа нет; правила
 * exactly-one-of / at-most-one-of применяются в фабриках ниже.
 */
class AmountInput {
public:
    struct MilliunitsValue { int64_t value; };
    struct DollarsValue { double value; };

    static AmountInput ofMilliunits(int64_t milliunits) {
        return AmountInput(MilliunitsValue{milliunits});
    }

    static AmountInput ofDollars(double dollars) {
        if (!std::isfinite(dollars)) {
            throw ValidationError("amount_dollars must be a finite number");
        }
        return AmountInput(DollarsValue{dollars});
    }

    /**
     * @brief Создание / установка суммы: ровно одно из двух полей
     */
    static AmountInput exactlyOne(std::optional<int64_t> milliunits, std::optional<double> dollars) {
        if (milliunits.has_value() == dollars.has_value()) {
            throw ValidationError("Provide exactly one of amount_milliunits or amount_dollars");
        }
        return milliunits ? ofMilliunits(*milliunits) : ofDollars(*dollars);
    }

    /**
     * @brief Частичное обновление: не больше одного поля
     */
    static std::optional<AmountInput> atMostOne(std::optional<int64_t> milliunits, std::optional<double> dollars) {
        if (milliunits && dollars) {
            throw ValidationError("Provide at most one of amount_milliunits or amount_dollars");
        }
        if (milliunits) {
            return ofMilliunits(*milliunits);
        }
        if (dollars) {
            return ofDollars(*dollars);
        }
        return std::nullopt;
    }

    bool isMilliunits() const { return std::holds_alternative<MilliunitsValue>(value_); }

    /**
     * @brief Значение для YNAB API; доллары переводятся с отбрасыванием дробной части
     */
    int64_t toMilliunits() const {
        if (auto milli = std::get_if<MilliunitsValue>(&value_)) {
            return milli->value;
        }
        return Milliunits::toScaled(std::get<DollarsValue>(value_).value);
    }

private:
    explicit AmountInput(std::variant<MilliunitsValue, DollarsValue> value) : value_(value) {}

    std::variant<MilliunitsValue, DollarsValue> value_;
};

} // namespace budget::domain
