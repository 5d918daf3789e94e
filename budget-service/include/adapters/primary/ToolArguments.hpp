#pragma once

#include "domain/Errors.hpp"
#include "domain/enums/ClearedStatus.hpp"
#include "domain/enums/Frequency.hpp"
#include "domain/enums/ResponseFormat.hpp"
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <string>

namespace budget::adapters::primary {

/**
 * @brief Типизированный доступ к аргументам вызова инструмента
 *
 * Строки обрезаются по краям. Отсутствующий ключ и null равнозначны.
 * Неизвестные ключи игнорируются. Любое нарушение бросает domain::ValidationError
 * с именем аргумента в тексте.
 */
class ToolArguments {
public:
    static constexpr size_t MAX_MEMO_LENGTH = 200;

    explicit ToolArguments(nlohmann::json arguments) : arguments_(std::move(arguments)) {
        if (arguments_.is_null()) {
            arguments_ = nlohmann::json::object();
        }
        if (!arguments_.is_object()) {
            throw domain::ValidationError("arguments must be a JSON object");
        }
    }

    /**
     * @brief Обязательный идентификатор: непустая строка после обрезки
     */
    std::string requiredId(const std::string& key) const {
        auto value = optionalText(key);
        if (!value || value->empty()) {
            throw domain::ValidationError(key + " is required and must be a non-empty string");
        }
        return *value;
    }

    std::optional<std::string> optionalText(const std::string& key) const {
        auto it = arguments_.find(key);
        if (it == arguments_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            throw domain::ValidationError(key + " must be a string");
        }
        return strip(it->get<std::string>());
    }

    /**
     * @brief Непустой текст (например, поисковый запрос)
     */
    std::string requiredText(const std::string& key) const {
        auto value = optionalText(key);
        if (!value || value->empty()) {
            throw domain::ValidationError(key + " must be at least 1 character");
        }
        return *value;
    }

    std::string requiredDate(const std::string& key) const {
        auto value = optionalDate(key);
        if (!value) {
            throw domain::ValidationError(key + " is required (YYYY-MM-DD)");
        }
        return *value;
    }

    std::optional<std::string> optionalDate(const std::string& key) const {
        static const std::regex isoDate(R"(^\d{4}-\d{2}-\d{2}$)");
        auto value = optionalText(key);
        if (value && !std::regex_match(*value, isoDate)) {
            throw domain::ValidationError(key + " must match YYYY-MM-DD");
        }
        return value;
    }

    std::optional<std::string> memo(const std::string& key = "memo") const {
        auto value = optionalText(key);
        if (value && utf8Length(*value) > MAX_MEMO_LENGTH) {
            throw domain::ValidationError(key + " must be at most " + std::to_string(MAX_MEMO_LENGTH) + " characters");
        }
        return value;
    }

    bool flag(const std::string& key, bool defaultValue) const {
        auto value = optionalFlag(key);
        return value ? *value : defaultValue;
    }

    std::optional<bool> optionalFlag(const std::string& key) const {
        auto it = arguments_.find(key);
        if (it == arguments_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_boolean()) {
            throw domain::ValidationError(key + " must be a boolean");
        }
        return it->get<bool>();
    }

    std::optional<int64_t> optionalInteger(const std::string& key) const {
        auto it = arguments_.find(key);
        if (it == arguments_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (it->is_number_unsigned()) {
            auto value = it->get<uint64_t>();
            if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw domain::ValidationError(key + " must be an integer");
            }
            return static_cast<int64_t>(value);
        }
        if (it->is_number_integer()) {
            return it->get<int64_t>();
        }
        if (it->is_number_float()) {
            double value = it->get<double>();
            if (std::isfinite(value) && std::trunc(value) == value &&
                std::fabs(value) < 9.2e18) {
                return static_cast<int64_t>(value);
            }
        }
        throw domain::ValidationError(key + " must be an integer");
    }

    std::optional<double> optionalNumber(const std::string& key) const {
        auto it = arguments_.find(key);
        if (it == arguments_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_number()) {
            throw domain::ValidationError(key + " must be a number");
        }
        return it->get<double>();
    }

    domain::ResponseFormat format(domain::ResponseFormat defaultValue) const {
        auto value = optionalText("response_format");
        if (!value) {
            return defaultValue;
        }
        auto parsed = domain::parseResponseFormat(*value);
        if (!parsed) {
            throw domain::ValidationError("response_format must be 'markdown' or 'json'");
        }
        return *parsed;
    }

    std::optional<domain::ClearedStatus> cleared() const {
        auto value = optionalText("cleared");
        if (!value || value->empty()) {
            return std::nullopt;
        }
        auto parsed = domain::parseClearedStatus(*value);
        if (!parsed) {
            throw domain::ValidationError("cleared must be 'cleared', 'uncleared', or 'reconciled'");
        }
        return parsed;
    }

    domain::Frequency frequency() const {
        auto value = requiredText("frequency");
        auto parsed = domain::parseFrequency(value);
        if (!parsed) {
            throw domain::ValidationError("frequency '" + value + "' is not a YNAB frequency");
        }
        return *parsed;
    }

private:
    nlohmann::json arguments_;

    static std::string strip(const std::string& s) {
        const char* whitespace = " \t\n\r\f\v";
        auto begin = s.find_first_not_of(whitespace);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = s.find_last_not_of(whitespace);
        return s.substr(begin, end - begin + 1);
    }

    static size_t utf8Length(const std::string& s) {
        size_t count = 0;
        for (unsigned char c : s) {
            if ((c & 0xC0) != 0x80) {
                ++count;
            }
        }
        return count;
    }
};

} // namespace budget::adapters::primary
