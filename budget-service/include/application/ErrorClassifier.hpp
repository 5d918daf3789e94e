#pragma once

#include "domain/Failure.hpp"
#include <string>

namespace budget::application {

/**
 * @brief Текст ошибки для вызывающего инструмента
 *
 * Ответы YNAB 401/403/404/429 получают фиксированные подсказки,
 * остальные статусы: "YNAB API error <status>: <reason>",
 * любая другая ошибка: "<KindName>: <description>".
 */
class ErrorClassifier {
public:
    static constexpr const char* PREFIX = "Error: ";

    static std::string classify(const domain::Failure& failure) {
        if (failure.kind == domain::FailureKind::UPSTREAM) {
            switch (failure.status) {
                case 401:
                    return std::string(PREFIX) + "Invalid API key. Check YNAB_API_KEY environment variable.";
                case 403:
                    return std::string(PREFIX) + "Access forbidden. You don't have permission for this resource.";
                case 404:
                    return std::string(PREFIX) + "Resource not found. Check the ID is correct.";
                case 429:
                    return std::string(PREFIX) + "Rate limit exceeded. Wait before making more requests.";
                default:
                    return std::string(PREFIX) + "YNAB API error " + std::to_string(failure.status)
                        + ": " + failure.reason;
            }
        }
        return std::string(PREFIX) + failure.kindName + ": " + failure.description;
    }

    /**
     * @brief Текст получен из classify()
     */
    static bool isErrorMessage(const std::string& text) {
        return text.rfind(PREFIX, 0) == 0;
    }
};

} // namespace budget::application
