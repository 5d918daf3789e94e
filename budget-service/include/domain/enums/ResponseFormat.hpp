#pragma once

#include <optional>
#include <string>

namespace budget::domain {

enum class ResponseFormat {
    MARKDOWN,
    JSON
};

inline std::string toString(ResponseFormat format) {
    switch (format) {
        case ResponseFormat::MARKDOWN: return "markdown";
        case ResponseFormat::JSON: return "json";
        default: return "unknown";
    }
}

inline std::optional<ResponseFormat> parseResponseFormat(const std::string& str) {
    if (str == "markdown") return ResponseFormat::MARKDOWN;
    if (str == "json") return ResponseFormat::JSON;
    return std::nullopt;
}

} // namespace budget::domain
