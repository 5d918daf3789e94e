#pragma once

#include "enums/ResponseFormat.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace budget::domain {

/**
 * @brief Результат рендеринга: markdown-документ или структурированный документ
 */
struct RenderedResult {
    ResponseFormat format = ResponseFormat::JSON;
    std::vector<std::string> lines;          ///< MARKDOWN
    nlohmann::ordered_json document;         ///< JSON

    static RenderedResult markdown(std::vector<std::string> lines) {
        RenderedResult result;
        result.format = ResponseFormat::MARKDOWN;
        result.lines = std::move(lines);
        return result;
    }

    static RenderedResult structured(nlohmann::ordered_json document) {
        RenderedResult result;
        result.format = ResponseFormat::JSON;
        result.document = std::move(document);
        return result;
    }

    std::string text() const {
        if (format == ResponseFormat::JSON) {
            return document.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
        }
        std::string joined;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                joined += '\n';
            }
            joined += lines[i];
        }
        return joined;
    }
};

} // namespace budget::domain
