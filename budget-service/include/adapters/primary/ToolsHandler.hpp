#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ToolRegistry.hpp"
#include "application/ErrorClassifier.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace budget::adapters::primary {

/**
 * @brief REST доступ к инструментам
 *
 * Endpoints:
 * - GET  /api/v1/tools          : каталог инструментов
 * - POST /api/v1/tools/{name}   : тело запроса = объект аргументов, ответ = текст инструмента
 */
class ToolsHandler final : public IHttpHandler
{
public:
    explicit ToolsHandler(std::shared_ptr<ToolRegistry> registry)
        : registry_(std::move(registry))
    {
        std::cout << "[ToolsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        const std::string path = req.getPath();

        if (path == PREFIX_ROOT) {
            if (req.getMethod() != "GET") {
                sendError(res, 405, "Method not allowed");
                return;
            }
            nlohmann::json response;
            response["tools"] = registry_->catalog();
            res.setResult(200, "application/json", response.dump());
            return;
        }

        auto name = extractToolName(path);
        if (!name) {
            sendError(res, 404, "Not found");
            return;
        }
        if (req.getMethod() != "POST") {
            sendError(res, 405, "Method not allowed");
            return;
        }

        nlohmann::json arguments = nlohmann::json::object();
        try {
            if (!req.getBody().empty()) {
                arguments = nlohmann::json::parse(req.getBody());
            }
        } catch (const nlohmann::json::exception&) {
            sendError(res, 400, "Invalid JSON");
            return;
        }

        auto text = registry_->call(*name, arguments);
        if (!text) {
            sendError(res, 404, "Unknown tool: " + *name);
            return;
        }

        // Ошибка инструмента не ломает HTTP-обмен: текст тот же, статус 422
        int status = application::ErrorClassifier::isErrorMessage(*text) ? 422 : 200;
        res.setResult(status, contentTypeOf(*text), *text);
    }

private:
    static constexpr const char* PREFIX_ROOT = "/api/v1/tools";

    std::shared_ptr<ToolRegistry> registry_;

    static std::optional<std::string> extractToolName(const std::string& path)
    {
        const std::string prefix = std::string(PREFIX_ROOT) + "/";
        if (path.find(prefix) != 0 || path.length() <= prefix.length()) {
            return std::nullopt;
        }
        auto name = path.substr(prefix.length());
        if (name.find('/') != std::string::npos) {
            return std::nullopt;
        }
        return name;
    }

    static std::string contentTypeOf(const std::string& text)
    {
        if (!text.empty() && (text[0] == '{' || text[0] == '[')) {
            return "application/json";
        }
        return "text/markdown; charset=utf-8";
    }

    static void sendError(IResponse& res, int status, const std::string& message)
    {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace budget::adapters::primary
