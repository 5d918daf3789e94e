#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ToolRegistry.hpp"
#include "adapters/primary/mcp/Protocol.hpp"
#include "application/ErrorClassifier.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace budget::adapters::primary {

/**
 * @brief POST /mcp: Model Context Protocol поверх JSON-RPC 2.0
 *
 * Методы: initialize, ping, tools/list, tools/call.
 * Уведомления (без id) подтверждаются статусом 202 без тела.
 * Ошибка инструмента возвращается как обычный результат с isError=true;
 * неизвестный метод или инструмент даёт ошибку JSON-RPC.
 */
class McpHandler final : public IHttpHandler
{
public:
    explicit McpHandler(std::shared_ptr<ToolRegistry> registry)
        : registry_(std::move(registry))
    {
        std::cout << "[McpHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        if (req.getMethod() != "POST") {
            res.setResult(405, "application/json", R"({"error": "Method not allowed"})");
            return;
        }

        nlohmann::json request;
        try {
            request = nlohmann::json::parse(req.getBody());
        } catch (const nlohmann::json::exception& e) {
            reply(res, mcp::makeError(nullptr, mcp::error::PARSE_ERROR,
                                      std::string("JSON parse error: ") + e.what()));
            return;
        }

        std::string errorMessage;
        if (!mcp::validateRequest(request, errorMessage)) {
            nlohmann::json id = request.is_object() ? request.value("id", nlohmann::json()) : nlohmann::json();
            reply(res, mcp::makeError(id, mcp::error::INVALID_REQUEST, errorMessage));
            return;
        }

        auto info = mcp::parseRequest(request);
        if (info.notification) {
            std::cout << "[McpHandler] Notification: " << info.method << std::endl;
            res.setResult(202, "application/json", "");
            return;
        }

        try {
            reply(res, dispatch(info));
        } catch (const std::exception& e) {
            std::cerr << "[McpHandler] Error: " << e.what() << std::endl;
            reply(res, mcp::makeError(info.id, mcp::error::INTERNAL_ERROR,
                                      std::string("Internal error: ") + e.what()));
        }
    }

private:
    std::shared_ptr<ToolRegistry> registry_;

    nlohmann::json dispatch(const mcp::RequestInfo& info)
    {
        if (info.method == "initialize") {
            return mcp::makeResult(info.id, {
                {"protocolVersion", mcp::PROTOCOL_VERSION},
                {"serverInfo", {
                    {"name", "ynab_mcp"},
                    {"version", "1.0.0"}
                }},
                {"capabilities", {
                    {"tools", nlohmann::json::object()}
                }}
            });
        }

        if (info.method == "ping") {
            return mcp::makeResult(info.id, nlohmann::json::object());
        }

        if (info.method == "tools/list") {
            return mcp::makeResult(info.id, {{"tools", registry_->catalog()}});
        }

        if (info.method == "tools/call") {
            return callTool(info);
        }

        return mcp::makeError(info.id, mcp::error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
    }

    nlohmann::json callTool(const mcp::RequestInfo& info)
    {
        if (!info.params.is_object() || !info.params.contains("name") || !info.params["name"].is_string()) {
            return mcp::makeError(info.id, mcp::error::INVALID_PARAMS, "Missing tool name");
        }

        auto name = info.params["name"].get<std::string>();
        auto arguments = info.params.value("arguments", nlohmann::json::object());

        auto text = registry_->call(name, arguments);
        if (!text) {
            return mcp::makeError(info.id, mcp::error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        bool isError = application::ErrorClassifier::isErrorMessage(*text);
        std::cout << "[McpHandler] tools/call " << name << (isError ? " -> error" : " -> ok") << std::endl;
        return mcp::makeResult(info.id, mcp::makeToolResponse(*text, isError));
    }

    static void reply(IResponse& res, const nlohmann::json& body)
    {
        res.setResult(200, "application/json",
                      body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
};

} // namespace budget::adapters::primary
