#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace budget::adapters::primary::mcp {

/**
 * @brief JSON-RPC 2.0 для Model Context Protocol
 */

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Коды ошибок JSON-RPC 2.0
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // MCP
    constexpr int TOOL_NOT_FOUND = -32001;
}

inline nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

/**
 * @brief Результат tools/call: один текстовый блок и флаг ошибки
 */
inline nlohmann::json makeToolResponse(const std::string& text, bool isError) {
    nlohmann::json content = nlohmann::json::array();
    content.push_back({
        {"type", "text"},
        {"text", text}
    });

    return {
        {"content", content},
        {"isError", isError}
    };
}

inline bool validateRequest(const nlohmann::json& request, std::string& errorMessage) {
    if (!request.is_object()) {
        errorMessage = "Request must be a JSON object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        errorMessage = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        errorMessage = "Missing or invalid method";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    nlohmann::json params;
    nlohmann::json id;
    bool notification = false;   ///< Нет поля id: ответ не нужен
};

inline RequestInfo parseRequest(const nlohmann::json& request) {
    RequestInfo info;
    info.method = request["method"].get<std::string>();
    info.params = request.value("params", nlohmann::json::object());
    info.notification = !request.contains("id");
    info.id = request.value("id", nlohmann::json());
    return info;
}

} // namespace budget::adapters::primary::mcp
