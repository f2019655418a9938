#pragma once
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

// JSON-RPC 2.0 error codes
enum class MCPError : int {
    PARSE_ERROR      = -32700,
    INVALID_REQUEST  = -32600,
    METHOD_NOT_FOUND = -32601,
    INVALID_PARAMS   = -32602,
    NOT_INITIALIZED  = -32002,
    HANDLER_ERROR    = -32000
};

// Thrown by request handlers to answer with INVALID_PARAMS.
class InvalidParamsError : public std::runtime_error {
public:
    explicit InvalidParamsError(const std::string& message) : std::runtime_error(message) {}
};

namespace Protocol {

constexpr const char* kDefaultProtocolVersion = "2024-11-05";
constexpr const char* kNotificationPrefix = "notifications/";

inline nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline nlohmann::json makeError(const nlohmann::json& id, MCPError code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", static_cast<int>(code)},
            {"message", message}
        }}
    };
}

// Command output is arbitrary bytes; invalid UTF-8 is replaced instead of throwing.
inline std::string serialize(const nlohmann::json& frame) {
    return frame.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace Protocol
