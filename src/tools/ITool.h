#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/CancellationToken.h"

/**
 * @brief Tool interface exposed through tools/list and tools/call.
 *
 * Tool-level failures are reported as content, never as protocol errors,
 * so the caller always sees them.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown to the client
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the arguments object
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Run the tool
     * @param args arguments object from tools/call
     * @param token cancelled when the client cancels the request
     * @return MCP CallToolResult
     *
     * Success:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ]
     * }
     *
     * Failure:
     * {
     *   "content": [{"type": "text", "text": "Error: ..."}],
     *   "isError": true
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args, CancellationToken& token) = 0;

    static nlohmann::json textResult(const std::string& text) {
        return {
            {"content", nlohmann::json::array({
                {{"type", "text"}, {"text", text}}
            })}
        };
    }

    static nlohmann::json errorResult(const std::string& message) {
        nlohmann::json result = textResult("Error: " + message);
        result["isError"] = true;
        return result;
    }
};
