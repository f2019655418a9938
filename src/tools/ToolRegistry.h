#pragma once
#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Tool registry
 *
 * Registration, lookup and execution of every tool the server exposes.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool, replacing one with the same name
     * @param tool tool instance (ownership moves to the registry)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Look up a tool
     * @return nullptr when no tool has this name
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief Tool descriptors for tools/list
     *
     * Format:
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema }
     *   }
     * ]
     */
    nlohmann::json listToolSchemas() const;

    /**
     * @brief Execute a tool
     *
     * An unknown tool or a throwing tool yields an "Error: ..." CallToolResult
     * with isError set.
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args, CancellationToken& token);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;
};
