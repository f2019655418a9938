#pragma once
#include <memory>
#include "core/ConfigManager.h"
#include "core/ShellEnvironment.h"
#include "shell/BashManager.h"
#include "tools/ToolRegistry.h"
#include "mcp/MCPServer.h"

/**
 * @brief Everything one server instance needs, wired together.
 *
 * Owns the bash manager, the tool registry and the router, and registers the
 * tool methods on the router. Transports only see handleFrame().
 */
class ServerContext {
public:
    static constexpr const char* kServerName = "bash-mcp-server";
    static constexpr const char* kServerVersion = "1.0.0";

    ServerContext(const Config& config, ShellEnvironment env);
    ~ServerContext();

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    std::optional<nlohmann::json> handleFrame(const std::string& frame);

    // Cancels in-flight requests and closes the shell. Idempotent.
    void shutdown();

    const Config& config() const { return cfg; }
    BashManager& manager() { return *bashManager; }
    ToolRegistry& registry() { return toolRegistry; }
    MCPServer& server() { return mcpServer; }

private:
    Config cfg;
    std::unique_ptr<BashManager> bashManager;
    ToolRegistry toolRegistry;
    MCPServer mcpServer;

    void registerMethods();
    nlohmann::json callTool(const nlohmann::json& params, CancellationToken& token);
};
