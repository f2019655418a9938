#include "core/ServerContext.h"
#include "tools/BashTool.h"
#include "utils/Logger.h"

ServerContext::ServerContext(const Config& config, ShellEnvironment env)
    : cfg(config),
      bashManager(std::make_unique<BashManager>(cfg.getTimeout(), std::move(env))),
      mcpServer({kServerName, kServerVersion}) {
    toolRegistry.registerTool(std::make_unique<BashTool>(*bashManager));
    registerMethods();
    Logger::getInstance().debug("Registered " + std::to_string(toolRegistry.getToolCount()) + " tool(s)");
}

ServerContext::~ServerContext() {
    shutdown();
}

void ServerContext::registerMethods() {
    auto listTools = [this](const nlohmann::json&, CancellationToken&) {
        return nlohmann::json{{"tools", toolRegistry.listToolSchemas()}};
    };
    auto callToolHandler = [this](const nlohmann::json& params, CancellationToken& token) {
        return callTool(params, token);
    };

    mcpServer.setRequestHandler("tools/list", listTools);
    mcpServer.setRequestHandler("tools/call", callToolHandler);
    // Legacy names still sent by older clients.
    mcpServer.setRequestHandler("list_tools", listTools);
    mcpServer.setRequestHandler("call_tool", callToolHandler);
}

nlohmann::json ServerContext::callTool(const nlohmann::json& params, CancellationToken& token) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw InvalidParamsError("Invalid call parameters: name must be a string");
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
    }

    Logger::getInstance().debug("Calling tool: " + name);
    return toolRegistry.executeTool(name, arguments, token);
}

std::optional<nlohmann::json> ServerContext::handleFrame(const std::string& frame) {
    return mcpServer.handleMessage(frame);
}

void ServerContext::shutdown() {
    mcpServer.cancelAll();
    if (bashManager) bashManager->shutdown();
}
