#include "tools/BashTool.h"
#include "shell/BashManager.h"
#include "utils/Logger.h"

BashTool::BashTool(BashManager& manager) : manager(manager) {}

std::string BashTool::getDescription() const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(manager.timeout()).count();
    return "Execute bash commands in a persistent session. Commands are executed in a stateful bash environment "
           "where environment variables, working directory changes, and other session state persist between calls. "
           "Long-running commands will timeout after " + std::to_string(seconds) + " seconds. "
           "Use 'restart: true' to start a fresh session if needed. "
           "Supports: pipelines, environment variables, cd commands, command chaining with && or ||, "
           "background processes, file I/O redirection, and most bash built-ins. "
           "Avoid: interactive commands (vim, less, top), commands requiring user input, sudo without NOPASSWD.";
}

nlohmann::json BashTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"command", {
                {"type", "string"},
                {"description", "The bash command to execute"}
            }},
            {"restart", {
                {"type", "boolean"},
                {"description", "Set to true to restart the bash session before executing the command"}
            }}
        }},
        {"required", nlohmann::json::array({"command"})}
    };
}

nlohmann::json BashTool::execute(const nlohmann::json& args, CancellationToken& token) {
    if (!args.is_object()) {
        return errorResult("invalid arguments for bash tool: arguments must be an object");
    }

    std::string command;
    bool restart = false;
    if (args.contains("command") && !args["command"].is_null()) {
        if (!args["command"].is_string()) {
            return errorResult("invalid arguments for bash tool: command must be a string");
        }
        command = args["command"].get<std::string>();
    }
    if (args.contains("restart") && !args["restart"].is_null()) {
        if (!args["restart"].is_boolean()) {
            return errorResult("invalid arguments for bash tool: restart must be a boolean");
        }
        restart = args["restart"].get<bool>();
    }
    if (command.empty()) {
        return errorResult("command parameter is required");
    }

    if (restart) {
        try {
            manager.restartSession();
        } catch (const std::exception& e) {
            return errorResult(std::string("Failed to restart session: ") + e.what());
        }
        Logger::getInstance().info("Bash session restarted");
    }

    Logger::getInstance().info("Executing command: " + Logger::truncate(command, 200));
    try {
        return textResult(manager.executeCommand(command, &token));
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Command execution failed: ") + e.what());
        return errorResult(std::string("Command execution failed: ") + e.what());
    }
}
