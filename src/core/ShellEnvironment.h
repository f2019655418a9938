#pragma once
#include <string>
#include <vector>

/**
 * @brief Environment handed to every spawned shell.
 *
 * Built once at startup from the server's own environment: PATH gets the
 * standard system directories it is missing (launchers such as desktop
 * apps, systemd or cron often start us with a minimal PATH) and the nested
 * MCP variables are added. The server's environment itself is not touched.
 */
struct ShellEnvironment {
    std::string shellPath;                // resolved bash, empty when not found
    std::vector<std::string> variables;   // KEY=VALUE

    static ShellEnvironment build(const std::string& socketDir);
    static ShellEnvironment fromVariables(const std::vector<std::string>& base, const std::string& socketDir);

    std::string get(const std::string& key) const;
};

// Prepends the standard directories missing from a PATH value, keeping their order.
std::string ensureStandardPaths(const std::string& currentPath);

// First regular, executable file named one of names along a PATH value.
std::string findExecutableInPath(const std::vector<std::string>& names, const std::string& pathValue);
