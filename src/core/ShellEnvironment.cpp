#include "core/ShellEnvironment.h"
#include "utils/Logger.h"
#include <filesystem>
#include <unordered_set>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace {
const std::vector<std::string> kStandardPaths = {
    "/usr/local/bin",
    "/usr/bin",
    "/bin",
    "/usr/local/sbin",
    "/usr/sbin",
    "/sbin"
};

std::vector<std::string> splitPath(const std::string& value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(':', start);
        std::string dir = (end == std::string::npos) ? value.substr(start) : value.substr(start, end - start);
        if (!dir.empty()) parts.push_back(dir);
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return parts;
}

bool hasKey(const std::string& entry, const std::string& key) {
    return entry.size() > key.size() && entry.compare(0, key.size(), key) == 0 && entry[key.size()] == '=';
}
} // namespace

std::string ensureStandardPaths(const std::string& currentPath) {
    auto existing = splitPath(currentPath);
    std::unordered_set<std::string> present(existing.begin(), existing.end());

    std::string missing;
    for (const auto& dir : kStandardPaths) {
        if (present.count(dir)) continue;
        if (!missing.empty()) missing += ':';
        missing += dir;
    }
    if (missing.empty()) return currentPath;
    if (currentPath.empty()) return missing;
    return missing + ":" + currentPath;
}

std::string findExecutableInPath(const std::vector<std::string>& names, const std::string& pathValue) {
    for (const auto& dir : splitPath(pathValue)) {
        for (const auto& name : names) {
            fs::path candidate = fs::path(dir) / name;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
                return candidate.string();
            }
        }
    }
    return "";
}

ShellEnvironment ShellEnvironment::build(const std::string& socketDir) {
    std::vector<std::string> base;
    for (char** entry = environ; entry && *entry; ++entry) {
        base.emplace_back(*entry);
    }

    std::error_code ec;
    fs::create_directories(socketDir, ec);
    if (!ec) {
        fs::permissions(socketDir, fs::perms::owner_all, fs::perm_options::replace, ec);
    }
    if (ec) {
        Logger::getInstance().warn("Could not prepare socket directory " + socketDir + ": " + ec.message());
    }

    return fromVariables(base, socketDir);
}

ShellEnvironment ShellEnvironment::fromVariables(const std::vector<std::string>& base, const std::string& socketDir) {
    static const std::vector<std::string> nestedKeys = {"MCP_NESTED", "MCP_SOCKET_DIR", "MCP_SKILLS_SOCKET"};

    ShellEnvironment env;
    std::string pathValue;
    for (const auto& entry : base) {
        if (hasKey(entry, "PATH")) {
            pathValue = entry.substr(5);
            continue;
        }
        bool nested = false;
        for (const auto& key : nestedKeys) {
            if (hasKey(entry, key)) nested = true;
        }
        if (!nested) env.variables.push_back(entry);
    }

    pathValue = ensureStandardPaths(pathValue);
    env.variables.push_back("PATH=" + pathValue);

    // Nested MCP support: tools invoked from the shell detect this and talk
    // over Unix sockets instead of contending for our stdio.
    env.variables.push_back("MCP_NESTED=1");
    env.variables.push_back("MCP_SOCKET_DIR=" + socketDir);
    env.variables.push_back("MCP_SKILLS_SOCKET=" + (fs::path(socketDir) / "skills.sock").string());

    env.shellPath = findExecutableInPath({"bash"}, pathValue);
    return env;
}

std::string ShellEnvironment::get(const std::string& key) const {
    for (const auto& entry : variables) {
        if (hasKey(entry, key)) return entry.substr(key.size() + 1);
    }
    return "";
}
