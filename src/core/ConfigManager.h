#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct Config {
    int commandTimeout = 600;                  // seconds
    bool enabled = true;
    std::string socketDir = "/tmp/mcp-sockets";
    std::string logFile;                       // empty: stderr only
    bool debug = false;

    // Opt-in; not written to the default config file.
    struct Network {
        bool enabled = false;
        std::string host = "localhost";
        int port = 3000;
        std::vector<std::string> allowedIPs;
        std::vector<std::string> allowedSubnets;   // IPv4 CIDR
    } network;

    static constexpr const char* kFileName = "config.json";

    std::chrono::seconds getTimeout() const {
        return std::chrono::seconds(commandTimeout);
    }

    static Config fromJson(const nlohmann::json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("config root must be a JSON object");
        }

        Config cfg;
        cfg.commandTimeout = j.value("commandTimeout", 0);
        cfg.enabled = j.value("enabled", true);
        cfg.socketDir = j.value("socketDir", cfg.socketDir);
        cfg.logFile = j.value("logFile", "");
        cfg.debug = j.value("debug", false);

        if (j.contains("network") && j["network"].is_object()) {
            const auto& n = j["network"];
            cfg.network.enabled = n.value("enabled", false);
            cfg.network.host = n.value("host", "");
            cfg.network.port = n.value("port", 0);
            cfg.network.allowedIPs = n.value("allowedIPs", std::vector<std::string>{});
            cfg.network.allowedSubnets = n.value("allowedSubnets", std::vector<std::string>{});
        }

        cfg.validate();
        return cfg;
    }

    // Applies defaults and rejects unusable values.
    void validate() {
        if (!enabled) {
            throw std::runtime_error("bash tool is disabled in configuration");
        }
        if (commandTimeout < 0) {
            throw std::runtime_error("commandTimeout must not be negative");
        }
        if (commandTimeout == 0) {
            commandTimeout = 600;
        }
        if (socketDir.empty()) {
            socketDir = "/tmp/mcp-sockets";
        }
        if (network.enabled) {
            if (network.host.empty()) network.host = "localhost";
            if (network.port == 0) network.port = 3000;
            if (network.port < 0 || network.port > 65535) {
                throw std::runtime_error("network.port out of range: " + std::to_string(network.port));
            }
        }
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
        }
    }

    /**
     * Looks for config.json next to the executable, then in the working
     * directory. When neither exists a default file is written next to the
     * executable. foundPath receives the file that was used.
     */
    static Config loadOrCreate(const std::filesystem::path& executableDir,
                               const std::filesystem::path& workingDir,
                               std::string& foundPath) {
        std::filesystem::path exeConfig = executableDir / kFileName;
        if (std::filesystem::exists(exeConfig)) {
            foundPath = exeConfig.string();
            return load(foundPath);
        }

        std::filesystem::path cwdConfig = workingDir / kFileName;
        if (std::filesystem::exists(cwdConfig)) {
            foundPath = cwdConfig.string();
            return load(foundPath);
        }

        Config cfg;
        cfg.writeDefault(exeConfig);
        foundPath = exeConfig.string();
        return cfg;
    }

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"commandTimeout", commandTimeout},
            {"enabled", enabled},
            {"socketDir", socketDir},
            {"logFile", logFile},
            {"debug", debug}
        };
        if (network.enabled) {
            j["network"] = {
                {"enabled", network.enabled},
                {"host", network.host},
                {"port", network.port},
                {"allowedIPs", network.allowedIPs},
                {"allowedSubnets", network.allowedSubnets}
            };
        }
        return j;
    }

    void writeDefault(const std::filesystem::path& path) const {
        std::ofstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("failed to write default config file: " + path.string());
        }
        f << toJson().dump(2) << std::endl;
    }
};
