#pragma once
#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>
#include "mcp/Protocol.h"
#include "utils/CancellationToken.h"

/**
 * @brief MCP protocol router.
 *
 * Maps method names to handlers and applies JSON-RPC response rules:
 * notifications (no id, or a notifications/ method) never get a response,
 * requests always get exactly one. Requests other than ping are refused
 * until the client initialized. Thread-safe; transports call handleMessage
 * from many tasks at once.
 */
class MCPServer {
public:
    using RequestHandler = std::function<nlohmann::json(const nlohmann::json& params, CancellationToken& token)>;
    using NotificationHandler = std::function<void(const nlohmann::json& params)>;

    struct ServerInfo {
        std::string name;
        std::string version;
    };

    explicit MCPServer(ServerInfo info);

    void setRequestHandler(const std::string& method, RequestHandler handler);
    void setNotificationHandler(const std::string& method, NotificationHandler handler);
    RequestHandler getHandler(const std::string& method) const;

    // Raw frame; unparseable frames are logged and dropped.
    std::optional<nlohmann::json> handleMessage(const std::string& frame);
    std::optional<nlohmann::json> handleMessage(const nlohmann::json& message);

    bool isInitialized() const { return initialized; }

    // Cancels the in-flight request with this id; false when none matches.
    bool cancelRequest(const nlohmann::json& requestId);
    void cancelAll();
    size_t inflightCount() const;

    const ServerInfo& info() const { return serverInfo; }

private:
    ServerInfo serverInfo;
    std::map<std::string, RequestHandler> handlers;
    std::map<std::string, NotificationHandler> notificationHandlers;
    mutable std::mutex handlersMutex;
    std::atomic<bool> initialized{false};

    mutable std::mutex inflightMutex;
    std::multimap<std::string, std::shared_ptr<CancellationToken>> inflight;

    nlohmann::json handleInitialize(const nlohmann::json& id, const nlohmann::json& params);
    void handleNotification(const std::string& method, const nlohmann::json& params);
    nlohmann::json dispatchRequest(const std::string& method, const nlohmann::json& id, const nlohmann::json& params);
};
