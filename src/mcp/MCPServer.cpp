#include "mcp/MCPServer.h"
#include "utils/Logger.h"

namespace {
const size_t kMaxLogLen = 500;

bool isNotificationMethod(const std::string& method) {
    return method.rfind(Protocol::kNotificationPrefix, 0) == 0;
}
} // namespace

MCPServer::MCPServer(ServerInfo info) : serverInfo(std::move(info)) {
    setRequestHandler("ping", [](const nlohmann::json&, CancellationToken&) {
        return nlohmann::json::object();
    });
    setNotificationHandler("notifications/cancelled", [this](const nlohmann::json& params) {
        if (!params.is_object() || !params.contains("requestId")) {
            Logger::getInstance().warn("notifications/cancelled without requestId");
            return;
        }
        std::string reason = params.value("reason", "");
        bool found = cancelRequest(params["requestId"]);
        Logger::getInstance().info("Cancellation requested for request " + params["requestId"].dump() +
                                   (reason.empty() ? "" : " (" + reason + ")") +
                                   (found ? "" : ": no such request in flight"));
    });
}

void MCPServer::setRequestHandler(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex);
    handlers[method] = std::move(handler);
}

void MCPServer::setNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(handlersMutex);
    notificationHandlers[method] = std::move(handler);
}

MCPServer::RequestHandler MCPServer::getHandler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(handlersMutex);
    auto it = handlers.find(method);
    if (it == handlers.end()) return nullptr;
    return it->second;
}

std::optional<nlohmann::json> MCPServer::handleMessage(const std::string& frame) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(frame);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().error(std::string("Failed to parse frame: ") + e.what());
        return std::nullopt;
    }
    return handleMessage(message);
}

std::optional<nlohmann::json> MCPServer::handleMessage(const nlohmann::json& message) {
    if (!message.is_object()) {
        Logger::getInstance().error("Dropping frame that is not a JSON object");
        return std::nullopt;
    }

    const bool hasId = message.contains("id");
    const nlohmann::json id = hasId ? message["id"] : nlohmann::json(nullptr);
    nlohmann::json params = nlohmann::json::object();
    if (message.contains("params") && !message["params"].is_null()) {
        params = message["params"];
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        if (!hasId) {
            Logger::getInstance().error("Dropping notification without method");
            return std::nullopt;
        }
        return Protocol::makeError(id, MCPError::INVALID_REQUEST, "Invalid request: missing method");
    }
    const std::string method = message["method"].get<std::string>();
    Logger::getInstance().debug("Handling method: " + method + ", ID: " + id.dump());

    if (method == "notifications/initialized" || method == "initialized") {
        Logger::getInstance().info("Received initialized notification, server is ready");
        initialized = true;
        return std::nullopt;
    }

    // JSON-RPC forbids answering notifications, whatever the state.
    if (isNotificationMethod(method) || !hasId) {
        handleNotification(method, params);
        return std::nullopt;
    }

    if (method == "initialize") {
        return handleInitialize(id, params);
    }

    if (!initialized && method != "ping") {
        Logger::getInstance().warn("Rejecting request " + method + " because server is not initialized");
        return Protocol::makeError(id, MCPError::NOT_INITIALIZED, "Server not initialized");
    }

    return dispatchRequest(method, id, params);
}

nlohmann::json MCPServer::handleInitialize(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() ||
        (params.contains("protocolVersion") && !params["protocolVersion"].is_string())) {
        Logger::getInstance().error("Invalid initialize parameters");
        return Protocol::makeError(id, MCPError::INVALID_PARAMS, "Invalid initialize parameters");
    }

    std::string protocolVersion = params.value("protocolVersion", "");
    if (protocolVersion.empty()) {
        protocolVersion = Protocol::kDefaultProtocolVersion;
    }

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        Logger::getInstance().info("Client info: " + client.value("name", std::string("unknown")) + " " +
                                   client.value("version", std::string("")));
    }
    Logger::getInstance().info("Protocol version: " + protocolVersion);

    nlohmann::json result = {
        {"protocolVersion", protocolVersion},
        {"capabilities", {
            {"tools", {
                {"list", true},
                {"call", true}
            }}
        }},
        {"serverInfo", {
            {"name", serverInfo.name},
            {"version", serverInfo.version}
        }}
    };

    initialized = true;
    return Protocol::makeResult(id, result);
}

void MCPServer::handleNotification(const std::string& method, const nlohmann::json& params) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex);
        auto it = notificationHandlers.find(method);
        if (it != notificationHandlers.end()) handler = it->second;
    }
    Logger::getInstance().info("Received notification: " + method);
    if (!handler) return;

    try {
        handler(params);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Notification handler for " + method + " failed: " + e.what());
    }
}

nlohmann::json MCPServer::dispatchRequest(const std::string& method, const nlohmann::json& id, const nlohmann::json& params) {
    RequestHandler handler = getHandler(method);
    if (!handler) {
        Logger::getInstance().warn("Method not supported: " + method);
        return Protocol::makeError(id, MCPError::METHOD_NOT_FOUND, "Method not supported: " + method);
    }

    auto token = std::make_shared<CancellationToken>();
    const std::string key = id.dump();
    std::multimap<std::string, std::shared_ptr<CancellationToken>>::iterator entry;
    {
        std::lock_guard<std::mutex> lock(inflightMutex);
        entry = inflight.emplace(key, token);
    }
    struct InflightRegistration {
        MCPServer& server;
        std::multimap<std::string, std::shared_ptr<CancellationToken>>::iterator entry;
        ~InflightRegistration() {
            std::lock_guard<std::mutex> lock(server.inflightMutex);
            server.inflight.erase(entry);
        }
    } registration{*this, entry};

    try {
        nlohmann::json result = handler(params, *token);
        nlohmann::json response = Protocol::makeResult(id, result);
        Logger::getInstance().debug("Response: " + Logger::truncate(Protocol::serialize(response), kMaxLogLen));
        return response;
    } catch (const InvalidParamsError& e) {
        Logger::getInstance().warn("Invalid params for " + method + ": " + e.what());
        return Protocol::makeError(id, MCPError::INVALID_PARAMS, e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error("Handler error for method " + method + ": " + e.what());
        return Protocol::makeError(id, MCPError::HANDLER_ERROR, e.what());
    }
}

bool MCPServer::cancelRequest(const nlohmann::json& requestId) {
    std::lock_guard<std::mutex> lock(inflightMutex);
    auto range = inflight.equal_range(requestId.dump());
    bool found = false;
    for (auto it = range.first; it != range.second; ++it) {
        it->second->cancel();
        found = true;
    }
    return found;
}

void MCPServer::cancelAll() {
    std::lock_guard<std::mutex> lock(inflightMutex);
    for (auto& [key, token] : inflight) {
        token->cancel();
    }
}

size_t MCPServer::inflightCount() const {
    std::lock_guard<std::mutex> lock(inflightMutex);
    return inflight.size();
}
