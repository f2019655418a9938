#include "mcp/HttpTransport.h"
#include "mcp/Protocol.h"
#include "utils/Logger.h"
#include "httplib.h"
#include <algorithm>
#include <stdexcept>
#include <arpa/inet.h>

namespace {
const std::string kMappedPrefix = "::ffff:";

std::string normalizeAddress(const std::string& address) {
    if (address.rfind(kMappedPrefix, 0) == 0) return address.substr(kMappedPrefix.size());
    return address;
}
} // namespace

HttpTransport::HttpTransport(const Config::Network& network)
    : settings(network), server(std::make_unique<httplib::Server>()) {
    for (const auto& cidr : settings.allowedSubnets) {
        subnets.push_back(parseSubnet(cidr));
    }
}

HttpTransport::~HttpTransport() {
    stop();
}

bool HttpTransport::parseIPv4(const std::string& text, uint32_t& out) {
    in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return false;
    out = ntohl(addr.s_addr);
    return true;
}

HttpTransport::Subnet HttpTransport::parseSubnet(const std::string& cidr) {
    auto slash = cidr.find('/');
    std::string base = cidr.substr(0, slash);
    int bits = 32;
    if (slash != std::string::npos) {
        try {
            bits = std::stoi(cidr.substr(slash + 1));
        } catch (const std::exception&) {
            throw std::runtime_error("invalid subnet: " + cidr);
        }
    }
    uint32_t address = 0;
    if (!parseIPv4(base, address) || bits < 0 || bits > 32) {
        throw std::runtime_error("invalid subnet: " + cidr);
    }
    uint32_t mask = bits == 0 ? 0 : (0xFFFFFFFFu << (32 - bits));
    return {address & mask, mask};
}

bool HttpTransport::isAddressAllowed(const std::string& rawAddress) const {
    std::string address = normalizeAddress(rawAddress);

    if (settings.allowedIPs.empty() && subnets.empty()) {
        return address == "::1" || address.rfind("127.", 0) == 0;
    }
    if (std::find(settings.allowedIPs.begin(), settings.allowedIPs.end(), address) != settings.allowedIPs.end()) {
        return true;
    }
    uint32_t value = 0;
    if (!parseIPv4(address, value)) return false;
    return std::any_of(subnets.begin(), subnets.end(), [value](const Subnet& s) {
        return (value & s.mask) == s.network;
    });
}

int HttpTransport::bind() {
    if (settings.port == 0) {
        boundPort = server->bind_to_any_port(settings.host.c_str());
    } else if (server->bind_to_port(settings.host.c_str(), settings.port)) {
        boundPort = settings.port;
    }
    if (boundPort <= 0) {
        throw std::runtime_error("failed to bind " + settings.host + ":" + std::to_string(settings.port));
    }
    return boundPort;
}

void HttpTransport::run(MessageHandler handler) {
    if (boundPort <= 0) bind();

    server->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (isAddressAllowed(req.remote_addr)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        Logger::getInstance().warn("Rejected connection from " + req.remote_addr);
        res.status = 403;
        return httplib::Server::HandlerResponse::Handled;
    });

    server->Post("/mcp", [handler](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json message;
        try {
            message = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::parse_error& e) {
            Logger::getInstance().error(std::string("Failed to parse frame: ") + e.what());
            res.status = 400;
            res.set_content(Protocol::serialize(Protocol::makeError(nullptr, MCPError::PARSE_ERROR, "Parse error")),
                            "application/json");
            return;
        }

        try {
            auto response = handler(message.dump());
            if (!response) {
                res.status = 202;
                return;
            }
            res.status = 200;
            res.set_content(Protocol::serialize(*response), "application/json");
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("Error processing request: ") + e.what());
            res.status = 500;
        }
    });

    Logger::getInstance().info("Listening on http://" + settings.host + ":" + std::to_string(boundPort) + "/mcp");
    if (!server->listen_after_bind()) {
        Logger::getInstance().error("HTTP transport stopped with an error");
    }
}

void HttpTransport::stop() {
    if (server) server->stop();
}
