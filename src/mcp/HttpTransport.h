#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include "mcp/ITransport.h"
#include "core/ConfigManager.h"

namespace httplib {
class Server;
}

/**
 * @brief JSON-RPC over HTTP: one frame per POST /mcp.
 *
 * Requests are answered with 200 and the response frame, notifications with
 * 202 and no body. Only callers on the allowlist are served; with an empty
 * allowlist that is loopback only. The HTTP server's worker pool gives
 * every request its own task.
 */
class HttpTransport : public ITransport {
public:
    explicit HttpTransport(const Config::Network& network);
    ~HttpTransport() override;

    // Binds the listening socket; port 0 picks a free port. Throws on failure.
    int bind();
    int port() const { return boundPort; }

    void run(MessageHandler handler) override;
    void stop() override;

    bool isAddressAllowed(const std::string& address) const;

private:
    struct Subnet {
        uint32_t network;
        uint32_t mask;
    };

    Config::Network settings;
    std::vector<Subnet> subnets;
    std::unique_ptr<httplib::Server> server;
    int boundPort = -1;

    static bool parseIPv4(const std::string& text, uint32_t& out);
    static Subnet parseSubnet(const std::string& cidr);
};
