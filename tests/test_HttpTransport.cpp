#include <gtest/gtest.h>
#include "mcp/HttpTransport.h"
#include "mcp/MCPServer.h"
#include "httplib.h"
#include <thread>

namespace {
Config::Network loopbackNetwork() {
    Config::Network net;
    net.enabled = true;
    net.host = "127.0.0.1";
    net.port = 0;
    return net;
}
} // namespace

class HttpTransportTest : public ::testing::Test {
protected:
    HttpTransportTest() : server({"http-test", "1"}) {}

    void start(const Config::Network& net) {
        transport = std::make_unique<HttpTransport>(net);
        port = transport->bind();
        worker = std::thread([this] {
            transport->run([this](const std::string& frame) { return server.handleMessage(frame); });
        });
    }

    void TearDown() override {
        if (transport) transport->stop();
        if (worker.joinable()) worker.join();
    }

    httplib::Result post(const std::string& body) {
        httplib::Client client("127.0.0.1", port);
        client.set_read_timeout(5, 0);
        return client.Post("/mcp", body, "application/json");
    }

    MCPServer server;
    std::unique_ptr<HttpTransport> transport;
    std::thread worker;
    int port = 0;
};

TEST_F(HttpTransportTest, AnswersRequests) {
    start(loopbackNetwork());
    ASSERT_GT(port, 0);

    auto res = post(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["id"], 1);
    EXPECT_EQ(body["result"]["serverInfo"]["name"], "http-test");

    res = post(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(nlohmann::json::parse(res->body)["result"], nlohmann::json::object());
}

TEST_F(HttpTransportTest, NotificationsGetAcceptedWithoutBody) {
    start(loopbackNetwork());
    auto res = post(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 202);
    EXPECT_TRUE(res->body.empty());
    EXPECT_TRUE(server.isInitialized());
}

TEST_F(HttpTransportTest, UnparseableBodyIsBadRequest) {
    start(loopbackNetwork());
    auto res = post("{oops");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"]["code"], static_cast<int>(MCPError::PARSE_ERROR));
}

TEST_F(HttpTransportTest, CallersOutsideAllowlistAreForbidden) {
    auto net = loopbackNetwork();
    net.allowedIPs = {"10.1.2.3"};
    start(net);
    auto res = post(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 403);
}

TEST(HttpAllowlistTest, EmptyAllowlistMeansLoopbackOnly) {
    HttpTransport transport(loopbackNetwork());
    EXPECT_TRUE(transport.isAddressAllowed("127.0.0.1"));
    EXPECT_TRUE(transport.isAddressAllowed("127.0.0.53"));
    EXPECT_TRUE(transport.isAddressAllowed("::1"));
    EXPECT_TRUE(transport.isAddressAllowed("::ffff:127.0.0.1"));
    EXPECT_FALSE(transport.isAddressAllowed("192.168.1.20"));
}

TEST(HttpAllowlistTest, MatchesAddressesAndSubnets) {
    auto net = loopbackNetwork();
    net.allowedIPs = {"203.0.113.9"};
    net.allowedSubnets = {"10.0.0.0/8", "192.168.1.0/24"};
    HttpTransport transport(net);

    EXPECT_TRUE(transport.isAddressAllowed("203.0.113.9"));
    EXPECT_TRUE(transport.isAddressAllowed("10.200.3.4"));
    EXPECT_TRUE(transport.isAddressAllowed("::ffff:192.168.1.77"));
    EXPECT_FALSE(transport.isAddressAllowed("192.168.2.1"));
    EXPECT_FALSE(transport.isAddressAllowed("127.0.0.1"));
    EXPECT_FALSE(transport.isAddressAllowed("fe80::1"));
}

TEST(HttpAllowlistTest, RejectsInvalidSubnets) {
    auto net = loopbackNetwork();
    net.allowedSubnets = {"10.0.0.0/33"};
    EXPECT_THROW(HttpTransport transport(net), std::runtime_error);

    net.allowedSubnets = {"not-an-ip/8"};
    EXPECT_THROW(HttpTransport transport(net), std::runtime_error);
}
