#include <gtest/gtest.h>
#include "core/ServerContext.h"
#include "TestEnvironment.h"

class ServerContextTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { ignoreSigpipe(); }

    void SetUp() override {
        Config cfg;
        cfg.commandTimeout = 5;
        context = std::make_unique<ServerContext>(cfg, testShellEnvironment());
    }

    nlohmann::json send(const nlohmann::json& message) {
        auto res = context->handleFrame(message.dump());
        return res ? *res : nlohmann::json();
    }

    nlohmann::json request(int id, const std::string& method, const nlohmann::json& params = nullptr) {
        nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (!params.is_null()) msg["params"] = params;
        return send(msg);
    }

    void initialize() {
        auto res = request(0, "initialize", {{"protocolVersion", "2024-11-05"}});
        ASSERT_TRUE(res.contains("result"));
        send({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    }

    std::unique_ptr<ServerContext> context;
};

TEST_F(ServerContextTest, InitializeReportsServerInfo) {
    auto res = request(1, "initialize");
    EXPECT_EQ(res["result"]["serverInfo"]["name"], ServerContext::kServerName);
    EXPECT_EQ(res["result"]["serverInfo"]["version"], ServerContext::kServerVersion);
}

TEST_F(ServerContextTest, ListsBashTool) {
    initialize();
    auto res = request(1, "tools/list");
    ASSERT_TRUE(res["result"]["tools"].is_array());
    ASSERT_EQ(res["result"]["tools"].size(), 1u);
    EXPECT_EQ(res["result"]["tools"][0]["name"], "bash");

    auto legacy = request(2, "list_tools");
    EXPECT_EQ(legacy["result"], res["result"]);
}

TEST_F(ServerContextTest, CallsBashTool) {
    initialize();
    auto res = request(3, "tools/call", {{"name", "bash"}, {"arguments", {{"command", "echo hi"}}}});
    ASSERT_TRUE(res.contains("result")) << res.dump();
    EXPECT_EQ(res["id"], 3);
    EXPECT_EQ(res["result"]["content"][0]["text"], "hi");
    EXPECT_FALSE(res["result"].value("isError", false));

    auto legacy = request(4, "call_tool", {{"name", "bash"}, {"arguments", {{"command", "echo legacy"}}}});
    EXPECT_EQ(legacy["result"]["content"][0]["text"], "legacy");
}

TEST_F(ServerContextTest, InvalidCallParamsAreProtocolErrors) {
    initialize();
    auto res = request(5, "tools/call", {{"arguments", {{"command", "echo hi"}}}});
    EXPECT_EQ(res["error"]["code"], static_cast<int>(MCPError::INVALID_PARAMS));

    res = request(6, "tools/call", {{"name", 12}});
    EXPECT_EQ(res["error"]["code"], static_cast<int>(MCPError::INVALID_PARAMS));
}

TEST_F(ServerContextTest, ToolFailuresAreContent) {
    initialize();
    auto res = request(7, "tools/call", {{"name", "bash"}, {"arguments", nlohmann::json::object()}});
    ASSERT_TRUE(res.contains("result"));
    EXPECT_TRUE(res["result"]["isError"].get<bool>());
    EXPECT_EQ(res["result"]["content"][0]["text"], "Error: command parameter is required");

    res = request(8, "tools/call", {{"name", "missing"}});
    EXPECT_TRUE(res["result"]["isError"].get<bool>());
}

TEST_F(ServerContextTest, ShutdownStopsCommandExecution) {
    initialize();
    request(9, "tools/call", {{"name", "bash"}, {"arguments", {{"command", "true"}}}});
    EXPECT_TRUE(context->manager().hasSession());

    context->shutdown();
    EXPECT_FALSE(context->manager().hasSession());

    auto res = request(10, "tools/call", {{"name", "bash"}, {"arguments", {{"command", "echo late"}}}});
    EXPECT_TRUE(res["result"]["isError"].get<bool>());
    EXPECT_NO_THROW(context->shutdown());
}
