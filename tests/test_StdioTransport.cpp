#include <gtest/gtest.h>
#include "mcp/StdioTransport.h"
#include "mcp/MCPServer.h"
#include "core/ServerContext.h"
#include "TestEnvironment.h"
#include <sstream>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace std::chrono_literals;

class StdioTransportTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { ignoreSigpipe(); }

    void SetUp() override {
        ASSERT_EQ(pipe(fds), 0);
    }

    void TearDown() override {
        closeInput();
        if (fds[0] >= 0) close(fds[0]);
    }

    void sendLine(const std::string& line) {
        std::string data = line + "\n";
        ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void sendFrame(const nlohmann::json& frame) { sendLine(frame.dump()); }

    void closeInput() {
        if (fds[1] >= 0) {
            close(fds[1]);
            fds[1] = -1;
        }
    }

    static std::vector<nlohmann::json> parseOutput(const std::string& text) {
        std::vector<nlohmann::json> frames;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) frames.push_back(nlohmann::json::parse(line));
        }
        return frames;
    }

    static nlohmann::json request(int id, const std::string& method, const nlohmann::json& params = nullptr) {
        nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
        if (!params.is_null()) msg["params"] = params;
        return msg;
    }

    int fds[2] = {-1, -1};
};

TEST_F(StdioTransportTest, SlowRequestDoesNotBlockLaterOnes) {
    MCPServer server({"test", "1"});
    server.setRequestHandler("slow", [](const nlohmann::json&, CancellationToken&) {
        std::this_thread::sleep_for(500ms);
        return nlohmann::json{{"done", true}};
    });

    std::ostringstream out;
    StdioTransport transport(fds[0], out);
    std::thread reader([&] {
        transport.run([&server](const std::string& frame) { return server.handleMessage(frame); });
    });

    sendFrame(request(0, "initialize"));
    std::this_thread::sleep_for(100ms);
    sendFrame(request(1, "slow"));
    sendFrame(request(2, "ping"));
    closeInput();
    reader.join();

    auto frames = parseOutput(out.str());
    ASSERT_EQ(frames.size(), 3u) << out.str();
    EXPECT_EQ(frames[0]["id"], 0);
    EXPECT_EQ(frames[1]["id"], 2);
    EXPECT_EQ(frames[2]["id"], 1);
    EXPECT_EQ(frames[2]["result"]["done"], true);
}

TEST_F(StdioTransportTest, DropsMalformedFramesAndNotifications) {
    MCPServer server({"test", "1"});
    std::ostringstream out;
    StdioTransport transport(fds[0], out);
    std::thread reader([&] {
        transport.run([&server](const std::string& frame) { return server.handleMessage(frame); });
    });

    sendLine("this is not json");
    sendLine("");
    sendFrame({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    sendFrame(request(1, "ping"));
    closeInput();
    reader.join();

    auto frames = parseOutput(out.str());
    ASSERT_EQ(frames.size(), 1u) << out.str();
    EXPECT_EQ(frames[0]["id"], 1);
}

TEST_F(StdioTransportTest, StopEndsRunWithoutEof) {
    MCPServer server({"test", "1"});
    std::ostringstream out;
    StdioTransport transport(fds[0], out);
    std::thread reader([&] {
        transport.run([&server](const std::string& frame) { return server.handleMessage(frame); });
    });

    std::this_thread::sleep_for(100ms);
    transport.stop();
    reader.join();
    EXPECT_TRUE(out.str().empty());
}

TEST_F(StdioTransportTest, CancellationReachesRunningCommand) {
    Config cfg;
    cfg.commandTimeout = 30;
    ServerContext context(cfg, testShellEnvironment());

    std::ostringstream out;
    StdioTransport transport(fds[0], out);
    std::thread reader([&] {
        transport.run([&context](const std::string& frame) { return context.handleFrame(frame); });
    });

    auto start = std::chrono::steady_clock::now();
    sendFrame(request(0, "initialize"));
    sendFrame({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    std::this_thread::sleep_for(100ms);
    sendFrame(request(1, "tools/call", {{"name", "bash"}, {"arguments", {{"command", "sleep 20"}}}}));
    std::this_thread::sleep_for(500ms);
    sendFrame({{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"}, {"params", {{"requestId", 1}}}});
    sendFrame(request(2, "tools/call", {{"name", "bash"}, {"arguments", {{"command", "echo fresh"}}}}));
    closeInput();
    reader.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 10s);

    auto frames = parseOutput(out.str());
    ASSERT_EQ(frames.size(), 3u) << out.str();
    nlohmann::json cancelled, fresh;
    for (const auto& f : frames) {
        if (f["id"] == 1) cancelled = f;
        if (f["id"] == 2) fresh = f;
    }
    ASSERT_TRUE(cancelled.contains("result"));
    EXPECT_TRUE(cancelled["result"]["isError"].get<bool>());
    EXPECT_NE(cancelled["result"]["content"][0]["text"].get<std::string>().find("cancelled"), std::string::npos);
    ASSERT_TRUE(fresh.contains("result"));
    EXPECT_EQ(fresh["result"]["content"][0]["text"], "fresh");
}
