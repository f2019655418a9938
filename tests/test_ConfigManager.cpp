#include <gtest/gtest.h>
#include "core/ConfigManager.h"
#include <filesystem>
#include <fstream>
#include <chrono>

namespace fs = std::filesystem;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / ("bashmcp_config_test_" + std::to_string(now));
        fs::create_directories(testDir / "exe");
        fs::create_directories(testDir / "cwd");
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream f(path);
        f << content;
    }

    fs::path testDir;
};

TEST_F(ConfigManagerTest, DefaultsAreApplied) {
    Config cfg = Config::fromJson(nlohmann::json::object());
    EXPECT_EQ(cfg.commandTimeout, 600);
    EXPECT_EQ(cfg.getTimeout(), std::chrono::seconds(600));
    EXPECT_TRUE(cfg.enabled);
    EXPECT_EQ(cfg.socketDir, "/tmp/mcp-sockets");
    EXPECT_FALSE(cfg.network.enabled);
}

TEST_F(ConfigManagerTest, ReadsAllFields) {
    Config cfg = Config::fromJson({
        {"commandTimeout", 30},
        {"socketDir", "/tmp/custom"},
        {"logFile", "/tmp/bash-mcp.log"},
        {"debug", true},
        {"network", {
            {"enabled", true},
            {"allowedIPs", nlohmann::json::array({"10.0.0.5"})},
            {"allowedSubnets", nlohmann::json::array({"192.168.0.0/16"})}
        }}
    });
    EXPECT_EQ(cfg.commandTimeout, 30);
    EXPECT_EQ(cfg.socketDir, "/tmp/custom");
    EXPECT_EQ(cfg.logFile, "/tmp/bash-mcp.log");
    EXPECT_TRUE(cfg.debug);
    EXPECT_TRUE(cfg.network.enabled);
    EXPECT_EQ(cfg.network.host, "localhost");
    EXPECT_EQ(cfg.network.port, 3000);
    EXPECT_EQ(cfg.network.allowedIPs, std::vector<std::string>{"10.0.0.5"});
    EXPECT_EQ(cfg.network.allowedSubnets, std::vector<std::string>{"192.168.0.0/16"});
}

TEST_F(ConfigManagerTest, RejectsUnusableValues) {
    try {
        Config::fromJson({{"enabled", false}});
        FAIL() << "expected exception";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "bash tool is disabled in configuration");
    }
    EXPECT_THROW(Config::fromJson({{"commandTimeout", -1}}), std::runtime_error);
    EXPECT_THROW(Config::fromJson({{"network", {{"enabled", true}, {"port", 70000}}}}), std::runtime_error);
    EXPECT_THROW(Config::fromJson(nlohmann::json::array()), std::runtime_error);
}

TEST_F(ConfigManagerTest, LoadReportsParseErrorsWithPath) {
    fs::path path = testDir / "broken.json";
    writeFile(path, "{ \"commandTimeout\": ");
    try {
        Config::load(path.string());
        FAIL() << "expected exception";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
    EXPECT_THROW(Config::load((testDir / "missing.json").string()), std::runtime_error);
}

TEST_F(ConfigManagerTest, LoadRejectsWrongTypes) {
    fs::path path = testDir / "types.json";
    writeFile(path, R"({"commandTimeout": "fast"})");
    EXPECT_THROW(Config::load(path.string()), std::runtime_error);
}

TEST_F(ConfigManagerTest, ExecutableDirectoryWins) {
    writeFile(testDir / "exe" / Config::kFileName, R"({"commandTimeout": 11})");
    writeFile(testDir / "cwd" / Config::kFileName, R"({"commandTimeout": 22})");

    std::string found;
    Config cfg = Config::loadOrCreate(testDir / "exe", testDir / "cwd", found);
    EXPECT_EQ(cfg.commandTimeout, 11);
    EXPECT_EQ(found, (testDir / "exe" / Config::kFileName).string());
}

TEST_F(ConfigManagerTest, FallsBackToWorkingDirectory) {
    writeFile(testDir / "cwd" / Config::kFileName, R"({"commandTimeout": 22})");

    std::string found;
    Config cfg = Config::loadOrCreate(testDir / "exe", testDir / "cwd", found);
    EXPECT_EQ(cfg.commandTimeout, 22);
    EXPECT_EQ(found, (testDir / "cwd" / Config::kFileName).string());
}

TEST_F(ConfigManagerTest, WritesDefaultWhenMissing) {
    std::string found;
    Config cfg = Config::loadOrCreate(testDir / "exe", testDir / "cwd", found);
    EXPECT_EQ(cfg.commandTimeout, 600);

    fs::path written = testDir / "exe" / Config::kFileName;
    ASSERT_TRUE(fs::exists(written));
    EXPECT_EQ(found, written.string());

    Config reloaded = Config::load(written.string());
    EXPECT_EQ(reloaded.commandTimeout, 600);
    EXPECT_TRUE(reloaded.enabled);
    EXPECT_EQ(reloaded.socketDir, "/tmp/mcp-sockets");
}
