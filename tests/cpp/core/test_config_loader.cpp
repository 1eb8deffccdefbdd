/**
 * @file test_config_loader.cpp
 * @brief Unit tests for the client config loader (JSON configuration)
 */

#include "playctl/core/config_loader.h"
#include "support/temp_dir.h"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace playctl;

class ConfigLoaderTest : public ::testing::Test {
   protected:
    fs::path tempDir;
    fs::path testConfigPath;

    void SetUp() override {
        tempDir = test_support::makeTestTempDir("config_loader");
        testConfigPath = tempDir / "playctl.json";
    }

    void TearDown() override {
        fs::remove_all(tempDir);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(testConfigPath);
        file << content;
        file.close();
    }
};

// ============================================================
// Missing / invalid files
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    ClientConfig config;
    bool result = loadClientConfig("/nonexistent/path/playctl.json", config, false);

    EXPECT_FALSE(result);
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    ClientConfig config;
    config.commandPath = "/somewhere/else";
    loadClientConfig("/nonexistent/path/playctl.json", config, false);

    EXPECT_EQ(config.commandPath, "/tmp/audio");
    EXPECT_EQ(config.statusPath, "/tmp/audioStatus.json");
    EXPECT_EQ(config.confirmTimeoutMs, 2000);
    EXPECT_EQ(config.pollIntervalUs, 1000);
    EXPECT_EQ(config.namePrefix, "cpp_audio_");
}

TEST_F(ConfigLoaderTest, LoadInvalidJsonReturnsFalse) {
    writeConfig("{ \"commandPath\": ");

    ClientConfig config;
    EXPECT_FALSE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.commandPath, ClientConstants::DEFAULT_COMMAND_PATH);
}

TEST_F(ConfigLoaderTest, LoadNonObjectReturnsFalse) {
    writeConfig("[1, 2, 3]");

    ClientConfig config;
    EXPECT_FALSE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.statusPath, ClientConstants::DEFAULT_STATUS_PATH);
}

TEST_F(ConfigLoaderTest, WrongTypeFallsBackToDefaults) {
    writeConfig(R"({"commandPath": "/run/audio", "confirmTimeoutMs": "soon"})");

    ClientConfig config;
    EXPECT_FALSE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.commandPath, ClientConstants::DEFAULT_COMMAND_PATH);
    EXPECT_EQ(config.confirmTimeoutMs, ClientConstants::DEFAULT_CONFIRM_TIMEOUT_MS);
}

// ============================================================
// Valid files
// ============================================================

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeConfig("{}");

    ClientConfig config;
    EXPECT_TRUE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.commandPath, "/tmp/audio");
    EXPECT_EQ(config.confirmTimeoutMs, 2000);
}

TEST_F(ConfigLoaderTest, LoadFullConfig) {
    writeConfig(R"({
        "commandPath": "/run/audio/cmd",
        "statusPath": "/run/audio/status.json",
        "confirmTimeoutMs": 500,
        "pollIntervalUs": 250,
        "namePrefix": "game_sfx_",
        "logging": {"level": "debug"}
    })");

    ClientConfig config;
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));

    EXPECT_EQ(config.commandPath, "/run/audio/cmd");
    EXPECT_EQ(config.statusPath, "/run/audio/status.json");
    EXPECT_EQ(config.confirmTimeoutMs, 500);
    EXPECT_EQ(config.pollIntervalUs, 250);
    EXPECT_EQ(config.namePrefix, "game_sfx_");
}

TEST_F(ConfigLoaderTest, PartialConfigKeepsOtherDefaults) {
    writeConfig(R"({"statusPath": "/var/run/status.json"})");

    ClientConfig config;
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));

    EXPECT_EQ(config.statusPath, "/var/run/status.json");
    EXPECT_EQ(config.commandPath, "/tmp/audio");
    EXPECT_EQ(config.pollIntervalUs, 1000);
}

// ============================================================
// Clamping
// ============================================================

TEST_F(ConfigLoaderTest, NonPositiveTimeoutUsesDefault) {
    writeConfig(R"({"confirmTimeoutMs": 0})");

    ClientConfig config;
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.confirmTimeoutMs, ClientConstants::DEFAULT_CONFIRM_TIMEOUT_MS);

    writeConfig(R"({"confirmTimeoutMs": -5})");
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.confirmTimeoutMs, ClientConstants::DEFAULT_CONFIRM_TIMEOUT_MS);
}

TEST_F(ConfigLoaderTest, PollIntervalIsClamped) {
    writeConfig(R"({"pollIntervalUs": -10})");

    ClientConfig config;
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.pollIntervalUs, 0);

    writeConfig(R"({"pollIntervalUs": 5000000})");
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.pollIntervalUs, ClientConstants::MAX_POLL_INTERVAL_US);
}

TEST_F(ConfigLoaderTest, ZeroPollIntervalMeansSpin) {
    writeConfig(R"({"pollIntervalUs": 0})");

    ClientConfig config;
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.pollIntervalUs, 0);
}

TEST_F(ConfigLoaderTest, EmptyStringsFallBackToDefaults) {
    writeConfig(R"({"commandPath": "", "statusPath": "", "namePrefix": ""})");

    ClientConfig config;
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, false));
    EXPECT_EQ(config.commandPath, ClientConstants::DEFAULT_COMMAND_PATH);
    EXPECT_EQ(config.statusPath, ClientConstants::DEFAULT_STATUS_PATH);
    EXPECT_EQ(config.namePrefix, ClientConstants::DEFAULT_NAME_PREFIX);
}

TEST_F(ConfigLoaderTest, VerboseLoadDoesNotChangeResult) {
    writeConfig(R"({"confirmTimeoutMs": -1, "pollIntervalUs": 999999})");

    ClientConfig config;
    ASSERT_TRUE(loadClientConfig(testConfigPath, config, true));
    EXPECT_EQ(config.confirmTimeoutMs, ClientConstants::DEFAULT_CONFIRM_TIMEOUT_MS);
    EXPECT_EQ(config.pollIntervalUs, ClientConstants::MAX_POLL_INTERVAL_US);
}
