/**
 * @file settings_test.cpp
 * @brief Unit tests for settings parsing, loading and config path resolution
 *
 * (c) 2026 QuickSend Project
 * Licensed under MIT License
 */

#include "quicksend/Settings.h"
#include "quicksend/config.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace QuickSend;
namespace fs = std::filesystem;

//=============================================================================
// Test Fixtures
//=============================================================================

/**
 * @brief Temp directory plus saved environment for config path tests
 */
class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_dir = fs::temp_directory_path() /
                ("quicksend_settings_" + std::to_string(::getpid()));
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);

        saveEnv("QUICKSEND_CONFIG", m_savedConfig, m_hadConfig);
        saveEnv("XDG_CONFIG_HOME", m_savedXdg, m_hadXdg);
        saveEnv("HOME", m_savedHome, m_hadHome);
    }

    void TearDown() override {
        restoreEnv("QUICKSEND_CONFIG", m_savedConfig, m_hadConfig);
        restoreEnv("XDG_CONFIG_HOME", m_savedXdg, m_hadXdg);
        restoreEnv("HOME", m_savedHome, m_hadHome);

        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    fs::path writeConfig(const std::string& name, const std::string& content) {
        fs::path path = m_dir / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path m_dir;

private:
    static void saveEnv(const char* name, std::string& value, bool& present) {
        const char* current = std::getenv(name);
        present = current != nullptr;
        value = current ? current : "";
    }

    static void restoreEnv(const char* name, const std::string& value, bool present) {
        if (present) {
            ::setenv(name, value.c_str(), 1);
        } else {
            ::unsetenv(name);
        }
    }

    std::string m_savedConfig, m_savedXdg, m_savedHome;
    bool m_hadConfig = false, m_hadXdg = false, m_hadHome = false;
};

//=============================================================================
// fromJson Tests
//=============================================================================

/**
 * @test Defaults match the compiled-in constants
 */
TEST_F(SettingsTest, DefaultsMatchConstants) {
    Settings s;
    EXPECT_EQ(s.transferPort, TRANSFER_PORT);
    EXPECT_EQ(s.discoveryPort, DISCOVERY_PORT);
    EXPECT_EQ(s.broadcastIntervalMs, BROADCAST_INTERVAL_MS);
    EXPECT_EQ(s.discoveryTimeoutMs, DISCOVERY_TIMEOUT_MS);
    EXPECT_EQ(s.connectionTimeoutMs, CONNECTION_TIMEOUT_MS);
    EXPECT_EQ(s.bufferSize, BUFFER_SIZE);
    EXPECT_TRUE(s.logFile.empty());
}

TEST_F(SettingsTest, FromJsonOverridesFields) {
    json j = {
        {"transfer_port", 9100},
        {"discovery_port", 9101},
        {"broadcast_interval_ms", 250},
        {"discovery_timeout_ms", 3000},
        {"connection_timeout_ms", 7000},
        {"buffer_size", 65536},
        {"log_file", "/tmp/qs.log"}
    };

    std::vector<std::string> warnings;
    Settings s = Settings::fromJson(j, warnings);

    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(s.transferPort, 9100);
    EXPECT_EQ(s.discoveryPort, 9101);
    EXPECT_EQ(s.broadcastIntervalMs, 250u);
    EXPECT_EQ(s.discoveryTimeoutMs, 3000u);
    EXPECT_EQ(s.connectionTimeoutMs, 7000u);
    EXPECT_EQ(s.bufferSize, 65536u);
    EXPECT_EQ(s.logFile, "/tmp/qs.log");
}

/**
 * @test Rejected values keep their defaults and produce one warning each
 */
TEST_F(SettingsTest, OutOfRangeValuesWarnAndKeepDefaults) {
    json j = {
        {"transfer_port", 70000},
        {"discovery_port", 0},
        {"broadcast_interval_ms", -5},
        {"buffer_size", 16}
    };

    std::vector<std::string> warnings;
    Settings s = Settings::fromJson(j, warnings);

    EXPECT_EQ(warnings.size(), 4u);
    EXPECT_EQ(s.transferPort, TRANSFER_PORT);
    EXPECT_EQ(s.discoveryPort, DISCOVERY_PORT);
    EXPECT_EQ(s.broadcastIntervalMs, BROADCAST_INTERVAL_MS);
    EXPECT_EQ(s.bufferSize, BUFFER_SIZE);
}

TEST_F(SettingsTest, WrongTypesWarn) {
    json j = {
        {"transfer_port", "9100"},
        {"log_file", 42}
    };

    std::vector<std::string> warnings;
    Settings s = Settings::fromJson(j, warnings);

    EXPECT_EQ(warnings.size(), 2u);
    EXPECT_EQ(s.transferPort, TRANSFER_PORT);
    EXPECT_TRUE(s.logFile.empty());
}

TEST_F(SettingsTest, TransferPortZeroMeansEphemeral) {
    std::vector<std::string> warnings;
    Settings s = Settings::fromJson(json{{"transfer_port", 0}}, warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(s.transferPort, 0);
}

TEST_F(SettingsTest, NonObjectRootWarns) {
    std::vector<std::string> warnings;
    Settings s = Settings::fromJson(json::array({1, 2}), warnings);
    EXPECT_EQ(warnings.size(), 1u);
    EXPECT_EQ(s.transferPort, TRANSFER_PORT);
}

TEST_F(SettingsTest, UnknownKeysIgnored) {
    std::vector<std::string> warnings;
    Settings::fromJson(json{{"theme", "dark"}}, warnings);
    EXPECT_TRUE(warnings.empty());
}

/**
 * @test toJson output reads back to the same values
 */
TEST_F(SettingsTest, ToJsonReadsBack) {
    Settings original;
    original.transferPort = 1234;
    original.bufferSize = MIN_BUFFER_SIZE;
    original.logFile = "trace.log";

    std::vector<std::string> warnings;
    Settings copy = Settings::fromJson(original.toJson(), warnings);
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(copy.transferPort, 1234);
    EXPECT_EQ(copy.bufferSize, MIN_BUFFER_SIZE);
    EXPECT_EQ(copy.logFile, "trace.log");
}

//=============================================================================
// loadFromFile Tests
//=============================================================================

TEST_F(SettingsTest, LoadFromFile) {
    fs::path path = writeConfig("config.json", R"({"discovery_timeout_ms": 1500})");

    Settings s;
    std::vector<std::string> warnings;
    ASSERT_TRUE(Settings::loadFromFile(path, s, warnings));
    EXPECT_TRUE(warnings.empty());
    EXPECT_EQ(s.discoveryTimeoutMs, 1500u);
}

TEST_F(SettingsTest, MissingFileReturnsFalse) {
    Settings s;
    s.transferPort = 1;
    std::vector<std::string> warnings;
    EXPECT_FALSE(Settings::loadFromFile(m_dir / "absent.json", s, warnings));
    EXPECT_EQ(s.transferPort, TRANSFER_PORT);
}

/**
 * @test Malformed JSON falls back to defaults with a warning
 */
TEST_F(SettingsTest, MalformedFileUsesDefaults) {
    fs::path path = writeConfig("bad.json", "{\"transfer_port\": ");

    Settings s;
    std::vector<std::string> warnings;
    EXPECT_TRUE(Settings::loadFromFile(path, s, warnings));
    EXPECT_EQ(warnings.size(), 1u);
    EXPECT_EQ(s.transferPort, TRANSFER_PORT);
}

TEST_F(SettingsTest, LoadSettingsUsesExplicitPath) {
    fs::path path = writeConfig("explicit.json", R"({"transfer_port": 9999})");
    EXPECT_EQ(loadSettings(path).transferPort, 9999);
    EXPECT_EQ(loadSettings(m_dir / "absent.json").transferPort, TRANSFER_PORT);
}

//=============================================================================
// resolveConfigPath Tests
//=============================================================================

TEST_F(SettingsTest, ResolveOrder) {
    ::setenv("QUICKSEND_CONFIG", "/env/config.json", 1);
    ::setenv("XDG_CONFIG_HOME", "/xdg", 1);
    ::setenv("HOME", "/home/user", 1);

    EXPECT_EQ(resolveConfigPath("/explicit.json"), fs::path("/explicit.json"));
    EXPECT_EQ(resolveConfigPath({}), fs::path("/env/config.json"));

    ::unsetenv("QUICKSEND_CONFIG");
    EXPECT_EQ(resolveConfigPath({}), fs::path("/xdg/quicksend/config.json"));

    ::unsetenv("XDG_CONFIG_HOME");
    EXPECT_EQ(resolveConfigPath({}), fs::path("/home/user/.config/quicksend/config.json"));

    ::unsetenv("HOME");
    EXPECT_TRUE(resolveConfigPath({}).empty());
}
