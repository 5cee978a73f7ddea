/*
 * test_runtime_config.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Tests for RuntimeConfig file, environment and validation

**************************************************/

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <random>

#include "common/exceptions.hpp"
#include "config/runtime_config.hpp"

using namespace lumen::config;
namespace fs = std::filesystem;

class RuntimeConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("lumen_config_" + std::to_string(std::random_device{}()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto writeFile(const std::string& name, const std::string& content)
        -> std::string {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }

    static auto lookupFrom(std::map<std::string, std::string> values) {
        return [values = std::move(values)](const std::string& key) {
            auto it = values.find(key);
            return it == values.end() ? std::string() : it->second;
        };
    }

    fs::path dir_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(RuntimeConfigTest, DefaultsAreValid) {
    RuntimeConfig config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.device.cameraIds, (std::vector<int>{1, 2, 3, 4}));
    EXPECT_EQ(config.device.lightPorts.size(), 4u);
    EXPECT_EQ(config.device.baudRate, 9600);
    EXPECT_EQ(config.capture.designatedCamera, 3);
    EXPECT_EQ(config.capture.settleDelayMs, 500u);
    EXPECT_EQ(config.stream.fps, 30);
}

// ============================================================================
// File Loading
// ============================================================================

TEST_F(RuntimeConfigTest, LoadPartialFile) {
    auto path = writeFile("lumen.json", R"({
        "device": {"camera_ids": [5, 6], "camera_backend": "none"},
        "capture": {"save_path": "/srv/images", "settle_delay_ms": 50},
        "stream": {"fps": 10}
    })");

    auto config = RuntimeConfig::loadFromFile(path);
    EXPECT_EQ(config.device.cameraIds, (std::vector<int>{5, 6}));
    EXPECT_EQ(config.device.cameraBackend, "none");
    EXPECT_EQ(config.device.baudRate, 9600);
    EXPECT_EQ(config.capture.savePath, "/srv/images");
    EXPECT_EQ(config.capture.settleDelayMs, 50u);
    EXPECT_EQ(config.capture.product, "ModelA");
    EXPECT_EQ(config.stream.fps, 10);
}

TEST_F(RuntimeConfigTest, MissingFileThrows) {
    EXPECT_THROW(RuntimeConfig::loadFromFile((dir_ / "absent.json").string()),
                 lumen::ConfigException);
}

TEST_F(RuntimeConfigTest, MalformedFileThrows) {
    auto path = writeFile("broken.json", "{ not json");
    EXPECT_THROW(RuntimeConfig::loadFromFile(path), lumen::ConfigException);
}

TEST_F(RuntimeConfigTest, NonObjectRootThrows) {
    auto path = writeFile("array.json", "[1, 2]");
    EXPECT_THROW(RuntimeConfig::loadFromFile(path), lumen::ConfigException);
}

TEST_F(RuntimeConfigTest, WrongValueTypeThrows) {
    auto path = writeFile("typed.json", R"({"stream": {"fps": "fast"}})");
    EXPECT_THROW(RuntimeConfig::loadFromFile(path), lumen::ConfigException);
}

TEST_F(RuntimeConfigTest, ToJsonRoundTripsSections) {
    RuntimeConfig config;
    config.capture.product = "Widget";
    auto restored = RuntimeConfig::fromJson(config.toJson());
    EXPECT_EQ(restored.capture.product, "Widget");
    EXPECT_EQ(restored.device.lightPorts, config.device.lightPorts);
}

// ============================================================================
// Environment
// ============================================================================

TEST_F(RuntimeConfigTest, EnvironmentOverrides) {
    RuntimeConfig config;
    config.applyEnvironment(lookupFrom({
        {"LUMEN_CAMERA_IDS", "2, 4,9"},
        {"LUMEN_LIGHT_PORTS", "/dev/ttyUSB0,/dev/ttyUSB1"},
        {"LUMEN_SAVE_PATH", "/tmp/out"},
        {"LUMEN_SETTLE_DELAY_MS", "25"},
        {"LUMEN_STREAM_FPS", "15"},
        {"LUMEN_LOG_LEVEL", "debug"},
    }));

    EXPECT_EQ(config.device.cameraIds, (std::vector<int>{2, 4, 9}));
    EXPECT_EQ(config.device.lightPorts,
              (std::vector<std::string>{"/dev/ttyUSB0", "/dev/ttyUSB1"}));
    EXPECT_EQ(config.capture.savePath, "/tmp/out");
    EXPECT_EQ(config.capture.settleDelayMs, 25u);
    EXPECT_EQ(config.stream.fps, 15);
    EXPECT_EQ(config.logging.level, spdlog::level::debug);
}

TEST_F(RuntimeConfigTest, UnsetEnvironmentKeepsValues) {
    RuntimeConfig config;
    config.applyEnvironment(lookupFrom({}));
    EXPECT_EQ(config.device.cameraIds, (std::vector<int>{1, 2, 3, 4}));
}

TEST_F(RuntimeConfigTest, NonNumericEnvironmentThrows) {
    RuntimeConfig config;
    EXPECT_THROW(config.applyEnvironment(lookupFrom({{"LUMEN_STREAM_FPS", "x"}})),
                 lumen::ConfigException);
    EXPECT_THROW(
        config.applyEnvironment(lookupFrom({{"LUMEN_CAMERA_IDS", "1,two"}})),
        lumen::ConfigException);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(RuntimeConfigTest, ValidationFailures) {
    {
        RuntimeConfig config;
        config.device.cameraIds = {1, 1};
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        RuntimeConfig config;
        config.device.cameraIds.clear();
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        RuntimeConfig config;
        config.device.cameraBackend = "gige";
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        RuntimeConfig config;
        config.stream.fps = 0;
        EXPECT_FALSE(config.validate().has_value());
    }
    {
        RuntimeConfig config;
        config.device.fallbackWidth = 0;
        auto result = config.validate();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, lumen::ErrorCode::ValidationError);
    }
}
