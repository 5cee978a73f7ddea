/*
 * runtime_config.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "runtime_config.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"

namespace lumen::config {

namespace {

auto splitList(const std::string& value) -> std::vector<std::string> {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            items.push_back(item.substr(first, last - first + 1));
        }
    }
    return items;
}

template <typename T>
auto parseNumber(const std::string& name, const std::string& value) -> T {
    T result{};
    auto [ptr, ec] =
        std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        throw ConfigException("Environment variable " + name +
                              " is not a number: '" + value + "'");
    }
    return result;
}

}  // namespace

auto RuntimeConfig::toJson() const -> json {
    return {{"device", device.toJson()},
            {"capture", capture.toJson()},
            {"stream", stream.toJson()},
            {"logging", logging.toJson()}};
}

auto RuntimeConfig::fromJson(const json& j) -> RuntimeConfig {
    RuntimeConfig config;
    try {
        if (j.contains("device")) {
            config.device = DeviceSection::fromJson(j["device"]);
        }
        if (j.contains("capture")) {
            config.capture = CaptureSection::fromJson(j["capture"]);
        }
        if (j.contains("stream")) {
            config.stream = StreamSection::fromJson(j["stream"]);
        }
        if (j.contains("logging")) {
            config.logging = logging::LoggingConfig::fromJson(j["logging"]);
        }
    } catch (const json::exception& e) {
        throw ConfigException(std::string("Invalid configuration value: ") +
                              e.what());
    }
    return config;
}

auto RuntimeConfig::loadFromFile(const std::string& path) -> RuntimeConfig {
    if (!std::filesystem::exists(path)) {
        throw ConfigException("Configuration file not found: " + path);
    }

    std::ifstream file(path);
    if (!file) {
        throw ConfigException("Cannot open configuration file: " + path);
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigException("Malformed configuration file " + path + ": " +
                              e.what());
    }
    if (!j.is_object()) {
        throw ConfigException("Configuration root must be an object: " + path);
    }

    spdlog::info("Loaded configuration from {}", path);
    return fromJson(j);
}

void RuntimeConfig::applyEnvironment(
    const std::function<std::string(const std::string&)>& lookup) {
    if (auto v = lookup("LUMEN_CAMERA_IDS"); !v.empty()) {
        device.cameraIds.clear();
        for (const auto& item : splitList(v)) {
            device.cameraIds.push_back(parseNumber<int>("LUMEN_CAMERA_IDS", item));
        }
    }
    if (auto v = lookup("LUMEN_LIGHT_PORTS"); !v.empty()) {
        device.lightPorts = splitList(v);
    }
    if (auto v = lookup("LUMEN_CAMERA_BACKEND"); !v.empty()) {
        device.cameraBackend = v;
    }
    if (auto v = lookup("LUMEN_SAVE_PATH"); !v.empty()) {
        capture.savePath = v;
    }
    if (auto v = lookup("LUMEN_SETTLE_DELAY_MS"); !v.empty()) {
        capture.settleDelayMs = parseNumber<size_t>("LUMEN_SETTLE_DELAY_MS", v);
    }
    if (auto v = lookup("LUMEN_STREAM_FPS"); !v.empty()) {
        stream.fps = parseNumber<int>("LUMEN_STREAM_FPS", v);
    }
    if (auto v = lookup("LUMEN_LOG_LEVEL"); !v.empty()) {
        logging.level = logging::levelFromString(v);
    }
}

auto RuntimeConfig::validate() const -> VoidResult {
    if (device.cameraIds.empty()) {
        return failure<void>(ErrorCode::ValidationError,
                             "At least one camera id is required");
    }
    std::set<int> unique(device.cameraIds.begin(), device.cameraIds.end());
    if (unique.size() != device.cameraIds.size()) {
        return failure<void>(ErrorCode::ValidationError,
                             "Camera ids must be unique");
    }
    if (device.fallbackWidth <= 0 || device.fallbackHeight <= 0) {
        return failure<void>(ErrorCode::ValidationError,
                             "Fallback resolution must be positive");
    }
    if (device.cameraBackend != "simulated" && device.cameraBackend != "none") {
        return failure<void>(ErrorCode::ValidationError,
                             "Unknown camera backend: " + device.cameraBackend);
    }
    if (stream.fps <= 0 || stream.fps > 120) {
        return failure<void>(ErrorCode::ValidationError,
                             "Stream fps must be in [1,120]");
    }
    if (stream.subscriptionQueueSize == 0) {
        return failure<void>(ErrorCode::ValidationError,
                             "Subscription queue size must be positive");
    }
    if (capture.savePath.empty()) {
        return failure<void>(ErrorCode::ValidationError,
                             "Save path must not be empty");
    }
    return success();
}

}  // namespace lumen::config
