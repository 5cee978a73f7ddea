/*
 * runtime_config.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Startup configuration of the capture core. Read once from a
JSON file, then overridden by LUMEN_* environment variables and CLI flags.
Immutable afterwards.

**************************************************/

#ifndef LUMEN_CONFIG_RUNTIME_CONFIG_HPP
#define LUMEN_CONFIG_RUNTIME_CONFIG_HPP

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/result.hpp"
#include "logging/types.hpp"

namespace lumen::config {

using json = nlohmann::json;

/**
 * @brief Hardware targets and device timeouts
 */
struct DeviceSection {
    std::vector<int> cameraIds{1, 2, 3, 4};  ///< Cameras orchestrated
    std::vector<std::string> lightPorts{"/dev/ttyS1", "/dev/ttyS7",
                                        "/dev/ttyS8", "/dev/ttyS9"};
    int baudRate{9600};                       ///< Illumination serial baud
    std::string cameraBackend{"simulated"};   ///< "simulated" or "none"
    int fallbackWidth{400};                   ///< Placeholder frame width
    int fallbackHeight{300};                  ///< Placeholder frame height
    size_t grabTimeoutMs{1000};               ///< Bound on one frame grab
    size_t lightTimeoutMs{500};               ///< Bound on one light write
    size_t reconnectIntervalMs{2000};         ///< Min delay between reopens

    [[nodiscard]] json toJson() const {
        return {{"camera_ids", cameraIds},
                {"light_ports", lightPorts},
                {"baud_rate", baudRate},
                {"camera_backend", cameraBackend},
                {"fallback_width", fallbackWidth},
                {"fallback_height", fallbackHeight},
                {"grab_timeout_ms", grabTimeoutMs},
                {"light_timeout_ms", lightTimeoutMs},
                {"reconnect_interval_ms", reconnectIntervalMs}};
    }

    [[nodiscard]] static DeviceSection fromJson(const json& j) {
        DeviceSection cfg;
        cfg.cameraIds = j.value("camera_ids", cfg.cameraIds);
        cfg.lightPorts = j.value("light_ports", cfg.lightPorts);
        cfg.baudRate = j.value("baud_rate", cfg.baudRate);
        cfg.cameraBackend = j.value("camera_backend", cfg.cameraBackend);
        cfg.fallbackWidth = j.value("fallback_width", cfg.fallbackWidth);
        cfg.fallbackHeight = j.value("fallback_height", cfg.fallbackHeight);
        cfg.grabTimeoutMs = j.value("grab_timeout_ms", cfg.grabTimeoutMs);
        cfg.lightTimeoutMs = j.value("light_timeout_ms", cfg.lightTimeoutMs);
        cfg.reconnectIntervalMs =
            j.value("reconnect_interval_ms", cfg.reconnectIntervalMs);
        return cfg;
    }
};

/**
 * @brief Capture defaults and sequence pacing
 */
struct CaptureSection {
    std::string savePath{"./captured_images"};
    std::string product{"ModelA"};
    std::string condition{"Test_A"};
    int designatedCamera{3};       ///< Camera with its own directory tree
    size_t settleDelayMs{500};     ///< Wait after a brightness change
    size_t stepIntervalMs{200};    ///< Pause between sequence steps

    [[nodiscard]] json toJson() const {
        return {{"save_path", savePath},
                {"product", product},
                {"condition", condition},
                {"designated_camera", designatedCamera},
                {"settle_delay_ms", settleDelayMs},
                {"step_interval_ms", stepIntervalMs}};
    }

    [[nodiscard]] static CaptureSection fromJson(const json& j) {
        CaptureSection cfg;
        cfg.savePath = j.value("save_path", cfg.savePath);
        cfg.product = j.value("product", cfg.product);
        cfg.condition = j.value("condition", cfg.condition);
        cfg.designatedCamera = j.value("designated_camera", cfg.designatedCamera);
        cfg.settleDelayMs = j.value("settle_delay_ms", cfg.settleDelayMs);
        cfg.stepIntervalMs = j.value("step_interval_ms", cfg.stepIntervalMs);
        return cfg;
    }
};

/**
 * @brief Live preview loop
 */
struct StreamSection {
    int fps{30};
    size_t subscriptionQueueSize{8};  ///< Frames buffered per pull viewer

    [[nodiscard]] json toJson() const {
        return {{"fps", fps}, {"subscription_queue_size", subscriptionQueueSize}};
    }

    [[nodiscard]] static StreamSection fromJson(const json& j) {
        StreamSection cfg;
        cfg.fps = j.value("fps", cfg.fps);
        cfg.subscriptionQueueSize =
            j.value("subscription_queue_size", cfg.subscriptionQueueSize);
        return cfg;
    }
};

/**
 * @brief Complete startup configuration
 */
struct RuntimeConfig {
    DeviceSection device;
    CaptureSection capture;
    StreamSection stream;
    logging::LoggingConfig logging;

    [[nodiscard]] auto toJson() const -> json;

    /**
     * @brief Build from JSON; missing keys keep their defaults
     * @throws ConfigException if a value has the wrong type
     */
    [[nodiscard]] static auto fromJson(const json& j) -> RuntimeConfig;

    /**
     * @brief Read a JSON file
     * @throws ConfigException if the file is unreadable or malformed
     */
    [[nodiscard]] static auto loadFromFile(const std::string& path)
        -> RuntimeConfig;

    /**
     * @brief Apply LUMEN_* overrides
     * @param lookup Returns the variable's value, empty when unset
     * @throws ConfigException if a numeric variable does not parse
     */
    void applyEnvironment(
        const std::function<std::string(const std::string&)>& lookup);

    /**
     * @brief Check ranges and cross-field consistency
     */
    [[nodiscard]] auto validate() const -> VoidResult;
};

}  // namespace lumen::config

#endif  // LUMEN_CONFIG_RUNTIME_CONFIG_HPP
