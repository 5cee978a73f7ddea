/*
 * device_registry.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Registry of configured cameras and light ports. Owns the
adapters, tracks connectivity and absorbs every device-level failure.

**************************************************/

#ifndef LUMEN_DEVICE_DEVICE_REGISTRY_HPP
#define LUMEN_DEVICE_DEVICE_REGISTRY_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "camera_adapter.hpp"
#include "common/result.hpp"
#include "device_record.hpp"
#include "frame.hpp"
#include "light_adapter.hpp"

namespace lumen::config {
struct DeviceSection;
}

namespace lumen::device {

struct RegistryOptions {
    int fallbackWidth{400};
    int fallbackHeight{300};
    std::chrono::milliseconds grabTimeout{1000};
    std::chrono::milliseconds lightTimeout{500};
    std::chrono::milliseconds reconnectInterval{2000};

    [[nodiscard]] static auto fromConfig(const config::DeviceSection& section)
        -> RegistryOptions;
};

/**
 * @brief Single owner of all device adapters
 *
 * Camera targets are fixed at construction. A target with no adapter, an
 * adapter that fails, throws or overruns its timeout all yield a black
 * fallback frame. Calls on the same device are serialized; different devices
 * proceed in parallel.
 */
class DeviceRegistry {
public:
    DeviceRegistry(std::vector<int> cameraIds,
                   std::vector<std::shared_ptr<CameraAdapter>> cameras,
                   std::vector<std::shared_ptr<LightAdapter>> lights,
                   RegistryOptions options = {});
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Try to open every adapter once; absent devices are logged
     */
    void initialize();

    /**
     * @brief Close every adapter
     */
    void shutdown();

    // ==================== Cameras ====================

    /**
     * @brief Configured camera ids in ascending order
     */
    [[nodiscard]] auto listTargets() const -> std::vector<int>;

    /**
     * @brief Grab a frame; never throws
     *
     * Returns a Live frame from the adapter or a Fallback frame when the
     * camera is unknown, absent, failing or too slow.
     */
    [[nodiscard]] auto acquireFrame(int cameraId) -> Frame;

    [[nodiscard]] auto fallbackFrame(int cameraId) const -> Frame;

    [[nodiscard]] auto cameraStatus(int cameraId) const
        -> std::optional<DeviceRecord>;

    // ==================== Lights ====================

    [[nodiscard]] auto listLightPorts() const -> std::vector<std::string>;

    /**
     * @brief Clamp and forward a brightness to one port
     * @return The clamped value sent, or DeviceUnavailable
     */
    auto setBrightness(const std::string& port, int value) -> Result<int>;

    /**
     * @brief Broadcast a brightness to every configured port
     */
    auto setAllBrightness(int value) -> std::vector<LightOutcome>;

    [[nodiscard]] auto lightStatus(const std::string& port) const
        -> std::optional<DeviceRecord>;

    // ==================== Status ====================

    /**
     * @brief Cameras in id order, then lights in configuration order
     */
    [[nodiscard]] auto snapshot() const -> std::vector<DeviceRecord>;

    [[nodiscard]] auto options() const -> const RegistryOptions&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_DEVICE_REGISTRY_HPP
