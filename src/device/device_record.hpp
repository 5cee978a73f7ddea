/*
 * device_record.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Connectivity bookkeeping for cameras and light ports

**************************************************/

#ifndef LUMEN_DEVICE_DEVICE_RECORD_HPP
#define LUMEN_DEVICE_DEVICE_RECORD_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/error.hpp"

namespace lumen::device {

enum class DeviceKind { Camera, Light };

enum class Connectivity { Connected, Absent };

[[nodiscard]] inline auto deviceKindToString(DeviceKind kind) -> std::string {
    switch (kind) {
        case DeviceKind::Camera:
            return "camera";
        case DeviceKind::Light:
            return "light";
    }
    return "unknown";
}

[[nodiscard]] inline auto connectivityToString(Connectivity status)
    -> std::string {
    switch (status) {
        case Connectivity::Connected:
            return "connected";
        case Connectivity::Absent:
            return "absent";
    }
    return "unknown";
}

/**
 * @brief Last known state of one device, refreshed on every access
 */
struct DeviceRecord {
    std::string id;  ///< Camera index as text, or the port name
    DeviceKind kind{DeviceKind::Camera};
    Connectivity status{Connectivity::Absent};
    std::optional<int> brightness;  ///< Lights only
    std::optional<std::chrono::system_clock::time_point> lastLiveFrame;
    int consecutiveFailures{0};
    std::optional<std::string> lastError;

    [[nodiscard]] auto isConnected() const -> bool {
        return status == Connectivity::Connected;
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j = {{"id", id},
                            {"kind", deviceKindToString(kind)},
                            {"status", connectivityToString(status)},
                            {"consecutive_failures", consecutiveFailures}};
        if (brightness) {
            j["brightness"] = *brightness;
        }
        if (lastLiveFrame) {
            j["last_live_frame_ms"] =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    lastLiveFrame->time_since_epoch())
                    .count();
        }
        if (lastError) {
            j["last_error"] = *lastError;
        }
        return j;
    }
};

/**
 * @brief Result of broadcasting a brightness to one port
 */
struct LightOutcome {
    std::string port;
    int value{0};
    bool accepted{false};
    std::optional<Error> error;

    [[nodiscard]] auto toJson() const -> nlohmann::json {
        nlohmann::json j = {
            {"port", port}, {"value", value}, {"accepted", accepted}};
        if (error) {
            j["error"] = error->toJson();
        }
        return j;
    }
};

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_DEVICE_RECORD_HPP
