/*
 * vision_service.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Request-level facade over the capture core. Each operation
takes a parsed JSON body and returns an ApiResponse, so any HTTP or
WebSocket transport can be bolted on without touching the core.

**************************************************/

#ifndef LUMEN_SERVER_VISION_SERVICE_HPP
#define LUMEN_SERVER_VISION_SERVICE_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "common/result.hpp"
#include "response.hpp"
#include "stream/streaming_feed.hpp"

namespace lumen::device {
class DeviceRegistry;
}

namespace lumen::settings {
class SettingsStore;
}

namespace lumen::capture {
class CaptureEngine;
}

namespace lumen::server {

class VisionService {
public:
    VisionService(device::DeviceRegistry& registry,
                  settings::SettingsStore& settings,
                  capture::CaptureEngine& engine, stream::StreamingFeed& feed);

    /**
     * @brief Parse a raw request body; empty text is an empty object
     */
    [[nodiscard]] static auto parseBody(const std::string& text)
        -> Result<nlohmann::json>;

    // GET status
    auto getStatus() -> ApiResponse;

    // GET/POST settings
    auto getSettings() -> ApiResponse;
    auto postSettings(const nlohmann::json& body) -> ApiResponse;

    // POST light {value}
    auto postLight(const nlohmann::json& body) -> ApiResponse;

    // POST capture
    auto postCapture() -> ApiResponse;

    // POST sequence, POST sequence/cancel, GET sequence, DELETE sequence
    auto postSequence(const nlohmann::json& body) -> ApiResponse;
    auto postSequenceCancel() -> ApiResponse;
    auto getSequence() -> ApiResponse;
    auto deleteSequence() -> ApiResponse;

    /**
     * @brief Live preview for one viewer
     */
    auto subscribe() -> stream::FrameSubscription;

private:
    device::DeviceRegistry& registry_;
    settings::SettingsStore& settings_;
    capture::CaptureEngine& engine_;
    stream::StreamingFeed& feed_;
};

}  // namespace lumen::server

#endif  // LUMEN_SERVER_VISION_SERVICE_HPP
