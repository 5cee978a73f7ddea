/*
 * vision_service.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "vision_service.hpp"

#include <spdlog/spdlog.h>

#include "capture/capture_engine.hpp"
#include "common/json_fields.hpp"
#include "device/device_registry.hpp"
#include "device/light_protocol.hpp"
#include "logging/logging_manager.hpp"
#include "settings/settings_store.hpp"

namespace lumen::server {

using json = nlohmann::json;

namespace {

constexpr size_t kRecentWarnings = 20;

auto recentWarnings() -> json {
    json warnings = json::array();
    auto entries =
        logging::LoggingManager::getInstance().recentWarnings(kRecentWarnings);
    for (const auto& entry : entries) {
        warnings.push_back(entry.toJson());
    }
    return warnings;
}

}  // namespace

VisionService::VisionService(device::DeviceRegistry& registry,
                             settings::SettingsStore& settings,
                             capture::CaptureEngine& engine,
                             stream::StreamingFeed& feed)
    : registry_(registry), settings_(settings), engine_(engine), feed_(feed) {}

auto VisionService::parseBody(const std::string& text) -> Result<json> {
    if (text.empty()) {
        return json::object();
    }
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        return failure<json>(ErrorCode::ValidationError,
                             std::string("Invalid JSON: ") + e.what());
    }
}

// ==================== Status ====================

auto VisionService::getStatus() -> ApiResponse {
    json devices = json::array();
    for (const auto& record : registry_.snapshot()) {
        devices.push_back(record.toJson());
    }

    auto run = engine_.sequenceStatus();
    json data = {
        {"devices", devices},
        {"sequence", run ? run->toJson() : json(nullptr)},
        {"settings", settings_.get().toJson()},
        {"streaming",
         {{"running", feed_.isRunning()},
          {"viewers", feed_.viewerCount()},
          {"ticks", feed_.tickCount()}}},
        {"recent_warnings", recentWarnings()},
        {"warnings_total",
         logging::LoggingManager::getInstance().warningTotal()}};
    return ResponseBuilder::success(data);
}

// ==================== Settings ====================

auto VisionService::getSettings() -> ApiResponse {
    return ResponseBuilder::success(settings_.get().toJson());
}

auto VisionService::postSettings(const json& body) -> ApiResponse {
    auto patch = settings::SettingsPatch::fromJson(body);
    if (!patch) {
        return ResponseBuilder::fromError(patch.error());
    }
    auto updated = settings_.update(*patch);
    if (!updated) {
        return ResponseBuilder::fromError(updated.error());
    }
    return ResponseBuilder::success(updated->toJson());
}

// ==================== Light ====================

auto VisionService::postLight(const json& body) -> ApiResponse {
    if (!body.is_object() || !body.contains("value")) {
        return ResponseBuilder::error(
            errorCodeToString(ErrorCode::ValidationError),
            "Required field 'value' is missing.", 400, {{"field", "value"}});
    }
    if (!body["value"].is_number_integer()) {
        return ResponseBuilder::error(
            errorCodeToString(ErrorCode::ValidationError),
            "Field 'value' must be an integer.", 400, {{"field", "value"}});
    }
    auto parsed = readIntField(body["value"], "value");
    if (!parsed || *parsed < device::kMinBrightness ||
        *parsed > device::kMaxBrightness) {
        return ResponseBuilder::error(
            errorCodeToString(ErrorCode::ValidationError),
            "Light value must be within [0,255].", 400,
            {{"field", "value"}, {"value", body["value"]}});
    }
    const int value = *parsed;

    auto outcomes = registry_.setAllBrightness(value);
    settings_.setBrightness(value);

    json ports = json::array();
    size_t accepted = 0;
    for (const auto& outcome : outcomes) {
        ports.push_back(outcome.toJson());
        if (outcome.accepted) {
            ++accepted;
        }
    }

    if (accepted == 0) {
        return ResponseBuilder::error(
            errorCodeToString(ErrorCode::DeviceUnavailable),
            "No light controller accepted the value.", 503,
            {{"light_value", value}, {"ports", ports}});
    }
    return ResponseBuilder::success(
        {{"light_value", value}, {"accepted", accepted}, {"ports", ports}});
}

// ==================== Capture ====================

auto VisionService::postCapture() -> ApiResponse {
    auto result = engine_.captureOnce();
    if (result.storageFailed()) {
        auto err = result.firstError().value_or(
            Error(ErrorCode::StorageError, "Storage failure"));
        return ResponseBuilder::error(errorCodeToString(ErrorCode::StorageError),
                                      err.message, 500, result.toJson());
    }
    return ResponseBuilder::success(result.toJson());
}

// ==================== Sequence ====================

auto VisionService::postSequence(const json& body) -> ApiResponse {
    auto spec = capture::SequenceSpec::fromJson(body);
    if (!spec) {
        return ResponseBuilder::fromError(spec.error());
    }
    auto run = engine_.startSequence(*spec);
    if (!run) {
        return ResponseBuilder::fromError(run.error());
    }
    return ResponseBuilder::accepted("Sequence started", run->toJson());
}

auto VisionService::postSequenceCancel() -> ApiResponse {
    return ResponseBuilder::success(
        {{"cancelled", engine_.cancelSequence()}});
}

auto VisionService::getSequence() -> ApiResponse {
    auto run = engine_.sequenceStatus();
    return ResponseBuilder::success(run ? run->toJson() : json(nullptr));
}

auto VisionService::deleteSequence() -> ApiResponse {
    auto run = engine_.sequenceStatus();
    if (run && run->isActive()) {
        return ResponseBuilder::fromError(
            Error(ErrorCode::Conflict, "Sequence is still running"));
    }
    return ResponseBuilder::success({{"cleared", engine_.clearSequence()}});
}

// ==================== Preview ====================

auto VisionService::subscribe() -> stream::FrameSubscription {
    return feed_.subscribe();
}

}  // namespace lumen::server
