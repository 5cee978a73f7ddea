/*
 * capture_types.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "capture_types.hpp"

#include <algorithm>

namespace lumen::capture {

auto CameraOutcome::toJson() const -> json {
    json j = {{"camera_id", cameraId},
              {"frame", device::frameStatusToString(frameStatus)},
              {"written", written()}};
    if (path) {
        j["path"] = *path;
    }
    if (error) {
        j["error"] = error->toJson();
    }
    return j;
}

auto CaptureResult::savedCount() const -> size_t {
    return static_cast<size_t>(
        std::count_if(outcomes.begin(), outcomes.end(),
                      [](const CameraOutcome& o) { return o.written(); }));
}

auto CaptureResult::storageFailed() const -> bool {
    return std::any_of(outcomes.begin(), outcomes.end(),
                       [](const CameraOutcome& o) {
                           return o.error &&
                                  o.error->code == ErrorCode::StorageError;
                       });
}

auto CaptureResult::firstError() const -> std::optional<Error> {
    for (const auto& outcome : outcomes) {
        if (outcome.error) {
            return outcome.error;
        }
    }
    return std::nullopt;
}

auto CaptureResult::toJson() const -> json {
    json cameras = json::array();
    for (const auto& outcome : outcomes) {
        cameras.push_back(outcome.toJson());
    }
    return {{"brightness", brightness},
            {"shot_no", shotNumber},
            {"saved_count", savedCount()},
            {"storage_failed", storageFailed()},
            {"cameras", cameras}};
}

}  // namespace lumen::capture
