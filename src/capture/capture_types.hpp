/*
 * capture_types.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Capture requests and per-camera outcomes

**************************************************/

#ifndef LUMEN_CAPTURE_CAPTURE_TYPES_HPP
#define LUMEN_CAPTURE_CAPTURE_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/error.hpp"
#include "device/frame.hpp"
#include "settings/settings.hpp"

namespace lumen::capture {

using json = nlohmann::json;

/**
 * @brief Immutable description of one capture
 */
struct CaptureRequest {
    std::optional<settings::Settings> snapshot;  ///< Store snapshot if empty
    std::optional<int> brightnessLabel;  ///< Defaults to snapshot brightness
    /// Claim a fresh shot number; otherwise the snapshot's number is used
    bool advanceShotNumber{true};

    [[nodiscard]] auto effectiveBrightness() const -> int {
        return brightnessLabel.value_or(snapshot ? snapshot->brightness : 0);
    }
};

/**
 * @brief What happened to one selected camera
 */
struct CameraOutcome {
    int cameraId{0};
    device::FrameStatus frameStatus{device::FrameStatus::Fallback};
    std::optional<std::string> path;  ///< Set when the file was written
    std::optional<Error> error;

    [[nodiscard]] auto written() const -> bool { return path.has_value(); }

    [[nodiscard]] auto toJson() const -> json;
};

struct CaptureResult {
    int brightness{0};
    int shotNumber{0};  ///< Shot number the files were named with
    std::vector<CameraOutcome> outcomes;

    [[nodiscard]] auto savedCount() const -> size_t;

    [[nodiscard]] auto storageFailed() const -> bool;

    /**
     * @brief Error of the first camera whose write failed
     */
    [[nodiscard]] auto firstError() const -> std::optional<Error>;

    [[nodiscard]] auto toJson() const -> json;
};

}  // namespace lumen::capture

#endif  // LUMEN_CAPTURE_CAPTURE_TYPES_HPP
