/*
 * capture_engine.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Single captures and background brightness sweeps

**************************************************/

#ifndef LUMEN_CAPTURE_CAPTURE_ENGINE_HPP
#define LUMEN_CAPTURE_CAPTURE_ENGINE_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "capture_types.hpp"
#include "common/result.hpp"
#include "sequence.hpp"

namespace lumen::config {
struct CaptureSection;
}

namespace lumen::device {
class DeviceRegistry;
class ResourceArbiter;
}  // namespace lumen::device

namespace lumen::settings {
class SettingsStore;
}

namespace lumen::capture {

struct CaptureEngineOptions {
    int designatedCamera{3};
    std::chrono::milliseconds settleDelay{500};   ///< After a light change
    std::chrono::milliseconds stepInterval{200};  ///< Between sweep steps

    [[nodiscard]] static auto fromConfig(const config::CaptureSection& section)
        -> CaptureEngineOptions;
};

/**
 * @brief Drives cameras, lights and the frame writer for capture requests
 *
 * At most one sweep runs at a time on a worker thread; its last state is
 * kept until cleared or replaced by the next run. Ad-hoc captures may run
 * concurrently with a sweep and with the preview loop; the ResourceArbiter
 * serializes access per camera.
 */
class CaptureEngine {
public:
    CaptureEngine(device::DeviceRegistry& registry,
                  device::ResourceArbiter& arbiter,
                  settings::SettingsStore& settings,
                  CaptureEngineOptions options = {});
    ~CaptureEngine();

    CaptureEngine(const CaptureEngine&) = delete;
    CaptureEngine& operator=(const CaptureEngine&) = delete;

    /**
     * @brief Cameras the save mode selects, ascending
     */
    [[nodiscard]] auto selectCameras(settings::SaveMode mode) const
        -> std::vector<int>;

    /**
     * @brief Capture with the current settings under a newly claimed shot
     *        number, which is given back if no file was written
     */
    auto captureOnce() -> CaptureResult;

    /**
     * @brief Capture an explicit request
     *
     * A storage failure on one camera is recorded in its outcome and does not
     * stop the others. Existing files are never overwritten.
     */
    auto capture(const CaptureRequest& request) -> CaptureResult;

    // ==================== Sequences ====================

    /**
     * @brief Launch a sweep in the background
     * @return Snapshot of the new run, Conflict if one is active, or
     *         ValidationError for a bad spec
     */
    auto startSequence(const SequenceSpec& spec) -> Result<SequenceRunSnapshot>;

    /**
     * @brief Ask the active run to stop at the next step boundary
     * @return false if no run is active
     */
    auto cancelSequence() -> bool;

    [[nodiscard]] auto sequenceStatus() const
        -> std::optional<SequenceRunSnapshot>;

    /**
     * @brief Forget a finished run
     * @return false if there is none or it is still active
     */
    auto clearSequence() -> bool;

    /**
     * @brief Block until the current run is finished
     * @return true if no run is active when returning
     */
    auto waitForSequence(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto options() const -> const CaptureEngineOptions&;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lumen::capture

#endif  // LUMEN_CAPTURE_CAPTURE_ENGINE_HPP
