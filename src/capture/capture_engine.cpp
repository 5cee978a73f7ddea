/*
 * capture_engine.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "capture_engine.hpp"

#include <algorithm>
#include <condition_variable>
#include <iterator>
#include <mutex>
#include <stop_token>
#include <thread>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"
#include "config/runtime_config.hpp"
#include "device/device_registry.hpp"
#include "device/resource_arbiter.hpp"
#include "frame_writer.hpp"
#include "settings/settings_store.hpp"

namespace lumen::capture {

auto CaptureEngineOptions::fromConfig(const config::CaptureSection& section)
    -> CaptureEngineOptions {
    CaptureEngineOptions options;
    options.designatedCamera = section.designatedCamera;
    options.settleDelay = std::chrono::milliseconds(section.settleDelayMs);
    options.stepInterval = std::chrono::milliseconds(section.stepIntervalMs);
    return options;
}

class CaptureEngine::Impl {
public:
    Impl(device::DeviceRegistry& registry, device::ResourceArbiter& arbiter,
         settings::SettingsStore& settings, CaptureEngineOptions options)
        : registry_(registry),
          arbiter_(arbiter),
          settings_(settings),
          options_(options),
          writer_(options.designatedCamera) {}

    auto selectCameras(settings::SaveMode mode) const -> std::vector<int> {
        auto targets = registry_.listTargets();
        std::vector<int> selected;
        std::copy_if(targets.begin(), targets.end(),
                     std::back_inserter(selected), [&](int id) {
                         switch (mode) {
                             case settings::SaveMode::ExcludeDesignated:
                                 return id != options_.designatedCamera;
                             case settings::SaveMode::DesignatedOnly:
                                 return id == options_.designatedCamera;
                             case settings::SaveMode::AllCameras:
                                 return true;
                         }
                         return true;
                     });
        return selected;
    }

    /**
     * @brief Capture with a freshly reserved shot number
     *
     * The reservation is handed back when not a single file was written.
     */
    auto captureReserved(CaptureRequest request) -> CaptureResult {
        const auto reserved = settings_.reserveShot();
        if (!request.snapshot) {
            request.snapshot = reserved;
        }
        request.snapshot->shotNumber = reserved.shotNumber;
        auto result = captureWith(request);
        if (result.savedCount() == 0) {
            settings_.releaseShot(reserved.shotNumber);
        }
        return result;
    }

    auto capture(CaptureRequest request) -> CaptureResult {
        if (request.advanceShotNumber) {
            return captureReserved(std::move(request));
        }
        if (!request.snapshot) {
            request.snapshot = settings_.get();
        }
        return captureWith(request);
    }

    auto captureWith(const CaptureRequest& request) -> CaptureResult {
        const settings::Settings& snapshot = *request.snapshot;
        CaptureResult result;
        result.brightness = request.effectiveBrightness();
        result.shotNumber = snapshot.shotNumber;

        for (int id : selectCameras(snapshot.saveMode)) {
            CameraOutcome outcome;
            outcome.cameraId = id;
            try {
                device::Frame frame = [&] {
                    auto lease = arbiter_.acquire({id});
                    return registry_.acquireFrame(id);
                }();
                outcome.frameStatus = frame.status;
                outcome.path =
                    writer_.write(frame, snapshot, result.brightness)
                        .string();
            } catch (const StorageException& e) {
                spdlog::error("Failed to save frame from camera {}: {} ({})",
                              id, e.what(), e.path());
                outcome.error = e.error();
                outcome.error->device = std::to_string(id);
            } catch (const std::exception& e) {
                spdlog::error("Capture on camera {} failed: {}", id, e.what());
                outcome.error = Error(ErrorCode::InternalError, e.what(),
                                      std::to_string(id));
            }
            result.outcomes.push_back(std::move(outcome));
        }

        spdlog::info("Capture at brightness {} shot {:03d}: {}/{} frames saved",
                     result.brightness, result.shotNumber, result.savedCount(),
                     result.outcomes.size());
        return result;
    }

    auto startSequence(const SequenceSpec& spec) -> Result<SequenceRunSnapshot> {
        if (auto valid = spec.validate(); !valid) {
            return std::unexpected(valid.error());
        }

        std::lock_guard lock(runMutex_);
        if (run_ && run_->isActive()) {
            return failure<SequenceRunSnapshot>(ErrorCode::Conflict,
                                                "A sequence is already running");
        }

        // A terminal run's worker has already left every lock, so joining
        // here cannot deadlock.
        if (worker_.joinable()) {
            worker_.join();
        }

        recordSweep(spec);
        // One snapshot for the whole run; only the light label varies per step
        settings::Settings runSettings = settings_.reserveShot();

        SequenceRunSnapshot snapshot;
        snapshot.id = nextRunId_++;
        snapshot.spec = spec;
        snapshot.state = SequenceState::Pending;
        snapshot.totalSteps = spec.levels().size();
        snapshot.startedAt = std::chrono::system_clock::now();
        run_ = snapshot;

        run_->state = SequenceState::Running;
        worker_ = std::jthread(
            [this, spec, runSettings](std::stop_token st) {
                execute(st, spec, runSettings);
            });

        spdlog::info("Sequence {} started: {} steps ({} {}..{} step {})",
                     run_->id, run_->totalSteps,
                     sequenceDirectionToString(spec.direction), spec.start,
                     spec.end, spec.step);
        return *run_;
    }

    auto cancelSequence() -> bool {
        std::lock_guard lock(runMutex_);
        if (!run_ || !run_->isActive()) {
            return false;
        }
        worker_.request_stop();
        sleepCv_.notify_all();
        spdlog::info("Cancellation requested for sequence {}", run_->id);
        return true;
    }

    auto sequenceStatus() const -> std::optional<SequenceRunSnapshot> {
        std::lock_guard lock(runMutex_);
        return run_;
    }

    auto clearSequence() -> bool {
        std::jthread finished;
        {
            std::lock_guard lock(runMutex_);
            if (!run_ || run_->isActive()) {
                return false;
            }
            run_.reset();
            finished = std::move(worker_);
        }
        return true;
    }

    auto waitForSequence(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(runMutex_);
        return runCv_.wait_for(lock, timeout,
                               [this] { return !run_ || !run_->isActive(); });
    }

    auto options() const -> const CaptureEngineOptions& { return options_; }

private:
    void recordSweep(const SequenceSpec& spec) {
        settings::SettingsPatch patch;
        patch.sequenceStart = spec.signedStart();
        patch.sequenceEnd = spec.signedEnd();
        patch.sequenceStep = spec.signedStep();
        if (auto updated = settings_.update(patch); !updated) {
            spdlog::warn("Could not record sweep parameters: {}",
                         updated.error().message);
        }
    }

    /**
     * @brief Sleep unless a stop is requested
     * @return false if interrupted
     */
    auto interruptibleWait(std::stop_token st, std::chrono::milliseconds d)
        -> bool {
        std::unique_lock lock(sleepMutex_);
        sleepCv_.wait_for(lock, st, d, [] { return false; });
        return !st.stop_requested();
    }

    void execute(std::stop_token st, const SequenceSpec& spec,
                 const settings::Settings& runSettings) {
        const auto levels = spec.levels();
        std::optional<std::string> failureMessage;
        bool cancelled = false;
        size_t executed = 0;

        for (size_t i = 0; i < levels.size(); ++i) {
            if (st.stop_requested()) {
                cancelled = true;
                break;
            }

            SequenceStepResult step;
            step.index = i;
            step.brightness = levels[i];

            try {
                step.lights = registry_.setAllBrightness(levels[i]);
                settings_.setBrightness(levels[i]);
                spdlog::info("Sequence step {}/{}: brightness {}", i + 1,
                             levels.size(), levels[i]);
                std::this_thread::sleep_for(options_.settleDelay);

                CaptureRequest request;
                request.snapshot = runSettings;
                request.snapshot->brightness = levels[i];
                request.brightnessLabel = levels[i];
                request.advanceShotNumber = false;
                step.capture = captureWith(request);
            } catch (const std::exception& e) {
                spdlog::error("Sequence step {} failed: {}", i + 1, e.what());
                failureMessage = e.what();
                break;
            }

            const bool storageFailed = step.capture.storageFailed();
            std::optional<Error> stepError = step.capture.firstError();
            {
                std::lock_guard lock(runMutex_);
                run_->steps.push_back(std::move(step));
                run_->currentIndex = i + 1;
            }
            ++executed;

            if (storageFailed) {
                failureMessage = "Storage failure at brightness " +
                                 std::to_string(levels[i]);
                if (stepError) {
                    *failureMessage += ": " + stepError->toString();
                }
                break;
            }

            if (i + 1 < levels.size() &&
                !interruptibleWait(st, options_.stepInterval)) {
                cancelled = true;
                break;
            }
        }

        if (executed == 0) {
            settings_.releaseShot(runSettings.shotNumber);
        }

        SequenceState finalState = SequenceState::Completed;
        if (failureMessage) {
            finalState = SequenceState::Failed;
        } else if (cancelled) {
            finalState = SequenceState::Cancelled;
        }
        uint64_t id = 0;
        {
            std::lock_guard lock(runMutex_);
            run_->state = finalState;
            run_->failureMessage = failureMessage;
            run_->finishedAt = std::chrono::system_clock::now();
            id = run_->id;
        }
        runCv_.notify_all();

        if (finalState == SequenceState::Failed) {
            spdlog::error("Sequence {} failed after {} steps: {}", id,
                          executed, *failureMessage);
        } else {
            spdlog::info("Sequence {} {} after {}/{} steps", id,
                         sequenceStateToString(finalState), executed,
                         levels.size());
        }
    }

    device::DeviceRegistry& registry_;
    device::ResourceArbiter& arbiter_;
    settings::SettingsStore& settings_;
    CaptureEngineOptions options_;
    FrameWriter writer_;

    mutable std::mutex runMutex_;
    std::condition_variable runCv_;
    std::optional<SequenceRunSnapshot> run_;
    uint64_t nextRunId_{1};

    std::mutex sleepMutex_;
    std::condition_variable_any sleepCv_;

    // Declared last: destroyed first, stopping and joining the worker while
    // the members it uses are still alive
    std::jthread worker_;
};

CaptureEngine::CaptureEngine(device::DeviceRegistry& registry,
                             device::ResourceArbiter& arbiter,
                             settings::SettingsStore& settings,
                             CaptureEngineOptions options)
    : impl_(std::make_unique<Impl>(registry, arbiter, settings, options)) {}

CaptureEngine::~CaptureEngine() = default;

auto CaptureEngine::selectCameras(settings::SaveMode mode) const
    -> std::vector<int> {
    return impl_->selectCameras(mode);
}

auto CaptureEngine::captureOnce() -> CaptureResult {
    return impl_->capture(CaptureRequest{});
}

auto CaptureEngine::capture(const CaptureRequest& request) -> CaptureResult {
    return impl_->capture(request);
}

auto CaptureEngine::startSequence(const SequenceSpec& spec)
    -> Result<SequenceRunSnapshot> {
    return impl_->startSequence(spec);
}

auto CaptureEngine::cancelSequence() -> bool { return impl_->cancelSequence(); }

auto CaptureEngine::sequenceStatus() const
    -> std::optional<SequenceRunSnapshot> {
    return impl_->sequenceStatus();
}

auto CaptureEngine::clearSequence() -> bool { return impl_->clearSequence(); }

auto CaptureEngine::waitForSequence(std::chrono::milliseconds timeout) -> bool {
    return impl_->waitForSequence(timeout);
}

auto CaptureEngine::options() const -> const CaptureEngineOptions& {
    return impl_->options();
}

}  // namespace lumen::capture
