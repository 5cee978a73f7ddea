/*
 * simulated_camera.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Simulated camera for demo runs and testing

*************************************************/

#ifndef LUMEN_DEVICE_MOCK_SIMULATED_CAMERA_HPP
#define LUMEN_DEVICE_MOCK_SIMULATED_CAMERA_HPP

#include <atomic>
#include <cstdint>

#include "../camera_adapter.hpp"

namespace lumen::device {

/**
 * @brief Camera producing deterministic gradient frames
 *
 * Can be switched absent (open and grab fail) or failing (grab throws) at
 * runtime, and given an artificial grab latency.
 */
class SimulatedCamera : public CameraAdapter {
public:
    explicit SimulatedCamera(int id, int width = 640, int height = 480);
    ~SimulatedCamera() override = default;

    [[nodiscard]] auto id() const -> int override;

    auto open() -> bool override;
    void close() override;
    [[nodiscard]] auto isOpen() const -> bool override;

    auto grab(std::chrono::milliseconds timeout)
        -> std::optional<Frame> override;

    [[nodiscard]] auto resolution() const -> Resolution override;

    // Fault injection
    void setPresent(bool present);
    void setFailing(bool failing);
    void setGrabLatency(std::chrono::milliseconds latency);

    [[nodiscard]] auto grabCount() const -> uint64_t;
    [[nodiscard]] auto openCount() const -> uint64_t;

private:
    auto generateFrame(uint64_t sequence) const -> Frame;

    const int id_;
    const int width_;
    const int height_;

    std::atomic<bool> open_{false};
    std::atomic<bool> present_{true};
    std::atomic<bool> failing_{false};
    std::atomic<int64_t> latency_ms_{0};

    std::atomic<uint64_t> grab_count_{0};
    std::atomic<uint64_t> open_count_{0};
};

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_MOCK_SIMULATED_CAMERA_HPP
