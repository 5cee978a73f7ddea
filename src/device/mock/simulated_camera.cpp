/*
 * simulated_camera.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "simulated_camera.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <spdlog/spdlog.h>

namespace lumen::device {

SimulatedCamera::SimulatedCamera(int id, int width, int height)
    : id_(id), width_(width), height_(height) {}

auto SimulatedCamera::id() const -> int { return id_; }

auto SimulatedCamera::open() -> bool {
    open_count_++;
    if (!present_) {
        return false;
    }
    open_ = true;
    spdlog::debug("Simulated camera {} opened ({}x{})", id_, width_, height_);
    return true;
}

void SimulatedCamera::close() { open_ = false; }

auto SimulatedCamera::isOpen() const -> bool { return open_ && present_; }

auto SimulatedCamera::grab(std::chrono::milliseconds timeout)
    -> std::optional<Frame> {
    if (failing_) {
        throw std::runtime_error("simulated camera " + std::to_string(id_) +
                                 " failure");
    }
    if (!open_ || !present_) {
        return std::nullopt;
    }

    auto latency = std::chrono::milliseconds(latency_ms_.load());
    if (latency.count() > 0) {
        // A real SDK gives up at the timeout but reports it late
        std::this_thread::sleep_for(latency);
        if (latency > timeout) {
            return std::nullopt;
        }
    }

    return generateFrame(grab_count_++);
}

auto SimulatedCamera::resolution() const -> Resolution {
    return {width_, height_};
}

void SimulatedCamera::setPresent(bool present) {
    present_ = present;
    if (!present) {
        open_ = false;
    }
}

void SimulatedCamera::setFailing(bool failing) { failing_ = failing; }

void SimulatedCamera::setGrabLatency(std::chrono::milliseconds latency) {
    latency_ms_ = latency.count();
}

auto SimulatedCamera::grabCount() const -> uint64_t { return grab_count_; }

auto SimulatedCamera::openCount() const -> uint64_t { return open_count_; }

auto SimulatedCamera::generateFrame(uint64_t sequence) const -> Frame {
    Frame frame;
    frame.cameraId = id_;
    frame.width = width_;
    frame.height = height_;
    frame.channels = 3;
    frame.status = FrameStatus::Live;
    frame.data.resize(frame.expectedSize());

    // Horizontal gradient in blue, vertical in green, red drifts per frame
    const auto red = static_cast<uint8_t>((id_ * 60 + sequence) % 256);
    size_t idx = 0;
    for (int y = 0; y < height_; ++y) {
        const auto green = static_cast<uint8_t>(y * 255 / std::max(1, height_ - 1));
        for (int x = 0; x < width_; ++x) {
            frame.data[idx++] =
                static_cast<uint8_t>(x * 255 / std::max(1, width_ - 1));
            frame.data[idx++] = green;
            frame.data[idx++] = red;
        }
    }
    return frame;
}

}  // namespace lumen::device
