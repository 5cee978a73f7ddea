/*
 * camera_adapter.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Narrow interface over a vendor camera SDK

**************************************************/

#ifndef LUMEN_DEVICE_CAMERA_ADAPTER_HPP
#define LUMEN_DEVICE_CAMERA_ADAPTER_HPP

#include <chrono>
#include <optional>

#include "frame.hpp"

namespace lumen::device {

/**
 * @brief One physical camera
 *
 * Implementations may throw from any member; DeviceRegistry absorbs
 * exceptions derived from std::exception and degrades to a fallback frame.
 * Calls on one adapter are serialized by the registry.
 */
class CameraAdapter {
public:
    virtual ~CameraAdapter() = default;

    /**
     * @brief Camera index as configured (1-based in the field setup)
     */
    [[nodiscard]] virtual auto id() const -> int = 0;

    virtual auto open() -> bool = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual auto isOpen() const -> bool = 0;

    /**
     * @brief Grab one BGR8 frame
     * @param timeout Upper bound the SDK should honour
     * @return Frame, or nullopt if none could be produced
     */
    virtual auto grab(std::chrono::milliseconds timeout)
        -> std::optional<Frame> = 0;

    [[nodiscard]] virtual auto resolution() const -> Resolution = 0;
};

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_CAMERA_ADAPTER_HPP
