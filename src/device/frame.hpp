/*
 * frame.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Raw camera frame shared between capture and preview

**************************************************/

#ifndef LUMEN_DEVICE_FRAME_HPP
#define LUMEN_DEVICE_FRAME_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lumen::device {

/**
 * @brief Whether a frame came from the sensor or is a placeholder
 */
enum class FrameStatus { Live, Fallback };

[[nodiscard]] inline auto frameStatusToString(FrameStatus status)
    -> std::string {
    switch (status) {
        case FrameStatus::Live:
            return "live";
        case FrameStatus::Fallback:
            return "fallback";
    }
    return "unknown";
}

struct Resolution {
    int width{0};
    int height{0};
};

/**
 * @brief Interleaved BGR8 image buffer
 */
struct Frame {
    int cameraId{0};
    int width{0};
    int height{0};
    int channels{3};
    std::vector<uint8_t> data;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};
    FrameStatus status{FrameStatus::Live};

    [[nodiscard]] auto isFallback() const -> bool {
        return status == FrameStatus::Fallback;
    }

    [[nodiscard]] auto expectedSize() const -> size_t {
        return static_cast<size_t>(width) * static_cast<size_t>(height) *
               static_cast<size_t>(channels);
    }

    /**
     * @brief Dimensions are positive and the buffer matches them
     */
    [[nodiscard]] auto isValid() const -> bool {
        return width > 0 && height > 0 && channels > 0 &&
               data.size() == expectedSize();
    }

    /**
     * @brief Metadata only; pixel data is never serialized
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Frames are fanned out as immutable shared buffers
 */
using FramePtr = std::shared_ptr<const Frame>;

/**
 * @brief Deterministic all-black placeholder for an unavailable camera
 */
[[nodiscard]] auto makeFallbackFrame(int cameraId, int width, int height)
    -> Frame;

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_FRAME_HPP
