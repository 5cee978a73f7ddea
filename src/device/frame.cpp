/*
 * frame.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "frame.hpp"

namespace lumen::device {

auto Frame::toJson() const -> nlohmann::json {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  timestamp.time_since_epoch())
                  .count();
    return {{"camera_id", cameraId},
            {"width", width},
            {"height", height},
            {"channels", channels},
            {"timestamp_ms", ms},
            {"status", frameStatusToString(status)}};
}

auto makeFallbackFrame(int cameraId, int width, int height) -> Frame {
    Frame frame;
    frame.cameraId = cameraId;
    frame.width = width;
    frame.height = height;
    frame.channels = 3;
    frame.data.assign(frame.expectedSize(), 0);
    frame.status = FrameStatus::Fallback;
    return frame;
}

}  // namespace lumen::device
