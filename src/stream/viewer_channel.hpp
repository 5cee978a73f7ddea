/*
 * viewer_channel.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Preview consumers attached to the streaming feed

**************************************************/

#ifndef LUMEN_STREAM_VIEWER_CHANNEL_HPP
#define LUMEN_STREAM_VIEWER_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "device/frame.hpp"

namespace lumen::stream {

using ViewerId = uint64_t;

/**
 * @brief Push-style preview consumer
 *
 * deliver() is called from the feed thread and must not block for long.
 * Returning false, or throwing a std::exception, disconnects the viewer.
 */
class ViewerChannel {
public:
    virtual ~ViewerChannel() = default;

    virtual auto deliver(const device::FramePtr& frame) -> bool = 0;
};

/**
 * @brief Bounded queue that drops its oldest frame when full
 */
class FrameQueue : public ViewerChannel {
public:
    explicit FrameQueue(size_t capacity);

    auto deliver(const device::FramePtr& frame) -> bool override;

    /**
     * @brief Wait for the next frame
     * @return nullopt on timeout or once closed and drained
     */
    auto pop(std::chrono::milliseconds timeout)
        -> std::optional<device::FramePtr>;

    void close();

    [[nodiscard]] auto isClosed() const -> bool;
    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto dropped() const -> uint64_t;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<device::FramePtr> frames_;
    bool closed_{false};
    uint64_t dropped_{0};
};

}  // namespace lumen::stream

#endif  // LUMEN_STREAM_VIEWER_CHANNEL_HPP
