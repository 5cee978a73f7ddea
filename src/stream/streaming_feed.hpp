/*
 * streaming_feed.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Continuous preview loop with cached frames and viewer fan-out

**************************************************/

#ifndef LUMEN_STREAM_STREAMING_FEED_HPP
#define LUMEN_STREAM_STREAMING_FEED_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "device/frame.hpp"
#include "viewer_channel.hpp"

namespace lumen::config {
struct StreamSection;
}

namespace lumen::device {
class DeviceRegistry;
class ResourceArbiter;
}  // namespace lumen::device

namespace lumen::stream {

struct StreamingOptions {
    int fps{30};
    size_t subscriptionQueueSize{8};

    [[nodiscard]] static auto fromConfig(const config::StreamSection& section)
        -> StreamingOptions;
};

class StreamingFeed;

/**
 * @brief Pull-style view of the preview stream
 *
 * Frames arrive in a bounded queue that drops the oldest entry when the
 * reader falls behind. Closing, or destroying, the subscription disconnects
 * it from the feed; subscribing again starts a fresh one.
 */
class FrameSubscription {
public:
    ~FrameSubscription();

    FrameSubscription(FrameSubscription&& other) noexcept;
    FrameSubscription& operator=(FrameSubscription&& other) noexcept;

    FrameSubscription(const FrameSubscription&) = delete;
    FrameSubscription& operator=(const FrameSubscription&) = delete;

    /**
     * @brief Next preview frame, or nullopt on timeout or once closed
     */
    auto next(std::chrono::milliseconds timeout)
        -> std::optional<device::FramePtr>;

    void close();

    [[nodiscard]] auto isOpen() const -> bool;
    [[nodiscard]] auto id() const -> ViewerId;
    [[nodiscard]] auto dropped() const -> uint64_t;

private:
    friend class StreamingFeed;

    FrameSubscription(ViewerId id, std::shared_ptr<FrameQueue> queue,
                      std::function<void()> detach);

    ViewerId id_{0};
    std::shared_ptr<FrameQueue> queue_;
    std::function<void()> detach_;
};

/**
 * @brief Preview loop shared by every viewer
 *
 * Each tick tries to lease every camera without blocking; a camera held by a
 * capture is served from the cache (or a fallback frame) instead. The loop
 * never blocks on a capture.
 */
class StreamingFeed {
public:
    StreamingFeed(device::DeviceRegistry& registry,
                  device::ResourceArbiter& arbiter,
                  StreamingOptions options = {});
    ~StreamingFeed();

    StreamingFeed(const StreamingFeed&) = delete;
    StreamingFeed& operator=(const StreamingFeed&) = delete;

    /**
     * @brief Start the background loop at options().fps
     */
    void start();

    /**
     * @brief Stop and join the loop; viewers stay attached
     */
    void stop();

    [[nodiscard]] auto isRunning() const -> bool;

    /**
     * @brief Run one tick on the calling thread
     */
    void pumpOnce();

    /**
     * @brief Attach a viewer; it receives the cached frames immediately
     */
    auto addViewer(std::shared_ptr<ViewerChannel> channel) -> ViewerId;

    auto removeViewer(ViewerId id) -> bool;

    [[nodiscard]] auto viewerCount() const -> size_t;

    [[nodiscard]] auto subscribe() -> FrameSubscription;

    /**
     * @brief Cached frame of a camera, or its fallback if none yet
     */
    [[nodiscard]] auto latestFrame(int cameraId) const -> device::FramePtr;

    [[nodiscard]] auto tickCount() const -> uint64_t;

    [[nodiscard]] auto options() const -> const StreamingOptions&;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace lumen::stream

#endif  // LUMEN_STREAM_STREAMING_FEED_HPP
