/*
 * streaming_feed.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "streaming_feed.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/runtime_config.hpp"
#include "device/device_registry.hpp"
#include "device/resource_arbiter.hpp"

namespace lumen::stream {

auto StreamingOptions::fromConfig(const config::StreamSection& section)
    -> StreamingOptions {
    StreamingOptions options;
    options.fps = section.fps;
    options.subscriptionQueueSize = section.subscriptionQueueSize;
    return options;
}

// ==================== FrameSubscription ====================

FrameSubscription::FrameSubscription(ViewerId id,
                                     std::shared_ptr<FrameQueue> queue,
                                     std::function<void()> detach)
    : id_(id), queue_(std::move(queue)), detach_(std::move(detach)) {}

FrameSubscription::~FrameSubscription() { close(); }

FrameSubscription::FrameSubscription(FrameSubscription&& other) noexcept
    : id_(other.id_),
      queue_(std::move(other.queue_)),
      detach_(std::exchange(other.detach_, nullptr)) {}

FrameSubscription& FrameSubscription::operator=(
    FrameSubscription&& other) noexcept {
    if (this != &other) {
        close();
        id_ = other.id_;
        queue_ = std::move(other.queue_);
        detach_ = std::exchange(other.detach_, nullptr);
    }
    return *this;
}

auto FrameSubscription::next(std::chrono::milliseconds timeout)
    -> std::optional<device::FramePtr> {
    if (!queue_ || queue_->isClosed()) {
        return std::nullopt;
    }
    return queue_->pop(timeout);
}

void FrameSubscription::close() {
    if (queue_) {
        queue_->close();
    }
    if (detach_) {
        auto detach = std::exchange(detach_, nullptr);
        detach();
    }
}

auto FrameSubscription::isOpen() const -> bool {
    return queue_ && !queue_->isClosed();
}

auto FrameSubscription::id() const -> ViewerId { return id_; }

auto FrameSubscription::dropped() const -> uint64_t {
    return queue_ ? queue_->dropped() : 0;
}

// ==================== StreamingFeed ====================

class StreamingFeed::Impl {
public:
    Impl(device::DeviceRegistry& registry, device::ResourceArbiter& arbiter,
         StreamingOptions options)
        : registry_(registry), arbiter_(arbiter), options_(options) {}

    void pumpOnce() {
        std::vector<device::FramePtr> frames;
        for (int id : registry_.listTargets()) {
            device::FramePtr frame;
            if (auto lease = arbiter_.tryAcquire(id)) {
                frame = std::make_shared<const device::Frame>(
                    registry_.acquireFrame(id));
                std::unique_lock lock(cacheMutex_);
                cache_[id] = frame;
            } else {
                frame = cachedOrFallback(id);
            }
            frames.push_back(std::move(frame));
        }
        ticks_.fetch_add(1);
        broadcast(frames);
    }

    auto cachedOrFallback(int id) const -> device::FramePtr {
        {
            std::shared_lock lock(cacheMutex_);
            if (auto it = cache_.find(id); it != cache_.end()) {
                return it->second;
            }
        }
        return std::make_shared<const device::Frame>(
            registry_.fallbackFrame(id));
    }

    auto cachedFrames() const -> std::vector<device::FramePtr> {
        std::shared_lock lock(cacheMutex_);
        std::vector<device::FramePtr> frames;
        frames.reserve(cache_.size());
        for (const auto& [id, frame] : cache_) {
            frames.push_back(frame);
        }
        return frames;
    }

    auto addViewer(std::shared_ptr<ViewerChannel> channel) -> ViewerId {
        ViewerId id = 0;
        {
            std::lock_guard lock(viewersMutex_);
            id = nextViewerId_++;
        }

        // Cached frames are queued before the channel becomes visible to
        // broadcast, so a newer tick can never land ahead of them
        for (const auto& frame : cachedFrames()) {
            if (!deliverTo(id, *channel, frame)) {
                spdlog::debug("Viewer {} refused cached frames", id);
                return id;
            }
        }

        {
            std::lock_guard lock(viewersMutex_);
            viewers_.emplace(id, std::move(channel));
        }
        spdlog::debug("Viewer {} attached", id);
        return id;
    }

    auto removeViewer(ViewerId id) -> bool {
        std::lock_guard lock(viewersMutex_);
        if (viewers_.erase(id) == 0) {
            return false;
        }
        spdlog::debug("Viewer {} detached", id);
        return true;
    }

    auto viewerCount() const -> size_t {
        std::lock_guard lock(viewersMutex_);
        return viewers_.size();
    }

    auto latestFrame(int cameraId) const -> device::FramePtr {
        return cachedOrFallback(cameraId);
    }

    void start() {
        std::lock_guard lock(loopMutex_);
        if (loop_.joinable()) {
            return;
        }
        running_ = true;
        loop_ = std::jthread([this](std::stop_token st) { run(st); });
        spdlog::info("Streaming feed started at {} fps", options_.fps);
    }

    void stop() {
        std::jthread loop;
        {
            std::lock_guard lock(loopMutex_);
            if (!loop_.joinable()) {
                return;
            }
            loop = std::move(loop_);
        }
        loop.request_stop();
        loop.join();
        running_ = false;
        spdlog::info("Streaming feed stopped after {} ticks", ticks_.load());
    }

    auto isRunning() const -> bool { return running_; }
    auto tickCount() const -> uint64_t { return ticks_; }
    auto options() const -> const StreamingOptions& { return options_; }

private:
    auto deliverTo(ViewerId id, ViewerChannel& channel,
                   const device::FramePtr& frame) -> bool {
        try {
            return channel.deliver(frame);
        } catch (const std::exception& e) {
            spdlog::warn("Viewer {} delivery failed: {}", id, e.what());
            return false;
        }
    }

    void broadcast(const std::vector<device::FramePtr>& frames) {
        std::vector<std::pair<ViewerId, std::shared_ptr<ViewerChannel>>> viewers;
        {
            std::lock_guard lock(viewersMutex_);
            viewers.assign(viewers_.begin(), viewers_.end());
        }

        std::vector<ViewerId> dead;
        for (const auto& [id, channel] : viewers) {
            for (const auto& frame : frames) {
                if (!deliverTo(id, *channel, frame)) {
                    dead.push_back(id);
                    break;
                }
            }
        }

        for (ViewerId id : dead) {
            removeViewer(id);
        }
    }

    void run(std::stop_token st) {
        const auto period = std::chrono::microseconds(
            1'000'000 / std::max(1, options_.fps));
        auto next = std::chrono::steady_clock::now();

        while (!st.stop_requested()) {
            try {
                pumpOnce();
            } catch (const std::exception& e) {
                spdlog::error("Streaming tick failed: {}", e.what());
            }

            next += period;
            auto now = std::chrono::steady_clock::now();
            if (next < now) {
                // Fell behind; do not try to catch up with a burst
                next = now;
            }
            std::unique_lock lock(sleepMutex_);
            sleepCv_.wait_until(lock, st, next, [] { return false; });
        }
    }

    device::DeviceRegistry& registry_;
    device::ResourceArbiter& arbiter_;
    StreamingOptions options_;

    mutable std::shared_mutex cacheMutex_;
    std::map<int, device::FramePtr> cache_;

    mutable std::mutex viewersMutex_;
    std::map<ViewerId, std::shared_ptr<ViewerChannel>> viewers_;
    ViewerId nextViewerId_{1};

    std::atomic<uint64_t> ticks_{0};
    std::atomic<bool> running_{false};

    std::mutex sleepMutex_;
    std::condition_variable_any sleepCv_;

    std::mutex loopMutex_;
    std::jthread loop_;
};

StreamingFeed::StreamingFeed(device::DeviceRegistry& registry,
                             device::ResourceArbiter& arbiter,
                             StreamingOptions options)
    : impl_(std::make_shared<Impl>(registry, arbiter, options)) {}

StreamingFeed::~StreamingFeed() { impl_->stop(); }

void StreamingFeed::start() { impl_->start(); }

void StreamingFeed::stop() { impl_->stop(); }

auto StreamingFeed::isRunning() const -> bool { return impl_->isRunning(); }

void StreamingFeed::pumpOnce() { impl_->pumpOnce(); }

auto StreamingFeed::addViewer(std::shared_ptr<ViewerChannel> channel)
    -> ViewerId {
    return impl_->addViewer(std::move(channel));
}

auto StreamingFeed::removeViewer(ViewerId id) -> bool {
    return impl_->removeViewer(id);
}

auto StreamingFeed::viewerCount() const -> size_t {
    return impl_->viewerCount();
}

auto StreamingFeed::subscribe() -> FrameSubscription {
    auto queue = std::make_shared<FrameQueue>(
        impl_->options().subscriptionQueueSize);
    ViewerId id = impl_->addViewer(queue);
    std::weak_ptr<Impl> weak = impl_;
    return FrameSubscription(id, queue, [weak, id] {
        if (auto feed = weak.lock()) {
            feed->removeViewer(id);
        }
    });
}

auto StreamingFeed::latestFrame(int cameraId) const -> device::FramePtr {
    return impl_->latestFrame(cameraId);
}

auto StreamingFeed::tickCount() const -> uint64_t { return impl_->tickCount(); }

auto StreamingFeed::options() const -> const StreamingOptions& {
    return impl_->options();
}

}  // namespace lumen::stream
