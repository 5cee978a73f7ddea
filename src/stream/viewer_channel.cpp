/*
 * viewer_channel.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "viewer_channel.hpp"

#include <algorithm>

namespace lumen::stream {

FrameQueue::FrameQueue(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

auto FrameQueue::deliver(const device::FramePtr& frame) -> bool {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        if (frames_.size() >= capacity_) {
            frames_.pop_front();
            ++dropped_;
        }
        frames_.push_back(frame);
    }
    cv_.notify_one();
    return true;
}

auto FrameQueue::pop(std::chrono::milliseconds timeout)
    -> std::optional<device::FramePtr> {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
    if (frames_.empty()) {
        return std::nullopt;
    }
    auto frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void FrameQueue::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

auto FrameQueue::isClosed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

auto FrameQueue::size() const -> size_t {
    std::lock_guard lock(mutex_);
    return frames_.size();
}

auto FrameQueue::dropped() const -> uint64_t {
    std::lock_guard lock(mutex_);
    return dropped_;
}

}  // namespace lumen::stream
