/*
 * resource_arbiter.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "resource_arbiter.hpp"

#include <algorithm>

namespace lumen::device {

// ==================== ExclusiveLease ====================

ExclusiveLease::ExclusiveLease(ResourceArbiter* arbiter, std::vector<int> ids)
    : arbiter_(arbiter), ids_(std::move(ids)) {}

ExclusiveLease::~ExclusiveLease() { release(); }

ExclusiveLease::ExclusiveLease(ExclusiveLease&& other) noexcept
    : arbiter_(std::exchange(other.arbiter_, nullptr)),
      ids_(std::move(other.ids_)) {
    other.ids_.clear();
}

ExclusiveLease& ExclusiveLease::operator=(ExclusiveLease&& other) noexcept {
    if (this != &other) {
        release();
        arbiter_ = std::exchange(other.arbiter_, nullptr);
        ids_ = std::move(other.ids_);
        other.ids_.clear();
    }
    return *this;
}

auto ExclusiveLease::ids() const -> const std::vector<int>& { return ids_; }

auto ExclusiveLease::ownsLock() const -> bool { return arbiter_ != nullptr; }

void ExclusiveLease::release() {
    if (arbiter_ != nullptr) {
        arbiter_->release(ids_);
        arbiter_ = nullptr;
    }
}

// ==================== ResourceArbiter ====================

auto ResourceArbiter::acquire(std::vector<int> ids) -> ExclusiveLease {
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    std::unique_lock lock(mutex_);
    for (int id : ids) {
        auto& slot = slots_[id];
        if (slot.held) {
            ++slot.waiting;
            cv_.wait(lock, [&slot] { return !slot.held; });
            --slot.waiting;
        }
        slot.held = true;
    }
    return ExclusiveLease(this, std::move(ids));
}

auto ResourceArbiter::tryAcquire(int id) -> std::optional<ExclusiveLease> {
    std::lock_guard lock(mutex_);
    auto& slot = slots_[id];
    if (slot.held || slot.waiting > 0) {
        return std::nullopt;
    }
    slot.held = true;
    return ExclusiveLease(this, {id});
}

auto ResourceArbiter::isHeld(int id) const -> bool {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(id);
    return it != slots_.end() && it->second.held;
}

auto ResourceArbiter::waitingCount(int id) const -> int {
    std::lock_guard lock(mutex_);
    auto it = slots_.find(id);
    return it == slots_.end() ? 0 : it->second.waiting;
}

void ResourceArbiter::release(const std::vector<int>& ids) {
    {
        std::lock_guard lock(mutex_);
        for (int id : ids) {
            slots_[id].held = false;
        }
    }
    cv_.notify_all();
}

}  // namespace lumen::device
