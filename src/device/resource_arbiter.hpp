/*
 * resource_arbiter.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Per-camera exclusive leases shared by capture and preview

**************************************************/

#ifndef LUMEN_DEVICE_RESOURCE_ARBITER_HPP
#define LUMEN_DEVICE_RESOURCE_ARBITER_HPP

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace lumen::device {

class ResourceArbiter;

/**
 * @brief RAII ownership of one or more device ids
 *
 * Move-only. Releases every held id on destruction.
 */
class ExclusiveLease {
public:
    ExclusiveLease() = default;
    ~ExclusiveLease();

    ExclusiveLease(ExclusiveLease&& other) noexcept;
    ExclusiveLease& operator=(ExclusiveLease&& other) noexcept;

    ExclusiveLease(const ExclusiveLease&) = delete;
    ExclusiveLease& operator=(const ExclusiveLease&) = delete;

    /**
     * @brief Held ids in ascending order
     */
    [[nodiscard]] auto ids() const -> const std::vector<int>&;

    [[nodiscard]] auto ownsLock() const -> bool;

    /**
     * @brief Release early; later calls are no-ops
     */
    void release();

private:
    friend class ResourceArbiter;
    ExclusiveLease(ResourceArbiter* arbiter, std::vector<int> ids);

    ResourceArbiter* arbiter_{nullptr};
    std::vector<int> ids_;
};

/**
 * @brief Arbitrates exclusive device access
 *
 * Blocking acquisition takes ids in ascending order, so two callers
 * requesting overlapping sets cannot deadlock. Non-blocking acquisition
 * yields to any blocked caller, which gives captures priority over the
 * preview loop.
 */
class ResourceArbiter {
public:
    ResourceArbiter() = default;

    ResourceArbiter(const ResourceArbiter&) = delete;
    ResourceArbiter& operator=(const ResourceArbiter&) = delete;

    /**
     * @brief Block until every id is held by the returned lease
     */
    [[nodiscard]] auto acquire(std::vector<int> ids) -> ExclusiveLease;

    /**
     * @brief Take one id if it is free and nobody is waiting for it
     */
    [[nodiscard]] auto tryAcquire(int id) -> std::optional<ExclusiveLease>;

    /**
     * @brief Run fn while holding ids; released on every exit path
     */
    template <typename Fn>
    auto withExclusive(std::vector<int> ids, Fn&& fn) -> decltype(fn()) {
        auto lease = acquire(std::move(ids));
        return std::forward<Fn>(fn)();
    }

    [[nodiscard]] auto isHeld(int id) const -> bool;

    /**
     * @brief Number of callers blocked in acquire() on this id
     */
    [[nodiscard]] auto waitingCount(int id) const -> int;

private:
    friend class ExclusiveLease;

    struct SlotState {
        bool held{false};
        int waiting{0};
    };

    void release(const std::vector<int>& ids);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<int, SlotState> slots_;
};

}  // namespace lumen::device

#endif  // LUMEN_DEVICE_RESOURCE_ARBITER_HPP
