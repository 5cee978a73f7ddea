/*
 * test_resource_arbiter.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Tests for ResourceArbiter leases and priority

**************************************************/

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "device/resource_arbiter.hpp"

using namespace lumen::device;
using namespace std::chrono_literals;

class ResourceArbiterTest : public ::testing::Test {
protected:
    // Spin until a caller is blocked on the id
    void waitForWaiter(int id, int count = 1) {
        for (int i = 0; i < 500 && arbiter_.waitingCount(id) < count; ++i) {
            std::this_thread::sleep_for(1ms);
        }
        ASSERT_GE(arbiter_.waitingCount(id), count);
    }

    ResourceArbiter arbiter_;
};

// ============================================================================
// Lease Tests
// ============================================================================

TEST_F(ResourceArbiterTest, LeaseHoldsSortedUniqueIds) {
    auto lease = arbiter_.acquire({3, 1, 3, 2});
    EXPECT_TRUE(lease.ownsLock());
    EXPECT_EQ(lease.ids(), (std::vector<int>{1, 2, 3}));
    EXPECT_TRUE(arbiter_.isHeld(1));
    EXPECT_TRUE(arbiter_.isHeld(3));
    EXPECT_FALSE(arbiter_.isHeld(4));
}

TEST_F(ResourceArbiterTest, DestructionReleases) {
    {
        auto lease = arbiter_.acquire({1});
        EXPECT_TRUE(arbiter_.isHeld(1));
    }
    EXPECT_FALSE(arbiter_.isHeld(1));
}

TEST_F(ResourceArbiterTest, EarlyReleaseIsIdempotent) {
    auto lease = arbiter_.acquire({1});
    lease.release();
    EXPECT_FALSE(lease.ownsLock());
    EXPECT_FALSE(arbiter_.isHeld(1));

    auto other = arbiter_.acquire({1});
    lease.release();
    EXPECT_TRUE(arbiter_.isHeld(1));
}

TEST_F(ResourceArbiterTest, MoveTransfersOwnership) {
    auto lease = arbiter_.acquire({2});
    ExclusiveLease moved(std::move(lease));
    EXPECT_TRUE(moved.ownsLock());
    EXPECT_FALSE(lease.ownsLock());  // NOLINT(bugprone-use-after-move)
    EXPECT_TRUE(arbiter_.isHeld(2));
}

// ============================================================================
// Non-blocking Acquisition Tests
// ============================================================================

TEST_F(ResourceArbiterTest, TryAcquireFailsWhileHeld) {
    auto lease = arbiter_.acquire({1});
    EXPECT_FALSE(arbiter_.tryAcquire(1).has_value());
    EXPECT_TRUE(arbiter_.tryAcquire(2).has_value());
}

TEST_F(ResourceArbiterTest, TryAcquireYieldsToBlockedCaller) {
    auto first = arbiter_.acquire({1});

    std::atomic<bool> acquired{false};
    std::thread blocked([&] {
        auto lease = arbiter_.acquire({1});
        acquired = true;
        std::this_thread::sleep_for(20ms);
    });

    waitForWaiter(1);
    first.release();

    // Either still queued or already handed over, never to the poller
    EXPECT_FALSE(arbiter_.tryAcquire(1).has_value());

    blocked.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(arbiter_.waitingCount(1), 0);
    EXPECT_TRUE(arbiter_.tryAcquire(1).has_value());
}

TEST_F(ResourceArbiterTest, WaitingCountTracksBlockedCallers) {
    auto lease = arbiter_.acquire({4});
    std::thread a([&] { auto l = arbiter_.acquire({4}); });
    std::thread b([&] { auto l = arbiter_.acquire({4}); });

    waitForWaiter(4, 2);
    EXPECT_EQ(arbiter_.waitingCount(4), 2);

    lease.release();
    a.join();
    b.join();
    EXPECT_EQ(arbiter_.waitingCount(4), 0);
    EXPECT_FALSE(arbiter_.isHeld(4));
}

// ============================================================================
// Ordering Tests
// ============================================================================

TEST_F(ResourceArbiterTest, OverlappingSetsDoNotDeadlock) {
    std::atomic<int> rounds{0};
    auto worker = [&](std::vector<int> ids) {
        for (int i = 0; i < 200; ++i) {
            auto lease = arbiter_.acquire(ids);
            rounds++;
        }
    };
    std::thread a(worker, std::vector<int>{1, 2, 3});
    std::thread b(worker, std::vector<int>{3, 2, 1});
    std::thread c(worker, std::vector<int>{2, 4});
    a.join();
    b.join();
    c.join();
    EXPECT_EQ(rounds, 600);
}

TEST_F(ResourceArbiterTest, WithExclusiveReleasesOnException) {
    EXPECT_THROW(arbiter_.withExclusive({1, 2},
                                        []() -> int {
                                            throw std::runtime_error("boom");
                                        }),
                 std::runtime_error);
    EXPECT_FALSE(arbiter_.isHeld(1));
    EXPECT_FALSE(arbiter_.isHeld(2));

    int value = arbiter_.withExclusive({1}, [this] {
        return arbiter_.isHeld(1) ? 7 : 0;
    });
    EXPECT_EQ(value, 7);
}
