/*
 * test_streaming_feed.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Tests for the preview feed and its viewers

**************************************************/

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include "device/device_registry.hpp"
#include "device/mock/simulated_camera.hpp"
#include "device/resource_arbiter.hpp"
#include "stream/streaming_feed.hpp"

using namespace lumen::stream;
using namespace lumen::device;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

class MockViewerChannel : public ViewerChannel {
public:
    MOCK_METHOD(bool, deliver, (const FramePtr& frame), (override));
};

class CollectingViewer : public ViewerChannel {
public:
    auto deliver(const FramePtr& frame) -> bool override {
        std::lock_guard lock(mutex_);
        frames_.push_back(frame);
        return true;
    }

    auto frames() const -> std::vector<FramePtr> {
        std::lock_guard lock(mutex_);
        return frames_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<FramePtr> frames_;
};

}  // namespace

class StreamingFeedTest : public ::testing::Test {
protected:
    void SetUp() override {
        cam1_ = std::make_shared<SimulatedCamera>(1, 8, 6);
        cam2_ = std::make_shared<SimulatedCamera>(2, 8, 6);

        RegistryOptions options;
        options.fallbackWidth = 4;
        options.fallbackHeight = 3;
        options.reconnectInterval = 0ms;
        registry_ = std::make_unique<DeviceRegistry>(
            std::vector<int>{1, 2},
            std::vector<std::shared_ptr<CameraAdapter>>{cam1_, cam2_},
            std::vector<std::shared_ptr<LightAdapter>>{}, options);
        registry_->initialize();

        StreamingOptions streamOptions;
        streamOptions.fps = 50;
        streamOptions.subscriptionQueueSize = 4;
        feed_ = std::make_unique<StreamingFeed>(*registry_, arbiter_,
                                                streamOptions);
    }

    void TearDown() override {
        feed_.reset();
        registry_.reset();
    }

    std::shared_ptr<SimulatedCamera> cam1_;
    std::shared_ptr<SimulatedCamera> cam2_;
    std::unique_ptr<DeviceRegistry> registry_;
    ResourceArbiter arbiter_;
    std::unique_ptr<StreamingFeed> feed_;
};

// ============================================================================
// Frame Queue Tests
// ============================================================================

TEST(FrameQueueTest, DropsOldestWhenFull) {
    FrameQueue queue(2);
    for (int id = 1; id <= 3; ++id) {
        auto frame = std::make_shared<Frame>(makeFallbackFrame(id, 2, 2));
        EXPECT_TRUE(queue.deliver(frame));
    }
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.dropped(), 1u);

    auto first = queue.pop(0ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ((*first)->cameraId, 2);
}

TEST(FrameQueueTest, ClosedQueueRefusesFrames) {
    FrameQueue queue(2);
    queue.close();
    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(
        queue.deliver(std::make_shared<Frame>(makeFallbackFrame(1, 2, 2))));
    EXPECT_FALSE(queue.pop(10ms).has_value());
}

// ============================================================================
// Pump Tests
// ============================================================================

TEST_F(StreamingFeedTest, PumpCachesLiveFrames) {
    auto viewer = std::make_shared<CollectingViewer>();
    feed_->addViewer(viewer);

    feed_->pumpOnce();
    EXPECT_EQ(feed_->tickCount(), 1u);

    auto frames = viewer->frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0]->cameraId, 1);
    EXPECT_EQ(frames[1]->cameraId, 2);
    EXPECT_EQ(frames[0]->status, FrameStatus::Live);

    EXPECT_EQ(feed_->latestFrame(1), frames[0]);
}

TEST_F(StreamingFeedTest, LatestFrameFallsBackBeforeFirstTick) {
    auto frame = feed_->latestFrame(2);
    ASSERT_NE(frame, nullptr);
    EXPECT_TRUE(frame->isFallback());
    EXPECT_EQ(frame->width, 4);
}

TEST_F(StreamingFeedTest, HeldCameraIsServedFromCache) {
    feed_->pumpOnce();
    auto cached = feed_->latestFrame(1);
    auto grabsBefore = cam1_->grabCount();

    auto viewer = std::make_shared<CollectingViewer>();
    {
        auto lease = arbiter_.acquire({1});
        feed_->addViewer(viewer);
        feed_->pumpOnce();
    }

    EXPECT_EQ(cam1_->grabCount(), grabsBefore);
    auto frames = viewer->frames();
    ASSERT_EQ(frames.size(), 4u);  // two on attach, two from the tick
    EXPECT_EQ(frames[2], cached);
    EXPECT_EQ(frames[3]->cameraId, 2);
}

TEST_F(StreamingFeedTest, HeldCameraWithoutCacheServesFallback) {
    auto viewer = std::make_shared<CollectingViewer>();
    feed_->addViewer(viewer);
    {
        auto lease = arbiter_.acquire({2});
        feed_->pumpOnce();
    }
    auto frames = viewer->frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_TRUE(frames[1]->isFallback());
}

// ============================================================================
// Viewer Tests
// ============================================================================

TEST_F(StreamingFeedTest, NewViewerGetsCachedFramesImmediately) {
    feed_->pumpOnce();
    auto viewer = std::make_shared<CollectingViewer>();
    feed_->addViewer(viewer);
    EXPECT_EQ(viewer->frames().size(), 2u);
}

TEST_F(StreamingFeedTest, RefusingViewerIsRemoved) {
    auto viewer = std::make_shared<MockViewerChannel>();
    EXPECT_CALL(*viewer, deliver(_)).WillOnce(Return(false));
    feed_->addViewer(viewer);
    EXPECT_EQ(feed_->viewerCount(), 1u);

    feed_->pumpOnce();
    EXPECT_EQ(feed_->viewerCount(), 0u);
}

TEST_F(StreamingFeedTest, ViewerRefusingCachedFramesIsNotAttached) {
    feed_->pumpOnce();
    auto viewer = std::make_shared<MockViewerChannel>();
    EXPECT_CALL(*viewer, deliver(_)).WillOnce(Return(false));
    auto id = feed_->addViewer(viewer);
    EXPECT_EQ(feed_->viewerCount(), 0u);
    EXPECT_FALSE(feed_->removeViewer(id));

    feed_->pumpOnce();
}

TEST_F(StreamingFeedTest, TickDuringReplayNeverOvertakesCachedFrames) {
    feed_->pumpOnce();
    const auto cached1 = feed_->latestFrame(1);
    const auto cached2 = feed_->latestFrame(2);

    // A tick runs on another thread while the first cached frame is queued
    auto viewer = std::make_shared<MockViewerChannel>();
    std::mutex framesMutex;
    std::vector<FramePtr> frames;
    bool tickStarted = false;
    ON_CALL(*viewer, deliver(_))
        .WillByDefault([&](const FramePtr& frame) {
            bool startTick = false;
            {
                std::lock_guard lock(framesMutex);
                frames.push_back(frame);
                startTick = !std::exchange(tickStarted, true);
            }
            if (startTick) {
                std::thread tick([this] { feed_->pumpOnce(); });
                tick.join();
            }
            return true;
        });
    EXPECT_CALL(*viewer, deliver(_)).Times(::testing::AtLeast(2));

    feed_->addViewer(viewer);
    feed_->pumpOnce();

    std::lock_guard lock(framesMutex);
    ASSERT_GE(frames.size(), 4u);
    EXPECT_EQ(frames[0], cached1);
    EXPECT_EQ(frames[1], cached2);
    for (size_t i = 2; i < frames.size(); ++i) {
        EXPECT_NE(frames[i], cached1) << i;
        EXPECT_NE(frames[i], cached2) << i;
    }
}

TEST_F(StreamingFeedTest, ThrowingViewerDoesNotAffectOthers) {
    auto bad = std::make_shared<MockViewerChannel>();
    EXPECT_CALL(*bad, deliver(_))
        .WillOnce(Throw(std::runtime_error("socket closed")));
    auto good = std::make_shared<CollectingViewer>();

    feed_->addViewer(bad);
    feed_->addViewer(good);
    feed_->pumpOnce();

    EXPECT_EQ(feed_->viewerCount(), 1u);
    EXPECT_EQ(good->frames().size(), 2u);
}

TEST_F(StreamingFeedTest, RemoveViewer) {
    auto id = feed_->addViewer(std::make_shared<CollectingViewer>());
    EXPECT_TRUE(feed_->removeViewer(id));
    EXPECT_FALSE(feed_->removeViewer(id));
}

// ============================================================================
// Subscription Tests
// ============================================================================

TEST_F(StreamingFeedTest, SubscriptionReceivesFrames) {
    auto sub = feed_->subscribe();
    EXPECT_TRUE(sub.isOpen());
    feed_->pumpOnce();

    auto frame = sub.next(100ms);
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ((*frame)->cameraId, 1);
}

TEST_F(StreamingFeedTest, ClosingSubscriptionDetachesViewer) {
    auto sub = feed_->subscribe();
    EXPECT_EQ(feed_->viewerCount(), 1u);
    sub.close();
    EXPECT_FALSE(sub.isOpen());
    EXPECT_EQ(feed_->viewerCount(), 0u);
    EXPECT_FALSE(sub.next(10ms).has_value());
}

TEST_F(StreamingFeedTest, DestroyedSubscriptionDetachesViewer) {
    {
        auto sub = feed_->subscribe();
        EXPECT_EQ(feed_->viewerCount(), 1u);
    }
    EXPECT_EQ(feed_->viewerCount(), 0u);
}

TEST_F(StreamingFeedTest, SlowSubscriberDropsOldest) {
    auto sub = feed_->subscribe();
    for (int i = 0; i < 5; ++i) {
        feed_->pumpOnce();
    }
    EXPECT_EQ(sub.dropped(), 6u);
}

// ============================================================================
// Loop Tests
// ============================================================================

TEST_F(StreamingFeedTest, LoopTicksUntilStopped) {
    feed_->start();
    EXPECT_TRUE(feed_->isRunning());
    std::this_thread::sleep_for(100ms);
    feed_->stop();
    EXPECT_FALSE(feed_->isRunning());

    auto ticks = feed_->tickCount();
    EXPECT_GT(ticks, 0u);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(feed_->tickCount(), ticks);
}

TEST_F(StreamingFeedTest, LoopKeepsRunningWhileCameraHeld) {
    feed_->start();
    auto lease = arbiter_.acquire({1, 2});
    auto before = feed_->tickCount();
    std::this_thread::sleep_for(100ms);
    EXPECT_GT(feed_->tickCount(), before);
    lease.release();
    feed_->stop();
}
