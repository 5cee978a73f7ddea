/*
 * test_settings_store.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Tests for SettingsStore

**************************************************/

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "common/exceptions.hpp"
#include "settings/settings_store.hpp"

using namespace lumen::settings;

class SettingsStoreTest : public ::testing::Test {
protected:
    SettingsStore store_{Settings{}};
};

TEST_F(SettingsStoreTest, InvalidInitialSettingsThrow) {
    Settings bad;
    bad.product = "";
    EXPECT_THROW(SettingsStore{bad}, lumen::LumenException);
}

TEST_F(SettingsStoreTest, UpdateAppliesPatch) {
    SettingsPatch patch;
    patch.product = "ModelB";
    patch.saveMode = 3;
    auto updated = store_.update(patch);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->product, "ModelB");
    EXPECT_EQ(store_.get().saveMode, SaveMode::DesignatedOnly);
}

TEST_F(SettingsStoreTest, RejectedUpdateLeavesStateUnchanged) {
    auto before = store_.get();

    SettingsPatch patch;
    patch.product = "ModelB";   // valid
    patch.saveMode = 7;         // invalid
    auto updated = store_.update(patch);
    ASSERT_FALSE(updated.has_value());
    EXPECT_EQ(updated.error().code, lumen::ErrorCode::ValidationError);

    EXPECT_EQ(store_.get().toJson(), before.toJson());
}

TEST_F(SettingsStoreTest, SetBrightnessClamps) {
    EXPECT_EQ(store_.setBrightness(300), 255);
    EXPECT_EQ(store_.get().brightness, 255);
    EXPECT_EQ(store_.setBrightness(-1), 0);
    EXPECT_EQ(store_.get().brightness, 0);
}

TEST_F(SettingsStoreTest, ShotNumber) {
    EXPECT_EQ(store_.advanceShotNumber(), 2);
    EXPECT_EQ(store_.advanceShotNumber(), 3);
    EXPECT_EQ(store_.get().shotNumber, 3);

    auto reset = store_.resetShotNumber(10);
    ASSERT_TRUE(reset.has_value());
    EXPECT_EQ(store_.get().shotNumber, 10);

    EXPECT_FALSE(store_.resetShotNumber(-2).has_value());
    EXPECT_EQ(store_.get().shotNumber, 10);
}

TEST_F(SettingsStoreTest, ConcurrentAdvanceIsAtomic) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 250; ++i) {
                store_.advanceShotNumber();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(store_.get().shotNumber, 1001);
}

TEST_F(SettingsStoreTest, ReserveShotReturnsSnapshotAndAdvances) {
    auto reserved = store_.reserveShot();
    EXPECT_EQ(reserved.shotNumber, 1);
    EXPECT_EQ(reserved.product, store_.get().product);
    EXPECT_EQ(store_.get().shotNumber, 2);
}

TEST_F(SettingsStoreTest, ReleaseShotOnlyUndoesLatestReservation) {
    auto first = store_.reserveShot();
    EXPECT_TRUE(store_.releaseShot(first.shotNumber));
    EXPECT_EQ(store_.get().shotNumber, 1);

    auto a = store_.reserveShot();
    auto b = store_.reserveShot();
    // b is outstanding, so a's number cannot be handed out again
    EXPECT_FALSE(store_.releaseShot(a.shotNumber));
    EXPECT_EQ(store_.get().shotNumber, 3);
    EXPECT_TRUE(store_.releaseShot(b.shotNumber));
    EXPECT_EQ(store_.get().shotNumber, 2);
}

TEST_F(SettingsStoreTest, ConcurrentReservationsAreUnique) {
    std::mutex seenMutex;
    std::set<int> seen;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, &seenMutex, &seen] {
            for (int i = 0; i < 100; ++i) {
                auto shot = store_.reserveShot().shotNumber;
                std::lock_guard lock(seenMutex);
                seen.insert(shot);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(seen.size(), 400u);
    EXPECT_EQ(store_.get().shotNumber, 401);
}
