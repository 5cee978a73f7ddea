/*
 * settings_store.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Process-wide settings snapshot with validated updates

**************************************************/

#ifndef LUMEN_SETTINGS_SETTINGS_STORE_HPP
#define LUMEN_SETTINGS_SETTINGS_STORE_HPP

#include <shared_mutex>

#include "settings.hpp"

namespace lumen::settings {

/**
 * @brief Thread-safe holder of the current Settings
 *
 * Readers get a copy; every mutation is validated before it is published,
 * so a rejected update leaves the store unchanged. Nothing is persisted.
 */
class SettingsStore {
public:
    explicit SettingsStore(Settings initial = {});

    [[nodiscard]] auto get() const -> Settings;

    /**
     * @brief Merge a patch
     * @return The new snapshot, or ValidationError with no state change
     */
    auto update(const SettingsPatch& patch) -> Result<Settings>;

    /**
     * @brief Store a light level, clamped to [0,255]
     * @return The stored value
     */
    auto setBrightness(int value) -> int;

    /**
     * @brief Increment the shot number
     * @return The new shot number
     */
    auto advanceShotNumber() -> int;

    /**
     * @brief Snapshot the settings and claim its shot number
     *
     * The returned snapshot carries the claimed number; the store moves on
     * to the next one under the same lock, so no two callers share a shot.
     */
    auto reserveShot() -> Settings;

    /**
     * @brief Give back a claimed shot number that produced no file
     *
     * Only succeeds while no later number has been claimed or set.
     * @return true if the counter was rolled back
     */
    auto releaseShot(int shotNumber) -> bool;

    /**
     * @brief Explicitly set the shot number, which may lower it
     */
    auto resetShotNumber(int value) -> Result<int>;

private:
    mutable std::shared_mutex mutex_;
    Settings settings_;
};

}  // namespace lumen::settings

#endif  // LUMEN_SETTINGS_SETTINGS_STORE_HPP
