/*
 * settings_store.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "settings_store.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

#include "common/exceptions.hpp"
#include "device/light_protocol.hpp"

namespace lumen::settings {

SettingsStore::SettingsStore(Settings initial) : settings_(std::move(initial)) {
    if (auto valid = settings_.validate(); !valid) {
        throw LumenException(valid.error());
    }
}

auto SettingsStore::get() const -> Settings {
    std::shared_lock lock(mutex_);
    return settings_;
}

auto SettingsStore::update(const SettingsPatch& patch) -> Result<Settings> {
    std::unique_lock lock(mutex_);
    auto next = patch.applyTo(settings_);
    if (!next) {
        spdlog::debug("Settings update rejected: {}", next.error().message);
        return next;
    }
    settings_ = *next;
    spdlog::info("Settings updated: {}", patch.toJson().dump());
    return next;
}

auto SettingsStore::setBrightness(int value) -> int {
    const int clamped = device::clampBrightness(value);
    std::unique_lock lock(mutex_);
    settings_.brightness = clamped;
    return clamped;
}

auto SettingsStore::advanceShotNumber() -> int {
    std::unique_lock lock(mutex_);
    return ++settings_.shotNumber;
}

auto SettingsStore::reserveShot() -> Settings {
    std::unique_lock lock(mutex_);
    Settings snapshot = settings_;
    ++settings_.shotNumber;
    return snapshot;
}

auto SettingsStore::releaseShot(int shotNumber) -> bool {
    std::unique_lock lock(mutex_);
    if (settings_.shotNumber != shotNumber + 1) {
        return false;
    }
    settings_.shotNumber = shotNumber;
    return true;
}

auto SettingsStore::resetShotNumber(int value) -> Result<int> {
    if (value < 0) {
        return failure<int>(ErrorCode::ValidationError,
                            "Shot number must not be negative");
    }
    std::unique_lock lock(mutex_);
    settings_.shotNumber = value;
    spdlog::info("Shot number reset to {}", value);
    return value;
}

}  // namespace lumen::settings
