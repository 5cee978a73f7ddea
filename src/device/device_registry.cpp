/*
 * device_registry.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "device_registry.hpp"

#include <format>
#include <map>
#include <mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "config/runtime_config.hpp"
#include "light_protocol.hpp"

namespace lumen::device {

using Clock = std::chrono::steady_clock;

auto RegistryOptions::fromConfig(const config::DeviceSection& section)
    -> RegistryOptions {
    RegistryOptions options;
    options.fallbackWidth = section.fallbackWidth;
    options.fallbackHeight = section.fallbackHeight;
    options.grabTimeout = std::chrono::milliseconds(section.grabTimeoutMs);
    options.lightTimeout = std::chrono::milliseconds(section.lightTimeoutMs);
    options.reconnectInterval =
        std::chrono::milliseconds(section.reconnectIntervalMs);
    return options;
}

namespace {

template <typename Adapter>
struct Slot {
    std::shared_ptr<Adapter> adapter;
    std::mutex io;  // serializes adapter calls
    std::optional<Clock::time_point> lastAttempt;

    mutable std::mutex stateMutex;
    DeviceRecord record;
};

using CameraSlot = Slot<CameraAdapter>;
using LightSlot = Slot<LightAdapter>;

}  // namespace

class DeviceRegistry::Impl {
public:
    RegistryOptions options;
    std::map<int, std::unique_ptr<CameraSlot>> cameras;
    std::vector<std::string> lightOrder;
    std::unordered_map<std::string, std::unique_ptr<LightSlot>> lights;

    template <typename Adapter>
    auto reconnectDue(const Slot<Adapter>& slot) const -> bool {
        if (!slot.lastAttempt) {
            return true;
        }
        return Clock::now() - *slot.lastAttempt >= options.reconnectInterval;
    }

    template <typename Adapter>
    auto ensureOpen(Slot<Adapter>& slot) -> bool {
        if (slot.adapter->isOpen()) {
            return true;
        }
        if (!reconnectDue(slot)) {
            return false;
        }
        slot.lastAttempt = Clock::now();
        return slot.adapter->open();
    }

    template <typename Adapter>
    void closeAfterFailure(Slot<Adapter>& slot) {
        slot.lastAttempt = Clock::now();
        try {
            slot.adapter->close();
        } catch (const std::exception& e) {
            spdlog::debug("Closing {} after failure raised: {}",
                          slot.record.id, e.what());
        }
    }

    template <typename Adapter>
    void markFailure(Slot<Adapter>& slot, const std::string& reason,
                     bool alwaysWarn) {
        std::lock_guard lock(slot.stateMutex);
        bool wasConnected = slot.record.isConnected();
        slot.record.status = Connectivity::Absent;
        slot.record.consecutiveFailures++;
        slot.record.lastError = reason;
        if (alwaysWarn || wasConnected || slot.record.consecutiveFailures == 1) {
            spdlog::warn("{} {} unavailable: {}",
                         deviceKindToString(slot.record.kind), slot.record.id,
                         reason);
        }
    }

    template <typename Adapter>
    void markConnected(Slot<Adapter>& slot) {
        std::lock_guard lock(slot.stateMutex);
        if (!slot.record.isConnected()) {
            spdlog::info("{} {} connected",
                         deviceKindToString(slot.record.kind), slot.record.id);
        }
        slot.record.status = Connectivity::Connected;
        slot.record.consecutiveFailures = 0;
        slot.record.lastError.reset();
    }

    auto fallback(int cameraId) const -> Frame {
        return makeFallbackFrame(cameraId, options.fallbackWidth,
                                 options.fallbackHeight);
    }

    auto lightUnavailable(LightSlot& slot, const std::string& reason)
        -> Result<int> {
        markFailure(slot, reason, true);
        return std::unexpected(Error(ErrorCode::DeviceUnavailable,
                                     "Light port unavailable: " + reason,
                                     slot.record.id));
    }
};

DeviceRegistry::DeviceRegistry(
    std::vector<int> cameraIds,
    std::vector<std::shared_ptr<CameraAdapter>> cameras,
    std::vector<std::shared_ptr<LightAdapter>> lights, RegistryOptions options)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = options;

    for (int id : cameraIds) {
        auto slot = std::make_unique<CameraSlot>();
        slot->record.id = std::to_string(id);
        slot->record.kind = DeviceKind::Camera;
        impl_->cameras.emplace(id, std::move(slot));
    }

    for (auto& adapter : cameras) {
        if (!adapter) {
            continue;
        }
        auto it = impl_->cameras.find(adapter->id());
        if (it == impl_->cameras.end()) {
            spdlog::warn("Camera adapter {} is not a configured target, ignored",
                         adapter->id());
            continue;
        }
        it->second->adapter = std::move(adapter);
    }

    for (auto& adapter : lights) {
        if (!adapter) {
            continue;
        }
        auto port = adapter->port();
        if (impl_->lights.contains(port)) {
            spdlog::warn("Duplicate light port {} ignored", port);
            continue;
        }
        auto slot = std::make_unique<LightSlot>();
        slot->record.id = port;
        slot->record.kind = DeviceKind::Light;
        slot->adapter = std::move(adapter);
        impl_->lightOrder.push_back(port);
        impl_->lights.emplace(port, std::move(slot));
    }
}

DeviceRegistry::~DeviceRegistry() { shutdown(); }

void DeviceRegistry::initialize() {
    size_t camerasUp = 0;
    for (auto& [id, slot] : impl_->cameras) {
        if (!slot->adapter) {
            impl_->markFailure(*slot, "no adapter", false);
            continue;
        }
        std::lock_guard io(slot->io);
        try {
            if (impl_->ensureOpen(*slot)) {
                impl_->markConnected(*slot);
                ++camerasUp;
            } else {
                impl_->markFailure(*slot, "open failed", false);
            }
        } catch (const std::exception& e) {
            impl_->markFailure(*slot, e.what(), false);
        }
    }

    size_t lightsUp = 0;
    for (const auto& port : impl_->lightOrder) {
        auto& slot = *impl_->lights.at(port);
        std::lock_guard io(slot.io);
        try {
            if (impl_->ensureOpen(slot)) {
                impl_->markConnected(slot);
                ++lightsUp;
            } else {
                impl_->markFailure(slot, "cannot open port", false);
            }
        } catch (const std::exception& e) {
            impl_->markFailure(slot, e.what(), false);
        }
    }

    spdlog::info("Device registry initialized: {}/{} cameras, {}/{} lights",
                 camerasUp, impl_->cameras.size(), lightsUp,
                 impl_->lights.size());
}

void DeviceRegistry::shutdown() {
    for (auto& [id, slot] : impl_->cameras) {
        if (!slot->adapter) {
            continue;
        }
        std::lock_guard io(slot->io);
        try {
            slot->adapter->close();
        } catch (const std::exception& e) {
            spdlog::warn("Error closing camera {}: {}", id, e.what());
        }
    }
    for (auto& [port, slot] : impl_->lights) {
        std::lock_guard io(slot->io);
        try {
            slot->adapter->close();
        } catch (const std::exception& e) {
            spdlog::warn("Error closing light {}: {}", port, e.what());
        }
    }
}

// ==================== Cameras ====================

auto DeviceRegistry::listTargets() const -> std::vector<int> {
    std::vector<int> ids;
    ids.reserve(impl_->cameras.size());
    for (const auto& [id, slot] : impl_->cameras) {
        ids.push_back(id);
    }
    return ids;
}

auto DeviceRegistry::acquireFrame(int cameraId) -> Frame {
    auto it = impl_->cameras.find(cameraId);
    if (it == impl_->cameras.end()) {
        spdlog::debug("Unknown camera {} requested, serving fallback",
                      cameraId);
        return impl_->fallback(cameraId);
    }

    auto& slot = *it->second;
    if (!slot.adapter) {
        impl_->markFailure(slot, "no adapter", false);
        return impl_->fallback(cameraId);
    }

    std::lock_guard io(slot.io);
    try {
        if (!impl_->ensureOpen(slot)) {
            impl_->markFailure(slot, "not open", false);
            return impl_->fallback(cameraId);
        }

        auto start = Clock::now();
        auto frame = slot.adapter->grab(impl_->options.grabTimeout);
        auto elapsed = Clock::now() - start;

        if (elapsed > impl_->options.grabTimeout) {
            impl_->markFailure(
                slot,
                std::format("grab exceeded {} ms",
                            impl_->options.grabTimeout.count()),
                false);
            return impl_->fallback(cameraId);
        }
        if (!frame || !frame->isValid()) {
            impl_->markFailure(slot, "no frame", false);
            return impl_->fallback(cameraId);
        }

        frame->cameraId = cameraId;
        frame->status = FrameStatus::Live;
        impl_->markConnected(slot);
        {
            std::lock_guard lock(slot.stateMutex);
            slot.record.lastLiveFrame = frame->timestamp;
        }
        return std::move(*frame);
    } catch (const std::exception& e) {
        impl_->markFailure(slot, e.what(), false);
        impl_->closeAfterFailure(slot);
        return impl_->fallback(cameraId);
    }
}

auto DeviceRegistry::fallbackFrame(int cameraId) const -> Frame {
    return impl_->fallback(cameraId);
}

auto DeviceRegistry::cameraStatus(int cameraId) const
    -> std::optional<DeviceRecord> {
    auto it = impl_->cameras.find(cameraId);
    if (it == impl_->cameras.end()) {
        return std::nullopt;
    }
    std::lock_guard lock(it->second->stateMutex);
    return it->second->record;
}

// ==================== Lights ====================

auto DeviceRegistry::listLightPorts() const -> std::vector<std::string> {
    return impl_->lightOrder;
}

auto DeviceRegistry::setBrightness(const std::string& port, int value)
    -> Result<int> {
    const int clamped = clampBrightness(value);
    if (clamped != value) {
        spdlog::debug("Brightness {} clamped to {}", value, clamped);
    }

    auto it = impl_->lights.find(port);
    if (it == impl_->lights.end()) {
        spdlog::warn("Brightness requested for unknown light port {}", port);
        return std::unexpected(Error(ErrorCode::DeviceUnavailable,
                                     "Unknown light port", port));
    }

    auto& slot = *it->second;
    std::lock_guard io(slot.io);
    try {
        if (!impl_->ensureOpen(slot)) {
            return impl_->lightUnavailable(slot, "cannot open port");
        }
        if (!slot.adapter->send(encodeBrightnessPacket(clamped),
                                impl_->options.lightTimeout)) {
            impl_->closeAfterFailure(slot);
            return impl_->lightUnavailable(slot, "write failed");
        }
    } catch (const std::exception& e) {
        impl_->closeAfterFailure(slot);
        return impl_->lightUnavailable(slot, e.what());
    }

    impl_->markConnected(slot);
    {
        std::lock_guard lock(slot.stateMutex);
        slot.record.brightness = clamped;
    }
    spdlog::debug("Light {} set to {}", port, clamped);
    return clamped;
}

auto DeviceRegistry::setAllBrightness(int value) -> std::vector<LightOutcome> {
    std::vector<LightOutcome> outcomes;
    outcomes.reserve(impl_->lightOrder.size());
    for (const auto& port : impl_->lightOrder) {
        LightOutcome outcome;
        outcome.port = port;
        outcome.value = clampBrightness(value);
        auto result = setBrightness(port, value);
        if (result) {
            outcome.accepted = true;
        } else {
            outcome.error = result.error();
        }
        outcomes.push_back(std::move(outcome));
    }
    return outcomes;
}

auto DeviceRegistry::lightStatus(const std::string& port) const
    -> std::optional<DeviceRecord> {
    auto it = impl_->lights.find(port);
    if (it == impl_->lights.end()) {
        return std::nullopt;
    }
    std::lock_guard lock(it->second->stateMutex);
    return it->second->record;
}

// ==================== Status ====================

auto DeviceRegistry::snapshot() const -> std::vector<DeviceRecord> {
    std::vector<DeviceRecord> records;
    records.reserve(impl_->cameras.size() + impl_->lights.size());
    for (const auto& [id, slot] : impl_->cameras) {
        std::lock_guard lock(slot->stateMutex);
        records.push_back(slot->record);
    }
    for (const auto& port : impl_->lightOrder) {
        const auto& slot = *impl_->lights.at(port);
        std::lock_guard lock(slot.stateMutex);
        records.push_back(slot.record);
    }
    return records;
}

auto DeviceRegistry::options() const -> const RegistryOptions& {
    return impl_->options;
}

}  // namespace lumen::device
