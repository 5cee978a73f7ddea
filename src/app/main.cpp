/*
 * main.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: lumen executable. Loads configuration, wires the capture core
and keeps the preview loop running until SIGINT/SIGTERM. With --capture or
--sequence it performs that job and exits.

**************************************************/

#include <array>
#include <atomic>
#include <charconv>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/system/env.hpp"
#include "atom/utils/argsview.hpp"

#include "capture/capture_engine.hpp"
#include "common/exceptions.hpp"
#include "config/runtime_config.hpp"
#include "device/device_registry.hpp"
#include "device/mock/simulated_camera.hpp"
#include "device/resource_arbiter.hpp"
#include "device/serial_light.hpp"
#include "logging/logging_manager.hpp"
#include "server/vision_service.hpp"
#include "settings/settings_store.hpp"
#include "stream/streaming_feed.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_shutdown{false};

void handleSignal(int /*signal*/) { g_shutdown = true; }

auto buildCameras(const lumen::config::DeviceSection& device)
    -> std::vector<std::shared_ptr<lumen::device::CameraAdapter>> {
    std::vector<std::shared_ptr<lumen::device::CameraAdapter>> cameras;
    if (device.cameraBackend == "simulated") {
        for (int id : device.cameraIds) {
            cameras.push_back(
                std::make_shared<lumen::device::SimulatedCamera>(id));
        }
    }
    // "none": every target serves fallback frames
    return cameras;
}

auto buildLights(const lumen::config::DeviceSection& device)
    -> std::vector<std::shared_ptr<lumen::device::LightAdapter>> {
    std::vector<std::shared_ptr<lumen::device::LightAdapter>> lights;
    for (const auto& port : device.lightPorts) {
        lights.push_back(
            std::make_shared<lumen::device::SerialLight>(port, device.baudRate));
    }
    return lights;
}

/**
 * @brief Parse "start:end:step" into a sequence request body
 */
auto parseSequenceArg(const std::string& value) -> std::optional<nlohmann::json> {
    std::array<int, 3> parts{};
    size_t begin = 0;
    for (int i = 0; i < 3; ++i) {
        size_t end = (i < 2) ? value.find(':', begin) : value.size();
        if (end == std::string::npos) {
            return std::nullopt;
        }
        auto [ptr, ec] = std::from_chars(value.data() + begin,
                                         value.data() + end, parts[i]);
        if (ec != std::errc() || ptr != value.data() + end) {
            return std::nullopt;
        }
        begin = end + 1;
    }
    return nlohmann::json{
        {"start", parts[0]}, {"end", parts[1]}, {"step", parts[2]}};
}

auto runSequence(lumen::server::VisionService& service,
                 lumen::capture::CaptureEngine& engine, const std::string& arg)
    -> int {
    auto body = parseSequenceArg(arg);
    if (!body) {
        spdlog::error("Sequence must be given as start:end:step, got '{}'",
                      arg);
        return 1;
    }
    auto response = service.postSequence(*body);
    if (!response.ok()) {
        spdlog::error("Sequence rejected: {}", response.body.dump());
        return 1;
    }
    while (!g_shutdown &&
           !engine.waitForSequence(std::chrono::milliseconds(200))) {
    }
    if (g_shutdown) {
        engine.cancelSequence();
        engine.waitForSequence(std::chrono::seconds(10));
    }
    auto status = service.getSequence();
    auto state = status.body["data"]["state"].get<std::string>();
    spdlog::info("Sequence finished: {}", state);
    return state == "completed" ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Step 1: Console logging until the configuration is known
    auto& logging = lumen::logging::LoggingManager::getInstance();
    logging.initialize(lumen::logging::LoggingConfig{});

    // Step 2: Parse command line arguments
    atom::utils::ArgumentParser program("lumen"s);
    // Flags win over environment, environment wins over the config file
    program.addArgument("config", atom::utils::ArgumentParser::ArgType::STRING,
                        false, "config/lumen.json"s,
                        "Path to the config file", {"c"});
    program.addArgument("save-path",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Directory captured images are written to",
                        {"s"});
    program.addArgument("camera-backend",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Camera backend (simulated/none)", {"b"});
    program.addArgument("fps", atom::utils::ArgumentParser::ArgType::INTEGER,
                        false, 0, "Preview rate in frames per second", {"f"});
    program.addArgument("log-level",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Log level (trace/debug/info/warn/error)", {"l"});
    program.addArgument("capture", atom::utils::ArgumentParser::ArgType::BOOLEAN,
                        false, false, "Take one capture and exit", {"o"});
    program.addArgument("sequence",
                        atom::utils::ArgumentParser::ArgType::STRING, false,
                        ""s, "Run a sweep start:end:step and exit", {"q"});
    program.addDescription("Lumen capture orchestrator:");
    program.addEpilog("Exit codes: 0 ok, 1 bad configuration, 2 capture failed.");

    std::vector<std::string> args(argv, argv + argc);
    program.parse(argc, args);

    // Step 3: Configuration file, then environment, then CLI
    lumen::config::RuntimeConfig config;
    try {
        fs::path configPath =
            program.get<std::string>("config").value_or("config/lumen.json"s);
        if (fs::exists(configPath)) {
            config = lumen::config::RuntimeConfig::loadFromFile(
                configPath.string());
        } else {
            spdlog::warn("No configuration file at {}, using defaults",
                         configPath.string());
        }

        atom::utils::Env env;
        config.applyEnvironment(
            [&env](const std::string& key) { return env.getEnv(key); });
    } catch (const lumen::ConfigException& e) {
        spdlog::error("Configuration error: {}", e.what());
        return 1;
    }

    if (auto v = program.get<std::string>("save-path"); v && !v->empty()) {
        spdlog::debug("CLI override: save path = {}", *v);
        config.capture.savePath = *v;
    }
    if (auto v = program.get<std::string>("camera-backend"); v && !v->empty()) {
        spdlog::debug("CLI override: camera backend = {}", *v);
        config.device.cameraBackend = *v;
    }
    if (auto v = program.get<int>("fps"); v && *v > 0) {
        spdlog::debug("CLI override: fps = {}", *v);
        config.stream.fps = *v;
    }
    if (auto v = program.get<std::string>("log-level"); v && !v->empty()) {
        config.logging.level = lumen::logging::levelFromString(*v);
    }

    if (auto valid = config.validate(); !valid) {
        spdlog::error("Invalid configuration: {}", valid.error().message);
        return 1;
    }

    // Step 4: Logging as configured
    logging.initialize(config.logging);

    // Step 5: Wire the core
    lumen::device::DeviceRegistry registry(
        config.device.cameraIds, buildCameras(config.device),
        buildLights(config.device),
        lumen::device::RegistryOptions::fromConfig(config.device));
    registry.initialize();

    lumen::device::ResourceArbiter arbiter;
    lumen::settings::SettingsStore settings(
        lumen::settings::Settings::fromConfig(config.capture));
    lumen::capture::CaptureEngine engine(
        registry, arbiter, settings,
        lumen::capture::CaptureEngineOptions::fromConfig(config.capture));
    lumen::stream::StreamingFeed feed(
        registry, arbiter,
        lumen::stream::StreamingOptions::fromConfig(config.stream));
    lumen::server::VisionService service(registry, settings, engine, feed);

    // Restore the stored light level on the controllers
    if (auto restored = service.postLight({{"value", settings.get().brightness}});
        !restored.ok()) {
        spdlog::warn("Startup brightness not applied: {}",
                     restored.body["error"]["message"].get<std::string>());
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    int exitCode = 0;
    auto oneShotSequence = program.get<std::string>("sequence");
    if (program.get<bool>("capture").value_or(false)) {
        auto response = service.postCapture();
        spdlog::info("Capture finished: {}", response.body.dump());
        exitCode = response.ok() ? 0 : 2;
    } else if (oneShotSequence && !oneShotSequence->empty()) {
        exitCode = runSequence(service, engine, *oneShotSequence);
    } else {
        feed.start();
        spdlog::info("Lumen ready: {} cameras, {} light ports, saving to {}",
                     registry.listTargets().size(),
                     registry.listLightPorts().size(), config.capture.savePath);
        while (!g_shutdown) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        spdlog::info("Shutdown requested");
        if (engine.cancelSequence()) {
            engine.waitForSequence(std::chrono::seconds(10));
        }
        feed.stop();
    }

    registry.shutdown();
    logging.shutdown();
    return exitCode;
}
