/*
 * types.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "types.hpp"

#include <array>
#include <format>
#include <utility>

namespace lumen::logging {

namespace {

constexpr std::array<std::pair<const char*, spdlog::level::level_enum>, 9>
    kLevelNames{{{"trace", spdlog::level::trace},
                 {"debug", spdlog::level::debug},
                 {"info", spdlog::level::info},
                 {"warn", spdlog::level::warn},
                 {"warning", spdlog::level::warn},
                 {"error", spdlog::level::err},
                 {"err", spdlog::level::err},
                 {"critical", spdlog::level::critical},
                 {"off", spdlog::level::off}}};

}  // namespace

auto LogRecord::toJson() const -> nlohmann::json {
    auto ms = std::chrono::floor<std::chrono::milliseconds>(timestamp);
    return {{"time", std::format("{:%FT%TZ}", ms)},
            {"level", levelToString(level)},
            {"source", source},
            {"message", text}};
}

auto sinkKindToString(SinkKind kind) -> std::string {
    switch (kind) {
        case SinkKind::Console:
            return "console";
        case SinkKind::File:
            return "file";
        case SinkKind::RotatingFile:
            return "rotating_file";
    }
    return "console";
}

auto sinkKindFromString(const std::string& text) -> std::optional<SinkKind> {
    if (text == "console" || text == "stdout") {
        return SinkKind::Console;
    }
    if (text == "file") {
        return SinkKind::File;
    }
    if (text == "rotating_file") {
        return SinkKind::RotatingFile;
    }
    return std::nullopt;
}

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", sinkKindToString(kind)},
                        {"level", levelToString(level)}};
    if (kind != SinkKind::Console) {
        j["path"] = path;
    }
    return j;
}

auto LoggingConfig::filePath() const -> std::string {
    return directory + "/" + baseName + ".log";
}

auto LoggingConfig::sinks() const -> std::vector<SinkConfig> {
    std::vector<SinkConfig> result;
    if (console) {
        SinkConfig sink;
        sink.name = "console";
        sink.kind = SinkKind::Console;
        sink.level = consoleLevel;
        result.push_back(std::move(sink));
    }
    if (file) {
        SinkConfig sink;
        sink.name = "file";
        sink.kind = SinkKind::RotatingFile;
        sink.path = filePath();
        sink.maxFileSize = maxFileSize;
        sink.maxFiles = maxFiles;
        result.push_back(std::move(sink));
    }
    return result;
}

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {{"level", levelToString(level)},
            {"pattern", pattern},
            {"recent_capacity", recentCapacity},
            {"enable_console", console},
            {"console_level", levelToString(consoleLevel)},
            {"enable_file", file},
            {"log_dir", directory},
            {"log_filename", baseName},
            {"max_file_size", maxFileSize},
            {"max_files", maxFiles}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.level = levelFromString(j.value("level", "info"));
    config.pattern = j.value("pattern", config.pattern);
    config.recentCapacity = j.value("recent_capacity", config.recentCapacity);
    config.console = j.value("enable_console", config.console);
    config.consoleLevel = levelFromString(j.value("console_level", "info"));
    config.file = j.value("enable_file", config.file);
    config.directory = j.value("log_dir", config.directory);
    config.baseName = j.value("log_filename", config.baseName);
    config.maxFileSize = j.value("max_file_size", config.maxFileSize);
    config.maxFiles = j.value("max_files", config.maxFiles);
    return config;
}

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    for (const auto& [name, value] : kLevelNames) {
        if (level == name) {
            return value;
        }
    }
    return spdlog::level::info;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

}  // namespace lumen::logging
