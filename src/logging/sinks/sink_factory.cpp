/*
 * sink_factory.cpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace lumen::logging {

namespace {

auto openFileSink(const SinkConfig& config) -> spdlog::sink_ptr {
    std::filesystem::path path(config.path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    if (config.kind == SinkKind::RotatingFile) {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.path, config.maxFileSize, config.maxFiles);
    }
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.path);
}

}  // namespace

auto SinkFactory::console(spdlog::level::level_enum level)
    -> spdlog::sink_ptr {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_level(level);
    return sink;
}

auto SinkFactory::create(const SinkConfig& config) -> Result<spdlog::sink_ptr> {
    spdlog::sink_ptr sink;
    if (config.kind == SinkKind::Console) {
        sink = console(config.level);
    } else {
        if (config.path.empty()) {
            return failure<spdlog::sink_ptr>(
                ErrorCode::ValidationError,
                "Sink '" + config.name + "' has no file path");
        }
        try {
            sink = openFileSink(config);
        } catch (const spdlog::spdlog_ex& e) {
            return failure<spdlog::sink_ptr>(
                Error(ErrorCode::InternalError, e.what(), config.path));
        } catch (const std::filesystem::filesystem_error& e) {
            return failure<spdlog::sink_ptr>(
                Error(ErrorCode::InternalError, e.what(), config.path));
        }
        sink->set_level(config.level);
    }
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

}  // namespace lumen::logging
