/*
 * types.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Logging configuration and in-memory record types

**************************************************/

#ifndef LUMEN_LOGGING_TYPES_HPP
#define LUMEN_LOGGING_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lumen::logging {

/**
 * @brief One log line retained for status reporting
 */
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    spdlog::level::level_enum level{spdlog::level::info};
    std::string source;
    std::string text;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

enum class SinkKind { Console, File, RotatingFile };

[[nodiscard]] auto sinkKindToString(SinkKind kind) -> std::string;
[[nodiscard]] auto sinkKindFromString(const std::string& text)
    -> std::optional<SinkKind>;

/**
 * @brief Output sink description
 */
struct SinkConfig {
    std::string name;
    SinkKind kind{SinkKind::Console};
    spdlog::level::level_enum level{spdlog::level::trace};
    std::string pattern;

    // File kinds only
    std::string path;
    std::size_t maxFileSize{5 * 1024 * 1024};
    std::size_t maxFiles{3};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Logging section of the runtime configuration
 *
 * The console and file switches describe the usual deployment; sinks()
 * expands them into concrete SinkConfig entries.
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};
    std::size_t recentCapacity{256};

    bool console{true};
    spdlog::level::level_enum consoleLevel{spdlog::level::info};

    bool file{false};
    std::string directory{"logs"};
    std::string baseName{"lumen"};
    std::size_t maxFileSize{5 * 1024 * 1024};
    std::size_t maxFiles{3};

    [[nodiscard]] auto filePath() const -> std::string;
    [[nodiscard]] auto sinks() const -> std::vector<SinkConfig>;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

/**
 * @brief Parse a level name; unknown names map to info
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

}  // namespace lumen::logging

#endif  // LUMEN_LOGGING_TYPES_HPP
