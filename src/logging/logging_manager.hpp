/*
 * logging_manager.hpp
 *
 * Copyright (C) 2026 Lumen contributors
 */

/*************************************************

Date: 2026-10

Description: Process-wide owner of the spdlog sinks and default logger

**************************************************/

#ifndef LUMEN_LOGGING_LOGGING_MANAGER_HPP
#define LUMEN_LOGGING_LOGGING_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "sinks/recent_log_sink.hpp"
#include "types.hpp"

namespace lumen::logging {

/**
 * @brief Installs the configured sinks behind spdlog's default logger
 *
 * Components keep calling spdlog::info/warn/error directly; this class only
 * decides where those records go. A RecentLogSink is always attached so the
 * status report can list recent warnings.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    /**
     * @brief Install sinks for the given configuration
     *
     * Calling it again replaces every sink and named logger. A sink that
     * cannot be created is skipped and reported once the rest are in place.
     */
    void initialize(const LoggingConfig& config);

    /**
     * @brief Flush and detach every sink, leaving a plain console logger
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Named logger writing to the same sinks as the default one
     */
    auto logger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    void setLevel(spdlog::level::level_enum level);

    [[nodiscard]] auto recentRecords(std::size_t limit = 100) const
        -> std::vector<LogRecord>;
    [[nodiscard]] auto recentWarnings(std::size_t limit = 20) const
        -> std::vector<LogRecord>;
    [[nodiscard]] auto warningTotal() const -> std::uint64_t;
    void clearRecent();

    [[nodiscard]] auto config() const -> LoggingConfig;

private:
    LoggingManager() = default;
    ~LoggingManager();

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    void detachLocked();
    auto makeLogger(const std::string& name) const
        -> std::shared_ptr<spdlog::logger>;

    mutable std::mutex mutex_;
    LoggingConfig config_;
    bool initialized_{false};

    std::shared_ptr<RecentLogSink> recent_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> named_;
};

}  // namespace lumen::logging

#endif  // LUMEN_LOGGING_LOGGING_MANAGER_HPP
